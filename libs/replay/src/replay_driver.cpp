#include "paycore/replay/replay_driver.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace paycore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path input_path, ingest::CsvReader::Config reader_config) {
  input_path_ = std::move(input_path);
  reader_config_ = reader_config;
}

void Driver::set_record_handler(RecordHandler handler) {
  record_handler_ = std::move(handler);
}

void Driver::set_malformed_handler(MalformedHandler handler) {
  malformed_handler_ = std::move(handler);
}

Driver::Stats Driver::execute() {
  if (!record_handler_) {
    throw std::runtime_error("record handler not set for replay");
  }

  std::ifstream in(input_path_);
  if (!in) {
    throw std::runtime_error("failed to open transaction file for read: " + input_path_.string());
  }

  Stats stats;
  ingest::CsvReader reader(in, reader_config_);
  ingest::ParseResult parsed;
  while (reader.next(parsed)) {
    if (parsed.success) {
      ++stats.records;
      record_handler_(parsed.record);
      continue;
    }
    ++stats.malformed;
    if (malformed_handler_) {
      malformed_handler_(parsed.error);
    }
  }

  if (in.bad()) {
    throw std::runtime_error("failed while reading transaction file: " + input_path_.string());
  }

  stats.lines = reader.line_number();
  return stats;
}

}  // namespace replay
}  // namespace paycore
