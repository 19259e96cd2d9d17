#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>

#include "paycore/common/types.hpp"
#include "paycore/ingest/csv_reader.hpp"

namespace paycore {
namespace replay {

// Streams a transaction file through the record handler in file order.
class Driver {
 public:
  using RecordHandler = std::function<void(const common::TransactionRecord&)>;
  using MalformedHandler = std::function<void(const ingest::ParseError&)>;

  struct Stats {
    std::uint64_t lines{0};
    std::uint64_t records{0};
    std::uint64_t malformed{0};
  };

  Driver();

  void configure(std::filesystem::path input_path, ingest::CsvReader::Config reader_config = {});
  void set_record_handler(RecordHandler handler);
  void set_malformed_handler(MalformedHandler handler);
  Stats execute();

 private:
  std::filesystem::path input_path_{};
  ingest::CsvReader::Config reader_config_{};
  RecordHandler record_handler_{};
  MalformedHandler malformed_handler_{};
};

}  // namespace replay
}  // namespace paycore
