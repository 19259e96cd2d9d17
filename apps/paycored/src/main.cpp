#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include "paycore/config/config_loader.hpp"
#include "paycore/engine/engine.hpp"
#include "paycore/ingest/csv_reader.hpp"
#include "paycore/ledger/apply_result.hpp"
#include "paycore/replay/replay_driver.hpp"
#include "paycore/report/account_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: type,client,tx,amount rows in the order they must be applied\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./paycore.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./paycore.toml",
      "/etc/paycore/paycore.toml",
      home ? std::filesystem::path{home} / ".config/paycore/paycore.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(const std::filesystem::path& config_path, paycore::config::EngineConfig& cfg) {
  using paycore::config::ConfigLoader;

  if (config_path.empty()) {
    auto result = ConfigLoader::load_from_string(ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return false;
    }
    cfg = std::move(result.config);
    return true;
  }

  std::cerr << "Loading config from: " << config_path << "\n";
  auto result = ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paycore;

  if (argc < 2 || argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  config::EngineConfig cfg;
  if (!load_config(find_config_path(argc, argv), cfg)) {
    return 1;
  }

  engine::Engine::RejectionHandler on_reject;
  if (cfg.diagnostics.log_rejections) {
    on_reject = [](const common::TransactionRecord&, const ledger::ApplyResult& result) {
      std::cerr << "rejected tx=" << result.tx << " client=" << result.client << " code=" << result.reject_code
                << ": " << ledger::describe(result) << "\n";
    };
  }

  engine::Engine payments{{.allow_zero_amounts = cfg.ledger.allow_zero_amounts}, std::move(on_reject)};

  replay::Driver driver;
  driver.configure(argv[1], ingest::CsvReader::Config{
                                .delimiter = cfg.ingest.delimiter.front(),
                                .has_header = cfg.ingest.has_header,
                                .trim_whitespace = cfg.ingest.trim_whitespace,
                            });
  driver.set_record_handler([&payments](const common::TransactionRecord& record) {
    // Rejections are reported through the engine's handler; the stream continues.
    payments.apply(record);
  });
  const bool log_malformed = cfg.diagnostics.log_malformed;
  driver.set_malformed_handler([&payments, log_malformed](const ingest::ParseError& error) {
    payments.record_malformed();
    if (log_malformed) {
      std::cerr << "line " << error.line << ": " << error.message << ". Record will be skipped.\n";
    }
  });

  replay::Driver::Stats replay_stats;
  try {
    replay_stats = driver.execute();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  const auto order = cfg.report.sort_by_client ? ledger::SnapshotOrder::kByClient : ledger::SnapshotOrder::kUnordered;
  const auto accounts = payments.snapshot(order);

  try {
    report::AccountWriter writer{std::cout, {.trim_trailing_zeros = cfg.report.trim_trailing_zeros}};
    writer.write_all(accounts);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  const auto& stats = payments.stats();
  std::cerr << "Processed " << replay_stats.records << " records from " << replay_stats.lines << " lines: "
            << stats.applied << " applied, " << stats.rejected << " rejected, " << stats.malformed
            << " malformed, " << accounts.size() << " accounts\n";
  return 0;
}
