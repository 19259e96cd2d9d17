#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace paycore {
namespace config {

struct IngestConfig {
  std::string delimiter{","};
  bool has_header{true};
  bool trim_whitespace{true};
};

struct LedgerConfig {
  bool allow_zero_amounts{true};
};

struct ReportConfig {
  bool sort_by_client{true};
  bool trim_trailing_zeros{false};
};

struct DiagnosticsConfig {
  bool log_rejections{true};
  bool log_malformed{true};
};

struct EngineConfig {
  IngestConfig ingest;
  LedgerConfig ledger;
  ReportConfig report;
  DiagnosticsConfig diagnostics;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace paycore
