#include "paycore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace paycore {
namespace config {

namespace {

// Reads an optional key; a present key of the wrong type is reported rather
// than silently replaced by the default.
bool get_bool_or(const toml::table& tbl, std::string_view section, std::string_view key, bool default_val,
                 std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return default_val;
  }
  if (auto val = node.value<bool>()) {
    return *val;
  }
  errors.push_back({std::string(section) + "." + std::string(key), "must be a boolean"});
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view section, std::string_view key,
                       std::string_view default_val, std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return std::string(default_val);
  }
  if (auto val = node.value<std::string_view>()) {
    return std::string(*val);
  }
  errors.push_back({std::string(section) + "." + std::string(key), "must be a string"});
  return std::string(default_val);
}

IngestConfig parse_ingest(const toml::table& root, std::vector<ValidationError>& errors) {
  IngestConfig cfg;
  if (auto* ingest = root["ingest"].as_table()) {
    cfg.delimiter = get_str_or(*ingest, "ingest", "delimiter", cfg.delimiter, errors);
    cfg.has_header = get_bool_or(*ingest, "ingest", "has_header", cfg.has_header, errors);
    cfg.trim_whitespace = get_bool_or(*ingest, "ingest", "trim_whitespace", cfg.trim_whitespace, errors);
  }
  return cfg;
}

LedgerConfig parse_ledger(const toml::table& root, std::vector<ValidationError>& errors) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.allow_zero_amounts = get_bool_or(*ledger, "ledger", "allow_zero_amounts", cfg.allow_zero_amounts, errors);
  }
  return cfg;
}

ReportConfig parse_report(const toml::table& root, std::vector<ValidationError>& errors) {
  ReportConfig cfg;
  if (auto* report = root["report"].as_table()) {
    cfg.sort_by_client = get_bool_or(*report, "report", "sort_by_client", cfg.sort_by_client, errors);
    cfg.trim_trailing_zeros =
        get_bool_or(*report, "report", "trim_trailing_zeros", cfg.trim_trailing_zeros, errors);
  }
  return cfg;
}

DiagnosticsConfig parse_diagnostics(const toml::table& root, std::vector<ValidationError>& errors) {
  DiagnosticsConfig cfg;
  if (auto* diagnostics = root["diagnostics"].as_table()) {
    cfg.log_rejections = get_bool_or(*diagnostics, "diagnostics", "log_rejections", cfg.log_rejections, errors);
    cfg.log_malformed = get_bool_or(*diagnostics, "diagnostics", "log_malformed", cfg.log_malformed, errors);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  EngineConfig cfg;
  cfg.ingest = parse_ingest(root, errors);
  cfg.ledger = parse_ledger(root, errors);
  cfg.report = parse_report(root, errors);
  cfg.diagnostics = parse_diagnostics(root, errors);
  return cfg;
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  result.config = parse_config(root, result.errors);
  auto semantic = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), semantic.begin(), semantic.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  const auto& delimiter = config.ingest.delimiter;
  if (delimiter.size() != 1) {
    errors.push_back({"ingest.delimiter", "must be exactly one character"});
  } else {
    const char c = delimiter.front();
    const bool alphanumeric = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    if (alphanumeric || c == '.' || c == '+' || c == '-') {
      errors.push_back({"ingest.delimiter", "cannot be a character that appears in ids or amounts"});
    }
    if (config.ingest.trim_whitespace && (c == ' ' || c == '\t')) {
      errors.push_back({"ingest.delimiter", "cannot be whitespace while trim_whitespace is enabled"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# paycore configuration
# Generated default configuration

[ingest]
delimiter = ","
has_header = true
trim_whitespace = true

[ledger]
allow_zero_amounts = true

[report]
sort_by_client = true
trim_trailing_zeros = false  # true renders 1.5 instead of 1.5000

[diagnostics]
log_rejections = true
log_malformed = true
)";
}

}  // namespace config
}  // namespace paycore
