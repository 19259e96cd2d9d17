#include "paycore/ingest/csv_reader.hpp"

#include <array>
#include <charconv>
#include <utility>
#include <vector>

namespace paycore {
namespace ingest {

namespace {
constexpr std::size_t kMinColumns = 3;
constexpr std::size_t kMaxColumns = 4;

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split(std::string_view line, char delimiter, bool trim_fields) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(delimiter, start);
    auto field = line.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    fields.push_back(trim_fields ? trim(field) : field);
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return fields;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

char to_lower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

ParseResult failure(std::uint64_t line_number, std::string message) {
  ParseResult result;
  result.success = false;
  result.error = ParseError{.line = line_number, .message = std::move(message)};
  return result;
}

}  // namespace

CsvReader::CsvReader(std::istream& input) : input_(input) {}

CsvReader::CsvReader(std::istream& input, const Config& config) : input_(input), config_(config) {}

bool CsvReader::next(ParseResult& out) {
  while (std::getline(input_, line_)) {
    ++line_number_;
    if (!line_.empty() && line_.back() == '\r') {
      line_.pop_back();
    }
    if (trim(line_).empty()) {
      continue;
    }
    if (header_pending_) {
      header_pending_ = false;
      if (config_.has_header) {
        continue;
      }
    }
    out = parse_line(line_, config_, line_number_);
    return true;
  }
  return false;
}

ParseResult CsvReader::parse_line(std::string_view line, const Config& config, std::uint64_t line_number) {
  const auto fields = split(line, config.delimiter, config.trim_whitespace);
  if (fields.size() < kMinColumns || fields.size() > kMaxColumns) {
    return failure(line_number, "expected 3 or 4 columns, found " + std::to_string(fields.size()));
  }

  const auto kind = parse_kind(fields[0]);
  if (!kind) {
    return failure(line_number, "unknown transaction type '" + std::string(fields[0]) + "'");
  }

  const auto client = parse_unsigned<common::ClientId>(fields[1]);
  if (!client) {
    return failure(line_number, "invalid client id '" + std::string(fields[1]) + "'");
  }

  const auto tx = parse_unsigned<common::TxId>(fields[2]);
  if (!tx) {
    return failure(line_number, "invalid transaction id '" + std::string(fields[2]) + "'");
  }

  ParseResult result;
  result.success = true;
  result.record = common::TransactionRecord{.kind = *kind, .client = *client, .tx = *tx, .amount = std::nullopt};

  // Disputes, resolves and chargebacks reference a deposit; any amount on them is ignored.
  if (fields.size() == kMaxColumns && !fields[3].empty() && common::CarriesAmount(*kind)) {
    const auto amount = common::Amount::parse(fields[3]);
    if (!amount) {
      return failure(line_number, "invalid amount '" + std::string(fields[3]) + "'");
    }
    result.record.amount = amount;
  }
  return result;
}

std::optional<common::TxKind> CsvReader::parse_kind(std::string_view text) {
  static constexpr std::array<common::TxKind, 5> kKinds = {
      common::TxKind::kDeposit,
      common::TxKind::kWithdrawal,
      common::TxKind::kDispute,
      common::TxKind::kResolve,
      common::TxKind::kChargeback,
  };

  for (const auto kind : kKinds) {
    const auto name = common::to_string(kind);
    if (name.size() != text.size()) {
      continue;
    }
    bool match = true;
    for (std::size_t i = 0; i < name.size(); ++i) {
      if (to_lower(text[i]) != name[i]) {
        match = false;
        break;
      }
    }
    if (match) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace ingest
}  // namespace paycore
