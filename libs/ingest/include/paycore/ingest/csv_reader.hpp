#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "paycore/common/types.hpp"

namespace paycore {
namespace ingest {

struct ParseError {
  std::uint64_t line{0};
  std::string message;
};

struct ParseResult {
  bool success{false};
  common::TransactionRecord record{};
  ParseError error{};
};

// Reads "type,client,tx,amount" rows. The amount column may be omitted.
// The delimiter is configurable; fields are never quoted.
class CsvReader {
 public:
  struct Config {
    char delimiter{','};
    bool has_header{true};
    bool trim_whitespace{true};
  };

  explicit CsvReader(std::istream& input);
  CsvReader(std::istream& input, const Config& config);

  // Returns false at end of input. A malformed line yields success == false
  // in `out`; reading can continue with the next call.
  bool next(ParseResult& out);

  [[nodiscard]] std::uint64_t line_number() const noexcept { return line_number_; }

  [[nodiscard]] static ParseResult parse_line(std::string_view line, const Config& config,
                                              std::uint64_t line_number = 0);
  [[nodiscard]] static std::optional<common::TxKind> parse_kind(std::string_view text);

 private:
  std::istream& input_;
  Config config_{};
  std::uint64_t line_number_{0};
  bool header_pending_{true};
  std::string line_{};
};

}  // namespace ingest
}  // namespace paycore
