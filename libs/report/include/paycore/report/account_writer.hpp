#pragma once

#include <ostream>
#include <span>

#include "paycore/ledger/ledger.hpp"

namespace paycore {
namespace report {

// Renders account snapshots as "client,available,held,total,locked" CSV.
class AccountWriter {
 public:
  struct Config {
    bool trim_trailing_zeros{false};
  };

  explicit AccountWriter(std::ostream& out);
  AccountWriter(std::ostream& out, const Config& config);

  void write_header();
  void write(const ledger::AccountSnapshot& account);
  void write_all(std::span<const ledger::AccountSnapshot> accounts);

 private:
  std::ostream& out_;
  Config config_{};
};

}  // namespace report
}  // namespace paycore
