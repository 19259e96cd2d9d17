#include "paycore/report/account_writer.hpp"

#include <stdexcept>

namespace paycore {
namespace report {

AccountWriter::AccountWriter(std::ostream& out) : out_(out) {}

AccountWriter::AccountWriter(std::ostream& out, const Config& config) : out_(out), config_(config) {}

void AccountWriter::write_header() {
  out_ << "client,available,held,total,locked\n";
}

void AccountWriter::write(const ledger::AccountSnapshot& account) {
  out_ << account.client << ','
       << account.available.to_string(config_.trim_trailing_zeros) << ','
       << account.held.to_string(config_.trim_trailing_zeros) << ','
       << account.total.to_string(config_.trim_trailing_zeros) << ','
       << (account.locked ? "true" : "false") << '\n';
}

void AccountWriter::write_all(std::span<const ledger::AccountSnapshot> accounts) {
  write_header();
  for (const auto& account : accounts) {
    write(account);
  }
  out_.flush();
  if (!out_) {
    throw std::runtime_error("failed to write account report");
  }
}

}  // namespace report
}  // namespace paycore
