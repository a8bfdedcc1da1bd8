#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <abacus/protocol/account.hpp>

namespace abacus::protocol {

struct instruction
{
  account program_id{};
  std::vector< account_meta > accounts;
  std::vector< std::byte > data;
};

struct transaction
{
  account payer{};
  std::vector< account > signers;
  std::vector< instruction > instructions;

  bool signed_by( const account& key ) const noexcept;
};

struct transaction_receipt
{
  bool reverted = false;
  std::error_code error;
  std::optional< std::size_t > failed_instruction;
  std::uint64_t fee = 0;
  std::vector< std::string > logs;
};

} // namespace abacus::protocol
