#pragma once

#include <cstddef>
#include <span>
#include <system_error>

#include <abacus/program/system_interface.hpp>
#include <abacus/protocol/account.hpp>

namespace abacus::program {

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system,
                               const protocol::account& program_id,
                               std::span< protocol::account_info > accounts,
                               std::span< const std::byte > instruction_data ) = 0;
};

} // namespace abacus::program
