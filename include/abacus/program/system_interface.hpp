#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

#include <abacus/protocol/account.hpp>

namespace abacus::program {

/*
 * Services a program may request from its host while it runs. The host owns
 * the account store; a program only ever sees the account_info snapshots it
 * was invoked with.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual void log( std::string_view message ) = 0;

  // Lamports an account holding data_length bytes needs to be exempt from rent
  virtual std::uint64_t minimum_balance( std::size_t data_length ) = 0;

  // Asks the system program to fund, allocate and assign new_account
  virtual std::error_code create_account( protocol::account_info& payer,
                                          protocol::account_info& new_account,
                                          const protocol::account_info& system_program,
                                          std::uint64_t lamports,
                                          std::uint64_t space,
                                          const protocol::account& owner ) = 0;
};

} // namespace abacus::program
