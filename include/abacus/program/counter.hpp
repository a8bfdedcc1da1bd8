#pragma once

#include <cstdint>
#include <optional>

#include <abacus/program/error.hpp>
#include <abacus/program/instruction.hpp>
#include <abacus/program/program.hpp>

namespace abacus::program {

/*
 * A single unsigned 64-bit counter stored in an account owned by this program.
 *
 * Accounts, by instruction:
 *   initialize_counter: [writable, signer] counter, [writable, signer] payer, [] system program
 *   increment_counter:  [writable] counter
 *   decrement_counter:  [writable] counter
 */
struct counter final: public program
{
  counter()                 = default;
  counter( const counter& ) = delete;
  counter( counter&& )      = delete;
  ~counter() override       = default;

  counter& operator=( const counter& ) = delete;
  counter& operator=( counter&& )      = delete;

  std::error_code run( system_interface* system,
                       const protocol::account& program_id,
                       std::span< protocol::account_info > accounts,
                       std::span< const std::byte > instruction_data ) override;

private:
  std::error_code apply( system_interface* system,
                         const protocol::account& program_id,
                         std::span< protocol::account_info > accounts,
                         const initialize_counter& instruction );
  std::error_code apply( system_interface* system,
                         const protocol::account& program_id,
                         std::span< protocol::account_info > accounts,
                         const increment_counter& instruction );
  std::error_code apply( system_interface* system,
                         const protocol::account& program_id,
                         std::span< protocol::account_info > accounts,
                         const decrement_counter& instruction );

  result< counter_account > load( const protocol::account& program_id, const protocol::account_info& account );
};

} // namespace abacus::program
