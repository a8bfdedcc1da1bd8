#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <abacus/program/error.hpp>
#include <abacus/protocol/account.hpp>
#include <abacus/protocol/transaction.hpp>
#include <abacus/runtime/bank.hpp>

namespace abacus::client {

protocol::instruction make_initialize_counter_instruction( const protocol::account& program_id,
                                                           const protocol::account& counter,
                                                           const protocol::account& payer,
                                                           std::uint64_t initial_value );

protocol::instruction make_increment_counter_instruction( const protocol::account& program_id,
                                                          const protocol::account& counter,
                                                          std::optional< std::uint64_t > step = {} );

protocol::instruction make_decrement_counter_instruction( const protocol::account& program_id,
                                                          const protocol::account& counter,
                                                          std::optional< std::uint64_t > step = {} );

/*
 * Submits counter instructions to a bank on behalf of a single fee payer, one
 * instruction per transaction.
 */
class counter_client final
{
public:
  counter_client( runtime::bank& bank, const protocol::account& program_id, const protocol::account& payer );
  counter_client( const counter_client& ) = delete;
  counter_client( counter_client&& )      = delete;
  ~counter_client()                       = default;

  counter_client& operator=( const counter_client& ) = delete;
  counter_client& operator=( counter_client&& )      = delete;

  runtime::result< protocol::transaction_receipt > initialize( const protocol::account& counter,
                                                               std::uint64_t initial_value );
  runtime::result< protocol::transaction_receipt > increment( const protocol::account& counter,
                                                              std::optional< std::uint64_t > step = {} );
  runtime::result< protocol::transaction_receipt > decrement( const protocol::account& counter,
                                                              std::optional< std::uint64_t > step = {} );

  // Sends pre-encoded instruction data against the counter account
  runtime::result< protocol::transaction_receipt > submit( const protocol::account& counter,
                                                           std::span< const std::byte > data );

  program::result< std::uint64_t > value( const protocol::account& counter ) const;

private:
  runtime::bank& _bank;
  protocol::account _program_id;
  protocol::account _payer;
};

} // namespace abacus::client
