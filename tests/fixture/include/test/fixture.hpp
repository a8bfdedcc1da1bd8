#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <abacus/client.hpp>
#include <abacus/protocol.hpp>
#include <abacus/runtime.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, std::uint64_t payer_balance = 1'000'000'000 );
  ~fixture() = default;

  template< typename... Args >
  abacus::protocol::transaction make_transaction( const std::vector< abacus::protocol::account >& signers,
                                                  Args... args ) const
  {
    abacus::protocol::transaction t;
    ( ( t.instructions.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.payer   = _payer;
    t.signers = { _payer };
    t.signers.insert( t.signers.end(), signers.begin(), signers.end() );
    return t;
  }

  std::uint64_t lamports( const abacus::protocol::account& key ) const;
  std::vector< std::byte > data( const abacus::protocol::account& key ) const;

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_reversion = 1 << 1
  };

  bool verify( abacus::runtime::result< abacus::protocol::transaction_receipt > receipt, std::uint64_t flags ) const;

  std::unique_ptr< abacus::runtime::bank > _bank;
  abacus::protocol::account _program_id;
  abacus::protocol::account _payer;
  std::unique_ptr< abacus::client::counter_client > _client;
};

} // namespace test
