#include <abacus/client/counter_client.hpp>

#include <utility>

#include <abacus/program/instruction.hpp>

namespace abacus::client {

protocol::instruction make_initialize_counter_instruction( const protocol::account& program_id,
                                                           const protocol::account& counter,
                                                           const protocol::account& payer,
                                                           std::uint64_t initial_value )
{
  protocol::instruction instruction;
  instruction.program_id = program_id;
  instruction.accounts   = { protocol::account_meta::make_writable( counter, true ),
                             protocol::account_meta::make_writable( payer, true ),
                             protocol::account_meta::make_readonly( protocol::system_program_id(), false ) };
  instruction.data       = program::encode( program::initialize_counter{ .initial_value = initial_value } );
  return instruction;
}

protocol::instruction make_increment_counter_instruction( const protocol::account& program_id,
                                                          const protocol::account& counter,
                                                          std::optional< std::uint64_t > step )
{
  protocol::instruction instruction;
  instruction.program_id = program_id;
  instruction.accounts   = { protocol::account_meta::make_writable( counter, false ) };
  instruction.data       = program::encode( program::increment_counter{ .step = step } );
  return instruction;
}

protocol::instruction make_decrement_counter_instruction( const protocol::account& program_id,
                                                          const protocol::account& counter,
                                                          std::optional< std::uint64_t > step )
{
  protocol::instruction instruction;
  instruction.program_id = program_id;
  instruction.accounts   = { protocol::account_meta::make_writable( counter, false ) };
  instruction.data       = program::encode( program::decrement_counter{ .step = step } );
  return instruction;
}

counter_client::counter_client( runtime::bank& bank,
                                const protocol::account& program_id,
                                const protocol::account& payer ):
    _bank( bank ),
    _program_id( program_id ),
    _payer( payer )
{}

runtime::result< protocol::transaction_receipt > counter_client::initialize( const protocol::account& counter,
                                                                             std::uint64_t initial_value )
{
  protocol::transaction transaction;
  transaction.payer   = _payer;
  transaction.signers = { _payer, counter };
  transaction.instructions.emplace_back(
    make_initialize_counter_instruction( _program_id, counter, _payer, initial_value ) );
  return _bank.process( transaction );
}

runtime::result< protocol::transaction_receipt > counter_client::increment( const protocol::account& counter,
                                                                            std::optional< std::uint64_t > step )
{
  protocol::transaction transaction;
  transaction.payer   = _payer;
  transaction.signers = { _payer };
  transaction.instructions.emplace_back( make_increment_counter_instruction( _program_id, counter, step ) );
  return _bank.process( transaction );
}

runtime::result< protocol::transaction_receipt > counter_client::decrement( const protocol::account& counter,
                                                                            std::optional< std::uint64_t > step )
{
  protocol::transaction transaction;
  transaction.payer   = _payer;
  transaction.signers = { _payer };
  transaction.instructions.emplace_back( make_decrement_counter_instruction( _program_id, counter, step ) );
  return _bank.process( transaction );
}

runtime::result< protocol::transaction_receipt > counter_client::submit( const protocol::account& counter,
                                                                         std::span< const std::byte > data )
{
  protocol::instruction instruction;
  instruction.program_id = _program_id;
  instruction.accounts   = { protocol::account_meta::make_writable( counter, false ) };
  instruction.data.assign( data.begin(), data.end() );

  protocol::transaction transaction;
  transaction.payer   = _payer;
  transaction.signers = { _payer };
  transaction.instructions.emplace_back( std::move( instruction ) );
  return _bank.process( transaction );
}

program::result< std::uint64_t > counter_client::value( const protocol::account& counter ) const
{
  auto account = _bank.get_account( counter );
  if( !account || account->data.empty() )
    return std::unexpected( program::program_errc::uninitialized_account );

  if( account->owner != _program_id )
    return std::unexpected( program::program_errc::incorrect_program_id );

  auto state = program::decode_account( account->data );
  if( !state )
    return std::unexpected( state.error() );

  return state->count;
}

} // namespace abacus::client
