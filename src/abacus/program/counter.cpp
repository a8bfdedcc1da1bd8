#include <abacus/program/counter.hpp>

#include <format>
#include <limits>

namespace abacus::program {

std::error_code counter::run( system_interface* system,
                              const protocol::account& program_id,
                              std::span< protocol::account_info > accounts,
                              std::span< const std::byte > instruction_data )
{
  auto instruction = decode_instruction( instruction_data );
  if( !instruction )
    return instruction.error();

  if( std::holds_alternative< initialize_counter >( *instruction ) )
    return apply( system, program_id, accounts, std::get< initialize_counter >( *instruction ) );
  else if( std::holds_alternative< increment_counter >( *instruction ) )
    return apply( system, program_id, accounts, std::get< increment_counter >( *instruction ) );
  else if( std::holds_alternative< decrement_counter >( *instruction ) )
    return apply( system, program_id, accounts, std::get< decrement_counter >( *instruction ) );

  return program_errc::invalid_instruction_data;
}

result< counter_account > counter::load( const protocol::account& program_id, const protocol::account_info& account )
{
  if( account.owner != program_id )
    return std::unexpected( program_errc::incorrect_program_id );

  if( account.data.empty() )
    return std::unexpected( program_errc::uninitialized_account );

  return decode_account( account.data );
}

std::error_code counter::apply( system_interface* system,
                                const protocol::account& program_id,
                                std::span< protocol::account_info > accounts,
                                const initialize_counter& instruction )
{
  system->log( std::format( "Initializing counter with value: {}", instruction.initial_value ) );

  if( accounts.size() < 3 )
    return program_errc::not_enough_account_keys;

  auto& counter_account_info = accounts[ 0 ];
  auto& payer                = accounts[ 1 ];
  const auto& system_program = accounts[ 2 ];

  if( !counter_account_info.data.empty() )
    return program_errc::account_already_initialized;

  auto lamports = system->minimum_balance( counter_account::size );

  if( auto error = system->create_account( payer,
                                           counter_account_info,
                                           system_program,
                                           lamports,
                                           counter_account::size,
                                           program_id );
      error )
    return error;

  if( auto error = encode( counter_account{ .count = instruction.initial_value }, counter_account_info.data ); error )
    return error;

  system->log( std::format( "Counter initialized successfully with value: {}", instruction.initial_value ) );
  return program_errc::ok;
}

std::error_code counter::apply( system_interface* system,
                                const protocol::account& program_id,
                                std::span< protocol::account_info > accounts,
                                const increment_counter& instruction )
{
  auto step = instruction.step.value_or( default_step );
  system->log( std::format( "Incrementing counter by: {}", step ) );

  if( accounts.empty() )
    return program_errc::not_enough_account_keys;

  auto& counter_account_info = accounts[ 0 ];

  auto state = load( program_id, counter_account_info );
  if( !state )
    return state.error();

  if( std::numeric_limits< std::uint64_t >::max() - step < state->count )
    return program_errc::invalid_account_data;

  state->count += step;

  if( auto error = encode( *state, counter_account_info.data ); error )
    return error;

  system->log( std::format( "Counter incremented to: {}", state->count ) );
  return program_errc::ok;
}

std::error_code counter::apply( system_interface* system,
                                const protocol::account& program_id,
                                std::span< protocol::account_info > accounts,
                                const decrement_counter& instruction )
{
  auto step = instruction.step.value_or( default_step );
  system->log( std::format( "Decrementing counter by: {}", step ) );

  if( accounts.empty() )
    return program_errc::not_enough_account_keys;

  auto& counter_account_info = accounts[ 0 ];

  auto state = load( program_id, counter_account_info );
  if( !state )
    return state.error();

  if( step > state->count )
    return program_errc::invalid_account_data;

  state->count -= step;

  if( auto error = encode( *state, counter_account_info.data ); error )
    return error;

  system->log( std::format( "Counter decremented to: {}", state->count ) );
  return program_errc::ok;
}

} // namespace abacus::program
