#include <abacus/runtime/bank.hpp>

#include <algorithm>
#include <format>
#include <limits>
#include <set>
#include <span>
#include <stdexcept>
#include <utility>

#include <abacus/log.hpp>

namespace abacus::runtime {

namespace {

std::error_code sum_lamports( std::span< const protocol::account_info > accounts, std::uint64_t& total ) noexcept
{
  total = 0;
  for( const auto& account: accounts )
  {
    if( std::numeric_limits< std::uint64_t >::max() - account.lamports < total )
      return runtime_errc::unbalanced_instruction;

    total += account.lamports;
  }

  return runtime_errc::ok;
}

/*
 * Host side of a single program invocation. Keeps the account state as it was
 * handed to the program so that every change can be checked against what the
 * executing program is allowed to do.
 */
class invocation_context final: public program::system_interface
{
public:
  invocation_context( const bank_options& options,
                      const protocol::account& program_id,
                      std::span< protocol::account_info > accounts,
                      std::vector< std::string >& logs ):
      _options( options ),
      _program_id( program_id ),
      _accounts( accounts ),
      _baseline( accounts.begin(), accounts.end() ),
      _logs( logs )
  {}

  void log( std::string_view message ) override
  {
    push_log( std::format( "Program log: {}", message ) );
  }

  std::uint64_t minimum_balance( std::size_t data_length ) override
  {
    return _options.rent_schedule.minimum_balance( data_length );
  }

  std::error_code create_account( protocol::account_info& payer,
                                  protocol::account_info& new_account,
                                  const protocol::account_info& system_program,
                                  std::uint64_t lamports,
                                  std::uint64_t space,
                                  const protocol::account& owner ) override
  {
    if( system_program.key != protocol::system_program_id() || !system_program.executable )
      return runtime_errc::unknown_program;

    // Changes made by the caller so far must stand on their own
    if( auto error = verify(); error )
      return error;

    auto system_program_name = protocol::to_string( system_program.key );
    push_log( std::format( "Program {} invoke [2]", system_program_name ) );

    auto error = [ & ]() -> std::error_code
    {
      if( !payer.signer || !new_account.signer )
        return runtime_errc::missing_required_signature;

      if( !payer.writable || !new_account.writable )
        return runtime_errc::readonly_account_modified;

      if( new_account.lamports || !new_account.data.empty()
          || new_account.owner != protocol::system_program_id() )
        return runtime_errc::account_already_in_use;

      if( space > max_permitted_data_length )
        return runtime_errc::invalid_account_data_length;

      if( payer.lamports < lamports )
        return runtime_errc::insufficient_funds;

      payer.lamports       -= lamports;
      new_account.lamports  = lamports;
      new_account.data.assign( static_cast< std::size_t >( space ), std::byte{ 0x00 } );
      new_account.owner = owner;

      return runtime_errc::ok;
    }();

    if( error )
    {
      push_log( std::format( "Program {} failed: {}", system_program_name, error.message() ) );
      return error;
    }

    push_log( std::format( "Program {} success", system_program_name ) );
    _baseline.assign( _accounts.begin(), _accounts.end() );
    return runtime_errc::ok;
  }

  std::error_code verify() const noexcept
  {
    for( std::size_t i = 0; i < _accounts.size(); ++i )
    {
      const auto& pre  = _baseline[ i ];
      const auto& post = _accounts[ i ];

      if( post.owner != pre.owner )
      {
        if( pre.owner != _program_id || !pre.writable || !pre.data.empty() )
          return runtime_errc::modified_program_id;
      }

      if( post.data != pre.data )
      {
        if( !pre.writable )
          return runtime_errc::readonly_account_modified;

        if( pre.owner != _program_id )
          return runtime_errc::external_account_data_modified;
      }

      if( post.lamports != pre.lamports )
      {
        if( !pre.writable )
          return runtime_errc::readonly_account_modified;

        if( post.lamports < pre.lamports && pre.owner != _program_id )
          return runtime_errc::external_account_data_modified;
      }
    }

    std::uint64_t pre_total  = 0;
    std::uint64_t post_total = 0;

    if( auto error = sum_lamports( _baseline, pre_total ); error )
      return error;

    if( auto error = sum_lamports( _accounts, post_total ); error )
      return error;

    if( pre_total != post_total )
      return runtime_errc::unbalanced_instruction;

    return runtime_errc::ok;
  }

  const std::vector< protocol::account_info >& baseline() const noexcept
  {
    return _baseline;
  }

  void push_log( std::string message )
  {
    LOG_DEBUG( abacus::log::instance(), "{}", message );
    _logs.emplace_back( std::move( message ) );
  }

private:
  const bank_options& _options;
  const protocol::account& _program_id;
  std::span< protocol::account_info > _accounts;
  std::vector< protocol::account_info > _baseline;
  std::vector< std::string >& _logs;
};

} // namespace

bank::bank( bank_options options ):
    _options( std::move( options ) )
{
  _accounts[ protocol::system_program_id() ] = protocol::account_info{ .key        = protocol::system_program_id(),
                                                                       .owner      = protocol::native_loader_id(),
                                                                       .lamports   = 1,
                                                                       .executable = true };
}

void bank::register_program( const protocol::account& id, std::unique_ptr< program::program > program )
{
  if( !program )
    throw std::invalid_argument( "cannot register a null program" );

  if( id == protocol::system_program_id() )
    throw std::invalid_argument( "the system program address is reserved" );

  _accounts[ id ] = protocol::account_info{ .key        = id,
                                            .owner      = protocol::native_loader_id(),
                                            .lamports   = 1,
                                            .executable = true };
  _programs[ id ] = std::move( program );

  LOG_INFO( abacus::log::instance(), "Registered program {}", abacus::log::base58{ id.data(), id.size() } );
}

void bank::deposit( const protocol::account& key, std::uint64_t lamports )
{
  auto [ it, inserted ] = _accounts.try_emplace( key );
  if( inserted )
  {
    it->second.key   = key;
    it->second.owner = protocol::system_program_id();
  }

  if( std::numeric_limits< std::uint64_t >::max() - lamports < it->second.lamports )
    throw std::overflow_error( "deposit would overflow account balance" );

  it->second.lamports += lamports;

  LOG_DEBUG( abacus::log::instance(),
             "Deposited {} lamports to {}",
             lamports,
             abacus::log::base58{ key.data(), key.size() } );
}

std::optional< protocol::account_info > bank::get_account( const protocol::account& key ) const
{
  if( auto it = _accounts.find( key ); it != _accounts.end() )
    return it->second;

  return {};
}

std::uint64_t bank::minimum_balance( std::size_t data_length ) const noexcept
{
  return _options.rent_schedule.minimum_balance( data_length );
}

const bank_options& bank::options() const noexcept
{
  return _options;
}

result< std::uint64_t > bank::transaction_fee( const protocol::transaction& transaction ) const
{
  std::set< protocol::account > signers( transaction.signers.begin(), transaction.signers.end() );

  if( !signers.empty()
      && std::numeric_limits< std::uint64_t >::max() / signers.size() < _options.lamports_per_signature )
    return std::unexpected( runtime_errc::insufficient_funds );

  return _options.lamports_per_signature * signers.size();
}

result< protocol::transaction_receipt > bank::process( const protocol::transaction& transaction )
{
  if( transaction.instructions.empty() )
    return std::unexpected( runtime_errc::empty_transaction );

  if( !transaction.signed_by( transaction.payer ) )
    return std::unexpected( runtime_errc::missing_required_signature );

  for( const auto& instruction: transaction.instructions )
    for( const auto& meta: instruction.accounts )
      if( meta.signer && !transaction.signed_by( meta.key ) )
        return std::unexpected( runtime_errc::missing_required_signature );

  auto fee = transaction_fee( transaction );
  if( !fee )
    return std::unexpected( fee.error() );

  auto payer = _accounts.find( transaction.payer );
  if( payer == _accounts.end() || payer->second.lamports < *fee )
    return std::unexpected( runtime_errc::insufficient_funds );

  payer->second.lamports -= *fee;

  protocol::transaction_receipt receipt;
  receipt.fee = *fee;

  auto working = _accounts;

  for( std::size_t i = 0; i < transaction.instructions.size(); ++i )
  {
    if( auto error = execute( working, transaction.instructions[ i ], receipt.logs ); error )
    {
      receipt.reverted           = true;
      receipt.error              = error;
      receipt.failed_instruction = i;

      LOG_WARNING( abacus::log::instance(),
                   "Transaction reverted at instruction {}: {}",
                   i,
                   error.message() );
      return receipt;
    }
  }

  _accounts = std::move( working );

  LOG_DEBUG( abacus::log::instance(),
             "Transaction committed - Instructions: {}, Fee: {}",
             transaction.instructions.size(),
             *fee );
  return receipt;
}

std::error_code
bank::execute( account_map& accounts, const protocol::instruction& instruction, std::vector< std::string >& logs )
{
  auto program = _programs.find( instruction.program_id );
  if( program == _programs.end() )
    return runtime_errc::unknown_program;

  std::vector< protocol::account_info > infos;
  infos.reserve( instruction.accounts.size() );

  for( const auto& meta: instruction.accounts )
  {
    if( std::ranges::any_of( infos,
                             [ & ]( const auto& info )
                             {
                               return info.key == meta.key;
                             } ) )
      return runtime_errc::duplicate_account;

    protocol::account_info info;
    if( auto it = accounts.find( meta.key ); it != accounts.end() )
    {
      info = it->second;
    }
    else
    {
      info.key   = meta.key;
      info.owner = protocol::system_program_id();
    }

    info.signer   = meta.signer;
    info.writable = meta.writable;
    infos.emplace_back( std::move( info ) );
  }

  LOG_DEBUG( abacus::log::instance(),
             "Executing program {} with {} accounts, data: {}",
             abacus::log::base58{ instruction.program_id.data(), instruction.program_id.size() },
             infos.size(),
             abacus::log::hex{ instruction.data.data(), instruction.data.size() } );

  invocation_context context( _options, instruction.program_id, infos, logs );

  auto program_name = protocol::to_string( instruction.program_id );
  context.push_log( std::format( "Program {} invoke [1]", program_name ) );

  auto error = program->second->run( &context, instruction.program_id, infos, instruction.data );

  if( !error )
    error = context.verify();

  if( error )
  {
    context.push_log( std::format( "Program {} failed: {}", program_name, error.message() ) );
    return error;
  }

  context.push_log( std::format( "Program {} success", program_name ) );

  const auto& baseline = context.baseline();
  for( std::size_t i = 0; i < infos.size(); ++i )
  {
    const auto& key  = baseline[ i ].key;
    const auto& info = infos[ i ];

    if( !info.lamports && info.data.empty() && info.owner == protocol::system_program_id() )
    {
      accounts.erase( key );
      continue;
    }

    auto& stored      = accounts[ key ];
    stored.key        = key;
    stored.owner      = info.owner;
    stored.lamports   = info.lamports;
    stored.data       = info.data;
    stored.executable = baseline[ i ].executable;
  }

  return runtime_errc::ok;
}

} // namespace abacus::runtime
