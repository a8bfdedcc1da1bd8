// NOLINTBEGIN

#include <test/fixture.hpp>

#include <abacus/log.hpp>
#include <abacus/program.hpp>

namespace test {

fixture::fixture( const std::string& name, std::uint64_t payer_balance )
{
  abacus::log::initialize();

  _program_id = abacus::protocol::make_account( name + "_program" );
  _payer      = abacus::protocol::make_account( name + "_payer" );

  _bank = std::make_unique< abacus::runtime::bank >();
  _bank->register_program( _program_id, std::make_unique< abacus::program::counter >() );
  _bank->deposit( _payer, payer_balance );

  _client = std::make_unique< abacus::client::counter_client >( *_bank, _program_id, _payer );

  LOG_INFO( abacus::log::instance(),
            "Fixture {} using payer {}",
            name,
            abacus::log::base58{ _payer.data(), _payer.size() } );
}

std::uint64_t fixture::lamports( const abacus::protocol::account& key ) const
{
  auto account = _bank->get_account( key );
  return account ? account->lamports : 0;
}

std::vector< std::byte > fixture::data( const abacus::protocol::account& key ) const
{
  auto account = _bank->get_account( key );
  return account ? account->data : std::vector< std::byte >{};
}

bool fixture::verify( abacus::runtime::result< abacus::protocol::transaction_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( abacus::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( abacus::log::instance(), "Transaction was reverted: {}", receipt->error.message() );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND
