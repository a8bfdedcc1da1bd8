#include <abacus/protocol/account.hpp>

#include <abacus/crypto/hash.hpp>
#include <abacus/encode/base58.hpp>

namespace abacus::protocol {

account system_program_id() noexcept
{
  return account{};
}

account native_loader_id() noexcept
{
  static const account id = make_account( "native_loader" );
  return id;
}

account make_account( std::string_view seed ) noexcept
{
  return crypto::hash( seed );
}

std::string to_string( const account& a ) noexcept
{
  return encode::to_base58( a );
}

encode::result< account > from_string( std::string_view str ) noexcept
{
  return encode::from_base58< account_length >( str );
}

account_meta account_meta::make_writable( const account& key, bool signer ) noexcept
{
  return account_meta{ .key = key, .signer = signer, .writable = true };
}

account_meta account_meta::make_readonly( const account& key, bool signer ) noexcept
{
  return account_meta{ .key = key, .signer = signer, .writable = false };
}

} // namespace abacus::protocol
