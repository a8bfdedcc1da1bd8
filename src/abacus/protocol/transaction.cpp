#include <abacus/protocol/transaction.hpp>

#include <algorithm>

namespace abacus::protocol {

bool transaction::signed_by( const account& key ) const noexcept
{
  return std::ranges::find( signers, key ) != signers.end();
}

} // namespace abacus::protocol
