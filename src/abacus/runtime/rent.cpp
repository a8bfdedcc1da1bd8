#include <abacus/runtime/rent.hpp>

namespace abacus::runtime {

std::uint64_t rent::minimum_balance( std::size_t data_length ) const noexcept
{
  auto bytes = account_storage_overhead + static_cast< std::uint64_t >( data_length );
  return static_cast< std::uint64_t >( static_cast< double >( bytes * lamports_per_byte_year ) * exemption_threshold );
}

} // namespace abacus::runtime
