#pragma once

#include <array>
#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <abacus/encode/error.hpp>

namespace abacus::encode {

std::string to_base58( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept;

// Decodes into a fixed-size value, failing unless exactly N bytes are encoded
template< std::size_t N >
result< std::array< std::byte, N > > from_base58( std::string_view sv ) noexcept
{
  auto bytes = from_base58( sv );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != N )
    return std::unexpected( encode_errc::invalid_length );

  std::array< std::byte, N > value{};
  std::ranges::copy( *bytes, value.begin() );
  return value;
}

} // namespace abacus::encode
