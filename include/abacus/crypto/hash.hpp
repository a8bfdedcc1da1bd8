#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace abacus::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

digest hash( const void* ptr, std::size_t len );
digest hash( const char* s ) noexcept;
digest hash( const std::string& s ) noexcept;
digest hash( std::string_view sv ) noexcept;
digest hash( std::span< const std::byte > s ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
digest hash( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  return hash( &t, sizeof( T ) );
}

} // namespace abacus::crypto
