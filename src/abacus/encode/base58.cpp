#include <abacus/encode/base58.hpp>

#include <array>
#include <cstdint>

namespace abacus::encode {

static constexpr std::string_view alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static constexpr std::uint32_t base  = 58;
static constexpr std::uint32_t radix = 256;

// log(256) / log(58) and log(58) / log(256), scaled and rounded up
static constexpr std::size_t encode_expansion_numerator   = 138;
static constexpr std::size_t encode_expansion_denominator = 100;
static constexpr std::size_t decode_expansion_numerator   = 733;
static constexpr std::size_t decode_expansion_denominator = 1'000;

static constexpr std::array< std::int8_t, radix > make_reverse_alphabet() noexcept
{
  std::array< std::int8_t, radix > map{};
  map.fill( -1 );
  for( std::size_t i = 0; i < alphabet.size(); ++i )
    map[ static_cast< unsigned char >( alphabet[ i ] ) ] = static_cast< std::int8_t >( i );
  return map;
}

static constexpr auto reverse_alphabet = make_reverse_alphabet();

std::string to_base58( std::span< const std::byte > s ) noexcept
{
  std::size_t zeroes = 0;
  while( zeroes < s.size() && s[ zeroes ] == std::byte{ 0x00 } )
    ++zeroes;

  std::vector< std::uint8_t > b58( ( s.size() - zeroes ) * encode_expansion_numerator / encode_expansion_denominator
                                   + 1 );
  std::size_t length = 0;

  for( std::size_t i = zeroes; i < s.size(); ++i )
  {
    auto carry    = static_cast< std::uint32_t >( std::to_integer< std::uint8_t >( s[ i ] ) );
    std::size_t j = 0;
    for( auto it = b58.rbegin(); ( carry != 0 || j < length ) && it != b58.rend(); ++it, ++j )
    {
      carry += radix * *it;
      *it    = static_cast< std::uint8_t >( carry % base );
      carry /= base;
    }
    length = j;
  }

  auto it = b58.begin() + static_cast< std::ptrdiff_t >( b58.size() - length );
  while( it != b58.end() && *it == 0 )
    ++it;

  std::string str;
  str.reserve( zeroes + static_cast< std::size_t >( b58.end() - it ) );
  str.assign( zeroes, alphabet[ 0 ] );
  for( ; it != b58.end(); ++it )
    str += alphabet[ *it ];

  return str;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  std::size_t zeroes = 0;
  while( zeroes < sv.size() && sv[ zeroes ] == alphabet[ 0 ] )
    ++zeroes;

  std::vector< std::uint8_t > b256( ( sv.size() - zeroes ) * decode_expansion_numerator / decode_expansion_denominator
                                    + 1 );
  std::size_t length = 0;

  for( std::size_t i = zeroes; i < sv.size(); ++i )
  {
    auto digit = reverse_alphabet[ static_cast< unsigned char >( sv[ i ] ) ];
    if( digit < 0 )
      return std::unexpected( encode_errc::invalid_character );

    auto carry    = static_cast< std::uint32_t >( digit );
    std::size_t j = 0;
    for( auto it = b256.rbegin(); ( carry != 0 || j < length ) && it != b256.rend(); ++it, ++j )
    {
      carry += base * *it;
      *it    = static_cast< std::uint8_t >( carry % radix );
      carry /= radix;
    }
    length = j;
  }

  auto it = b256.begin() + static_cast< std::ptrdiff_t >( b256.size() - length );
  while( it != b256.end() && *it == 0 )
    ++it;

  std::vector< std::byte > bytes( zeroes, std::byte{ 0x00 } );
  bytes.reserve( zeroes + static_cast< std::size_t >( b256.end() - it ) );
  for( ; it != b256.end(); ++it )
    bytes.push_back( std::byte{ *it } );

  return bytes;
}

} // namespace abacus::encode
