#include <gtest/gtest.h>

#include <array>

#include <abacus/encode/base58.hpp>

using namespace std::string_view_literals;

const auto str     = "The quick brown fox jumps over the lazy dog"sv;
const auto b58_str = "7DdiPPYtxLjCD3wA1po2rvZHTDYjkZYiEtazrfiwJcwnKCizhGFhBGHeRdx"sv;

TEST( base58, encode )
{
  auto encoded_data = abacus::encode::to_base58( std::as_bytes( std::span( str ) ) );

  EXPECT_EQ( encoded_data, b58_str );
}

TEST( base58, leading_zeroes )
{
  std::array< std::byte, 32 > system_program{};

  EXPECT_EQ( abacus::encode::to_base58( system_program ), "11111111111111111111111111111111"sv );

  auto decoded_data = abacus::encode::from_base58( "11111111111111111111111111111111"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, system_program ) );
}

TEST( base58, decode )
{
  auto decoded_data = abacus::encode::from_base58( b58_str );

  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, std::as_bytes( std::span( str ) ) ) );

  decoded_data = abacus::encode::from_base58( "0DdiPPYtxLjCD3wA1po2rvZHTDYjkZYiEtazrfiwJcwnKCizhGFhBGHeRdx"sv );
  if( decoded_data )
    ADD_FAILURE() << "base58 decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), abacus::encode::encode_errc::invalid_character );
    EXPECT_EQ( decoded_data.error().message(),
               abacus::encode::encode_category().message(
                 static_cast< int >( abacus::encode::encode_errc::invalid_character ) ) );
  }
}

TEST( base58, fixed_length )
{
  auto decoded_data = abacus::encode::from_base58< 32 >( "11111111111111111111111111111111"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_EQ( *decoded_data, ( std::array< std::byte, 32 >{} ) );

  auto short_data = abacus::encode::from_base58< 32 >( b58_str );
  ASSERT_FALSE( short_data );
  EXPECT_EQ( short_data.error(), abacus::encode::encode_errc::invalid_length );

  auto bad_data = abacus::encode::from_base58< 32 >( "l1111111111111111111111111111111"sv );
  ASSERT_FALSE( bad_data );
  EXPECT_EQ( bad_data.error(), abacus::encode::encode_errc::invalid_character );
}
