// NOLINTBEGIN

#include <gtest/gtest.h>

#include <abacus/crypto/hash.hpp>
#include <abacus/encode.hpp>

TEST( hash, blake3 )
{
  auto out = abacus::crypto::hash( "A quick brown fox jumps over the lazy dog" );
  EXPECT_TRUE(
    std::ranges::equal( out, *abacus::encode::from_base58( "EzpeBRqqVNxcPGe9caKm9CSHcqnbCftXrc3Efn8R9JmP" ) ) );

  std::uint64_t number = 12'345;
  auto out2            = abacus::crypto::hash( number );
  EXPECT_TRUE(
    std::ranges::equal( out2, *abacus::encode::from_base58( "HnXg8eU4ELYHMkXCtDRM1paFQnMAGgxrhehAkEgopFh3" ) ) );
}

TEST( hash, seeds )
{
  using namespace std::string_literals;

  EXPECT_EQ( abacus::crypto::hash( "counter" ), abacus::crypto::hash( "counter"s ) );
  EXPECT_EQ( abacus::crypto::hash( std::string_view( "counter" ) ),
             abacus::crypto::hash( std::as_bytes( std::span( std::string_view( "counter" ) ) ) ) );
  EXPECT_NE( abacus::crypto::hash( "counter" ), abacus::crypto::hash( "payer" ) );
}

// NOLINTEND
