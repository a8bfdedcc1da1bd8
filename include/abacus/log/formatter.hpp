#pragma once

#include <span>
#include <string>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <abacus/encode.hpp>

namespace abacus::log {

struct hex_tag
{
  static std::string encode( std::span< const std::byte > s )
  {
    return abacus::encode::to_hex( s );
  }
};

struct base58_tag
{
  static std::string encode( std::span< const std::byte > s )
  {
    return abacus::encode::to_base58( s );
  }
};

// Instruction data and account bytes, e.g. "0x0100"
using hex = quill::BinaryData< hex_tag >;

// Account addresses
using base58 = quill::BinaryData< base58_tag >;

template< typename Tag >
struct binary_formatter
{
  constexpr auto parse( fmtquill::format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const quill::BinaryData< Tag >& bin_data, fmtquill::format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", Tag::encode( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

} // namespace abacus::log

template<>
struct fmtquill::formatter< abacus::log::hex >: abacus::log::binary_formatter< abacus::log::hex_tag >
{};

template<>
struct quill::Codec< abacus::log::hex >: quill::BinaryDataDeferredFormatCodec< abacus::log::hex >
{};

template<>
struct fmtquill::formatter< abacus::log::base58 >: abacus::log::binary_formatter< abacus::log::base58_tag >
{};

template<>
struct quill::Codec< abacus::log::base58 >: quill::BinaryDataDeferredFormatCodec< abacus::log::base58 >
{};
