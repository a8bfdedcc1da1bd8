#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <abacus/encode/error.hpp>

namespace abacus::protocol {

constexpr std::size_t account_length = 32;

using account = std::array< std::byte, account_length >;

account system_program_id() noexcept;
account native_loader_id() noexcept;
account make_account( std::string_view seed ) noexcept;

std::string to_string( const account& ) noexcept;
encode::result< account > from_string( std::string_view str ) noexcept;

struct account_info
{
  account key{};
  account owner{};
  std::uint64_t lamports = 0;
  std::vector< std::byte > data;
  bool signer     = false;
  bool writable   = false;
  bool executable = false;

  bool operator==( const account_info& ) const = default;
};

struct account_meta
{
  account key{};
  bool signer   = false;
  bool writable = false;

  static account_meta make_writable( const account& key, bool signer ) noexcept;
  static account_meta make_readonly( const account& key, bool signer ) noexcept;
};

} // namespace abacus::protocol
