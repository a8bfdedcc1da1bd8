#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <variant>
#include <vector>

#include <abacus/program/error.hpp>

namespace abacus::program {

constexpr std::uint64_t default_step = 1;

struct initialize_counter
{
  std::uint64_t initial_value = 0;

  bool operator==( const initialize_counter& ) const = default;
};

struct increment_counter
{
  std::optional< std::uint64_t > step;

  bool operator==( const increment_counter& ) const = default;
};

struct decrement_counter
{
  std::optional< std::uint64_t > step;

  bool operator==( const decrement_counter& ) const = default;
};

// Alternative index doubles as the wire tag
using counter_instruction = std::variant< initialize_counter, increment_counter, decrement_counter >;

struct counter_account
{
  static constexpr std::size_t size = sizeof( std::uint64_t );

  std::uint64_t count = 0;

  bool operator==( const counter_account& ) const = default;
};

std::vector< std::byte > encode( const counter_instruction& instruction );
result< counter_instruction > decode_instruction( std::span< const std::byte > data ) noexcept;

std::error_code encode( const counter_account& account, std::span< std::byte > data ) noexcept;
result< counter_account > decode_account( std::span< const std::byte > data ) noexcept;

} // namespace abacus::program
