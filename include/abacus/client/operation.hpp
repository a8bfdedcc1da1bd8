#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace abacus::client {

enum class operation_kind : std::uint8_t
{
  increment,
  decrement,
  raw
};

struct counter_operation
{
  operation_kind kind = operation_kind::increment;
  std::optional< std::uint64_t > step;
  std::vector< std::byte > data;
};

/*
 * Parses a command line operation:
 *   increment, increment:<step>, decrement, decrement:<step>, raw:<hex instruction data>
 */
std::optional< counter_operation > parse_operation( std::string_view str );

} // namespace abacus::client
