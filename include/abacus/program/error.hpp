#pragma once

#include <expected>
#include <system_error>

namespace abacus::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_instruction_data,
  account_already_initialized,
  incorrect_program_id,
  uninitialized_account,
  invalid_account_data,
  not_enough_account_keys
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace abacus::program

template<>
struct std::is_error_code_enum< abacus::program::program_errc >: public std::true_type
{};
