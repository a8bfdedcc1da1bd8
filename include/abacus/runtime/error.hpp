#pragma once

#include <expected>
#include <system_error>

namespace abacus::runtime {

enum class runtime_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_transaction,
  unknown_program,
  duplicate_account,
  missing_required_signature,
  insufficient_funds,
  account_already_in_use,
  invalid_account_data_length,
  modified_program_id,
  external_account_data_modified,
  readonly_account_modified,
  unbalanced_instruction
};

const std::error_category& runtime_category() noexcept;

std::error_code make_error_code( runtime_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace abacus::runtime

template<>
struct std::is_error_code_enum< abacus::runtime::runtime_errc >: public std::true_type
{};
