#include <abacus/program/error.hpp>

#include <string>
#include <utility>

namespace abacus::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "program";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< program_errc >( condition ) )
    {
      case program_errc::ok:
        return "ok"s;
      case program_errc::invalid_instruction_data:
        return "invalid instruction data"s;
      case program_errc::account_already_initialized:
        return "account already initialized"s;
      case program_errc::incorrect_program_id:
        return "incorrect program id"s;
      case program_errc::uninitialized_account:
        return "uninitialized account"s;
      case program_errc::invalid_account_data:
        return "invalid account data"s;
      case program_errc::not_enough_account_keys:
        return "not enough account keys"s;
    }
    std::unreachable();
  }
};

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace abacus::program
