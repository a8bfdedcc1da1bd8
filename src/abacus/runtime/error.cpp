#include <abacus/runtime/error.hpp>

#include <string>
#include <utility>

namespace abacus::runtime {

struct _runtime_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "runtime";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< runtime_errc >( condition ) )
    {
      case runtime_errc::ok:
        return "ok"s;
      case runtime_errc::empty_transaction:
        return "empty transaction"s;
      case runtime_errc::unknown_program:
        return "unknown program"s;
      case runtime_errc::duplicate_account:
        return "duplicate account"s;
      case runtime_errc::missing_required_signature:
        return "missing required signature"s;
      case runtime_errc::insufficient_funds:
        return "insufficient funds"s;
      case runtime_errc::account_already_in_use:
        return "account already in use"s;
      case runtime_errc::invalid_account_data_length:
        return "invalid account data length"s;
      case runtime_errc::modified_program_id:
        return "modified program id"s;
      case runtime_errc::external_account_data_modified:
        return "external account data modified"s;
      case runtime_errc::readonly_account_modified:
        return "readonly account modified"s;
      case runtime_errc::unbalanced_instruction:
        return "unbalanced instruction"s;
    }
    std::unreachable();
  }
};

const std::error_category& runtime_category() noexcept
{
  static _runtime_category category;
  return category;
}

std::error_code make_error_code( runtime_errc e )
{
  return std::error_code( static_cast< int >( e ), runtime_category() );
}

} // namespace abacus::runtime
