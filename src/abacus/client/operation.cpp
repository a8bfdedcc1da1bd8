#include <abacus/client/operation.hpp>

#include <charconv>
#include <utility>

#include <abacus/encode/hex.hpp>

namespace abacus::client {

std::optional< counter_operation > parse_operation( std::string_view str )
{
  counter_operation op;
  auto separator = str.find( ':' );
  auto name      = str.substr( 0, separator );

  if( name == "increment" )
    op.kind = operation_kind::increment;
  else if( name == "decrement" )
    op.kind = operation_kind::decrement;
  else if( name == "raw" )
    op.kind = operation_kind::raw;
  else
    return {};

  if( separator == std::string_view::npos )
  {
    if( op.kind == operation_kind::raw )
      return {};

    return op;
  }

  auto argument = str.substr( separator + 1 );
  if( argument.empty() )
    return {};

  if( op.kind == operation_kind::raw )
  {
    auto data = encode::from_hex( argument );
    if( !data || data->empty() )
      return {};

    op.data = std::move( *data );
    return op;
  }

  std::uint64_t step = 0;
  auto [ ptr, ec ]   = std::from_chars( argument.data(), argument.data() + argument.size(), step );

  if( ec != std::errc{} || ptr != argument.data() + argument.size() )
    return {};

  op.step = step;
  return op;
}

} // namespace abacus::client
