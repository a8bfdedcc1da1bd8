#include <abacus/program/instruction.hpp>

#include <algorithm>
#include <utility>

#include <boost/endian.hpp>

#include <abacus/memory.hpp>

namespace abacus::program {

enum class instruction_tag : std::uint8_t
{
  initialize_counter,
  increment_counter,
  decrement_counter
};

enum class option_tag : std::uint8_t
{
  none,
  some
};

static void append( std::vector< std::byte >& bytes, std::uint64_t value )
{
  boost::endian::native_to_little_inplace( value );
  auto view = memory::as_bytes( value );
  bytes.insert( bytes.end(), view.begin(), view.end() );
}

static void append( std::vector< std::byte >& bytes, const std::optional< std::uint64_t >& value )
{
  if( !value )
  {
    bytes.push_back( std::byte{ std::to_underlying( option_tag::none ) } );
    return;
  }

  bytes.push_back( std::byte{ std::to_underlying( option_tag::some ) } );
  append( bytes, *value );
}

namespace {

class reader
{
public:
  explicit reader( std::span< const std::byte > data ) noexcept:
      _data( data )
  {}

  result< std::uint8_t > read_u8() noexcept
  {
    if( _data.empty() )
      return std::unexpected( program_errc::invalid_instruction_data );

    auto value = std::to_integer< std::uint8_t >( _data.front() );
    _data      = _data.subspan( 1 );
    return value;
  }

  result< std::uint64_t > read_u64() noexcept
  {
    if( _data.size() < sizeof( std::uint64_t ) )
      return std::unexpected( program_errc::invalid_instruction_data );

    auto value = memory::bit_cast< std::uint64_t >( _data );
    boost::endian::little_to_native_inplace( value );
    _data = _data.subspan( sizeof( std::uint64_t ) );
    return value;
  }

  result< std::optional< std::uint64_t > > read_optional_u64() noexcept
  {
    auto tag = read_u8();
    if( !tag )
      return std::unexpected( tag.error() );

    switch( *tag )
    {
      case std::to_underlying( option_tag::none ):
        return std::optional< std::uint64_t >{};
      case std::to_underlying( option_tag::some ):
        {
          auto value = read_u64();
          if( !value )
            return std::unexpected( value.error() );

          return std::optional< std::uint64_t >{ *value };
        }
      default:
        return std::unexpected( program_errc::invalid_instruction_data );
    }
  }

  bool exhausted() const noexcept
  {
    return _data.empty();
  }

private:
  std::span< const std::byte > _data;
};

} // namespace

std::vector< std::byte > encode( const counter_instruction& instruction )
{
  std::vector< std::byte > bytes;

  if( std::holds_alternative< initialize_counter >( instruction ) )
  {
    bytes.push_back( std::byte{ std::to_underlying( instruction_tag::initialize_counter ) } );
    append( bytes, std::get< initialize_counter >( instruction ).initial_value );
  }
  else if( std::holds_alternative< increment_counter >( instruction ) )
  {
    bytes.push_back( std::byte{ std::to_underlying( instruction_tag::increment_counter ) } );
    append( bytes, std::get< increment_counter >( instruction ).step );
  }
  else if( std::holds_alternative< decrement_counter >( instruction ) )
  {
    bytes.push_back( std::byte{ std::to_underlying( instruction_tag::decrement_counter ) } );
    append( bytes, std::get< decrement_counter >( instruction ).step );
  }

  return bytes;
}

result< counter_instruction > decode_instruction( std::span< const std::byte > data ) noexcept
{
  reader in( data );

  auto tag = in.read_u8();
  if( !tag )
    return std::unexpected( tag.error() );

  counter_instruction instruction;

  switch( *tag )
  {
    case std::to_underlying( instruction_tag::initialize_counter ):
      {
        auto initial_value = in.read_u64();
        if( !initial_value )
          return std::unexpected( initial_value.error() );

        instruction = initialize_counter{ .initial_value = *initial_value };
        break;
      }
    case std::to_underlying( instruction_tag::increment_counter ):
      {
        auto step = in.read_optional_u64();
        if( !step )
          return std::unexpected( step.error() );

        instruction = increment_counter{ .step = *step };
        break;
      }
    case std::to_underlying( instruction_tag::decrement_counter ):
      {
        auto step = in.read_optional_u64();
        if( !step )
          return std::unexpected( step.error() );

        instruction = decrement_counter{ .step = *step };
        break;
      }
    default:
      return std::unexpected( program_errc::invalid_instruction_data );
  }

  if( !in.exhausted() )
    return std::unexpected( program_errc::invalid_instruction_data );

  return instruction;
}

std::error_code encode( const counter_account& account, std::span< std::byte > data ) noexcept
{
  if( data.size() != counter_account::size )
    return program_errc::invalid_account_data;

  auto count = boost::endian::native_to_little( account.count );
  std::ranges::copy( memory::as_bytes( count ), data.begin() );

  return program_errc::ok;
}

result< counter_account > decode_account( std::span< const std::byte > data ) noexcept
{
  if( data.size() != counter_account::size )
    return std::unexpected( program_errc::invalid_account_data );

  auto count = memory::bit_cast< std::uint64_t >( data );
  boost::endian::little_to_native_inplace( count );

  return counter_account{ .count = count };
}

} // namespace abacus::program
