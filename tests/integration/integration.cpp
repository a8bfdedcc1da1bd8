// NOLINTBEGIN

#include <algorithm>
#include <limits>
#include <memory>
#include <optional>

#include <gtest/gtest.h>

#include <abacus/client.hpp>
#include <abacus/program.hpp>
#include <abacus/protocol.hpp>
#include <abacus/runtime.hpp>
#include <test/fixture.hpp>

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration" ),
      counter( abacus::protocol::make_account( "counter" ) )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  std::uint64_t value() const
  {
    auto v = _client->value( counter );
    return v ? *v : 0;
  }

  abacus::protocol::account counter;
};

TEST_F( integration, counter )
{
  ASSERT_TRUE( verify( _client->initialize( counter, 42 ), verification::without_reversion ) );
  EXPECT_EQ( value(), 42 );

  ASSERT_TRUE( verify( _client->increment( counter ), verification::without_reversion ) );
  EXPECT_EQ( value(), 43 );

  ASSERT_TRUE( verify( _client->increment( counter, 5 ), verification::without_reversion ) );
  EXPECT_EQ( value(), 48 );

  ASSERT_TRUE( verify( _client->decrement( counter ), verification::without_reversion ) );
  EXPECT_EQ( value(), 47 );

  ASSERT_TRUE( verify( _client->decrement( counter, 3 ), verification::without_reversion ) );
  EXPECT_EQ( value(), 44 );

  ASSERT_TRUE( verify( _client->decrement( counter, 44 ), verification::without_reversion ) );
  EXPECT_EQ( value(), 0 );

  auto receipt = _client->decrement( counter, 1 );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, abacus::program::program_errc::invalid_account_data );
  EXPECT_EQ( value(), 0 );
}

TEST_F( integration, rent_exempt_allocation )
{
  auto balance = lamports( _payer );

  auto receipt = _client->initialize( counter, 7 );
  ASSERT_TRUE( verify( receipt, verification::without_reversion ) );

  auto account = _bank->get_account( counter );
  ASSERT_TRUE( account );
  EXPECT_EQ( account->owner, _program_id );
  EXPECT_EQ( account->lamports, _bank->minimum_balance( abacus::program::counter_account::size ) );
  EXPECT_EQ( account->lamports, 946'560 );
  EXPECT_EQ( account->data.size(), abacus::program::counter_account::size );

  EXPECT_EQ( lamports( _payer ), balance - receipt->fee - account->lamports );
}

TEST_F( integration, initialize_twice )
{
  ASSERT_TRUE( verify( _client->initialize( counter, 1 ), verification::without_reversion ) );
  auto before = data( counter );

  auto receipt = _client->initialize( counter, 2 );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, abacus::program::program_errc::account_already_initialized );

  EXPECT_EQ( data( counter ), before );
  EXPECT_EQ( value(), 1 );
}

TEST_F( integration, failure_only_charges_fee )
{
  ASSERT_TRUE( verify( _client->initialize( counter, std::numeric_limits< std::uint64_t >::max() ),
                       verification::without_reversion ) );

  auto before_data     = data( counter );
  auto before_lamports = lamports( counter );
  auto before_balance  = lamports( _payer );

  auto receipt = _client->increment( counter );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, abacus::program::program_errc::invalid_account_data );
  EXPECT_EQ( receipt->failed_instruction, std::optional< std::size_t >( 0 ) );

  EXPECT_EQ( data( counter ), before_data );
  EXPECT_EQ( lamports( counter ), before_lamports );
  EXPECT_EQ( lamports( _payer ), before_balance - receipt->fee );
  EXPECT_EQ( receipt->fee, _bank->options().lamports_per_signature );
}

TEST_F( integration, uninitialized_counter )
{
  auto receipt = _client->increment( counter );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, abacus::program::program_errc::incorrect_program_id );

  auto v = _client->value( counter );
  ASSERT_FALSE( v );
  EXPECT_EQ( v.error(), abacus::program::program_errc::uninitialized_account );
}

TEST_F( integration, foreign_counter )
{
  auto other_program = abacus::protocol::make_account( "other_program" );
  _bank->register_program( other_program, std::make_unique< abacus::program::counter >() );

  abacus::client::counter_client other( *_bank, other_program, _payer );
  ASSERT_TRUE( verify( other.initialize( counter, 10 ), verification::without_reversion ) );

  auto receipt = _client->increment( counter );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, abacus::program::program_errc::incorrect_program_id );

  auto v = _client->value( counter );
  ASSERT_FALSE( v );
  EXPECT_EQ( v.error(), abacus::program::program_errc::incorrect_program_id );

  auto foreign = other.value( counter );
  ASSERT_TRUE( foreign );
  EXPECT_EQ( *foreign, 10 );
}

TEST_F( integration, atomic_transaction )
{
  ASSERT_TRUE( verify( _client->initialize( counter, 5 ), verification::without_reversion ) );

  auto t = make_transaction( {},
                             abacus::client::make_increment_counter_instruction( _program_id, counter, 10 ),
                             abacus::client::make_decrement_counter_instruction( _program_id, counter, 20 ) );

  auto receipt = _bank->process( t );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->failed_instruction, std::optional< std::size_t >( 1 ) );
  EXPECT_EQ( value(), 5 );

  t = make_transaction( {},
                        abacus::client::make_increment_counter_instruction( _program_id, counter, 10 ),
                        abacus::client::make_decrement_counter_instruction( _program_id, counter, 12 ) );

  ASSERT_TRUE( verify( _bank->process( t ), verification::without_reversion ) );
  EXPECT_EQ( value(), 3 );
}

TEST_F( integration, program_logs )
{
  auto receipt = _client->initialize( counter, 42 );
  ASSERT_TRUE( verify( receipt, verification::without_reversion ) );

  const auto& logs = receipt->logs;
  EXPECT_NE( std::ranges::find( logs, "Program log: Initializing counter with value: 42" ), logs.end() );
  EXPECT_NE( std::ranges::find( logs, "Program log: Counter initialized successfully with value: 42" ), logs.end() );
  EXPECT_EQ( logs.front(), "Program " + abacus::protocol::to_string( _program_id ) + " invoke [1]" );
  EXPECT_EQ( logs.back(), "Program " + abacus::protocol::to_string( _program_id ) + " success" );

  receipt = _client->decrement( counter, 2 );
  ASSERT_TRUE( verify( receipt, verification::without_reversion ) );
  EXPECT_NE( std::ranges::find( receipt->logs, "Program log: Decrementing counter by: 2" ), receipt->logs.end() );
  EXPECT_NE( std::ranges::find( receipt->logs, "Program log: Counter decremented to: 40" ), receipt->logs.end() );
}

TEST_F( integration, raw_instruction_data )
{
  ASSERT_TRUE( verify( _client->initialize( counter, 10 ), verification::without_reversion ) );

  auto op = abacus::client::parse_operation( "raw:0x01010300000000000000" );
  ASSERT_TRUE( op );
  ASSERT_TRUE( verify( _client->submit( counter, op->data ), verification::without_reversion ) );
  EXPECT_EQ( value(), 13 );

  op = abacus::client::parse_operation( "raw:0x0101" );
  ASSERT_TRUE( op );
  auto receipt = _client->submit( counter, op->data );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, abacus::program::program_errc::invalid_instruction_data );
  EXPECT_EQ( value(), 13 );
}

// NOLINTEND
