#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <abacus/client.hpp>
#include <abacus/log.hpp>
#include <abacus/program.hpp>
#include <abacus/runtime.hpp>

constexpr std::uint64_t default_initial_value = 100;
constexpr std::uint64_t default_deposit       = 1'000'000'000;

// Resolves <name> from a base58 address when given, otherwise from <name>-seed
static std::optional< abacus::protocol::account >
resolve_account( const boost::program_options::variables_map& args, const std::string& name )
{
  if( !args.count( name ) )
    return abacus::protocol::make_account( args[ name + "-seed" ].as< std::string >() );

  const auto& address = args[ name ].as< std::string >();
  auto account        = abacus::protocol::from_string( address );
  if( !account )
  {
    LOG_ERROR( abacus::log::instance(), "Invalid {} address '{}': {}", name, address, account.error().message() );
    return {};
  }

  return *account;
}

static void log_receipt( const abacus::protocol::transaction_receipt& receipt )
{
  for( const auto& line: receipt.logs )
    LOG_DEBUG( abacus::log::instance(), "{}", line );
}

auto main( int argc, char** argv ) -> int
{
  abacus::log::initialize();

  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"                , "Print this help message and exit" )
    ( "version,v"             , "Print version string and exit" )
    ( "log-level,l"           , boost::program_options::value< std::string >()->default_value( "info" ), "The log filtering level" )
    ( "initial-value,i"       , boost::program_options::value< std::uint64_t >()->default_value( default_initial_value ), "Value the counter is initialized with" )
    ( "operation,o"           , boost::program_options::value< std::vector< std::string > >()->composing(), "increment[:step], decrement[:step] or raw:<hex>, may be repeated" )
    ( "payer-seed"            , boost::program_options::value< std::string >()->default_value( "payer" ), "Seed of the fee payer address" )
    ( "counter-seed"          , boost::program_options::value< std::string >()->default_value( "counter" ), "Seed of the counter account address" )
    ( "program-seed"          , boost::program_options::value< std::string >()->default_value( "counter_program" ), "Seed of the counter program address" )
    ( "payer"                 , boost::program_options::value< std::string >(), "Base58 fee payer address, overrides payer-seed" )
    ( "counter"               , boost::program_options::value< std::string >(), "Base58 counter account address, overrides counter-seed" )
    ( "program"               , boost::program_options::value< std::string >(), "Base58 counter program address, overrides program-seed" )
    ( "deposit,d"             , boost::program_options::value< std::uint64_t >()->default_value( default_deposit ), "Lamports deposited to the payer" )
    ( "lamports-per-signature", boost::program_options::value< std::uint64_t >()->default_value( abacus::runtime::bank_options{}.lamports_per_signature ), "Transaction fee per signature" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( abacus::log::instance(), "Invalid arguments: {}", e.what() );
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::println( "v0.1.0" );
    return EXIT_SUCCESS;
  }

  if( !abacus::log::set_level( args[ "log-level" ].as< std::string >() ) )
    return EXIT_FAILURE;

  std::vector< abacus::client::counter_operation > operations;
  if( args.count( "operation" ) )
  {
    for( const auto& str: args[ "operation" ].as< std::vector< std::string > >() )
    {
      auto op = abacus::client::parse_operation( str );
      if( !op )
      {
        LOG_ERROR( abacus::log::instance(), "Invalid operation '{}'. Expected: increment[:step], decrement[:step] or raw:<hex>", str );
        return EXIT_FAILURE;
      }

      operations.push_back( *op );
    }
  }

  abacus::runtime::bank_options bank_options;
  bank_options.lamports_per_signature = args[ "lamports-per-signature" ].as< std::uint64_t >();

  auto program_id = resolve_account( args, "program" );
  auto payer      = resolve_account( args, "payer" );
  auto counter    = resolve_account( args, "counter" );

  if( !program_id || !payer || !counter )
    return EXIT_FAILURE;

  abacus::runtime::bank bank( bank_options );

  try
  {
    bank.register_program( *program_id, std::make_unique< abacus::program::counter >() );
    bank.deposit( *payer, args[ "deposit" ].as< std::uint64_t >() );
  }
  catch( const std::logic_error& e )
  {
    LOG_ERROR( abacus::log::instance(), "Failed to set up the bank: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const std::overflow_error& e )
  {
    LOG_ERROR( abacus::log::instance(), "Failed to set up the bank: {}", e.what() );
    return EXIT_FAILURE;
  }

  LOG_INFO( abacus::log::instance(),
            "Program: {}, Payer: {}, Counter: {}",
            abacus::log::base58{ program_id->data(), program_id->size() },
            abacus::log::base58{ payer->data(), payer->size() },
            abacus::log::base58{ counter->data(), counter->size() } );

  abacus::client::counter_client client( bank, *program_id, *payer );

  auto initial_value = args[ "initial-value" ].as< std::uint64_t >();
  auto receipt       = client.initialize( *counter, initial_value );

  if( !receipt )
  {
    LOG_ERROR( abacus::log::instance(), "Failed to submit initialize transaction: {}", receipt.error().message() );
    return EXIT_FAILURE;
  }

  log_receipt( *receipt );

  if( receipt->reverted )
  {
    LOG_ERROR( abacus::log::instance(), "Failed to initialize counter: {}", receipt->error.message() );
    return EXIT_FAILURE;
  }

  LOG_INFO( abacus::log::instance(), "Counter initialized with value {}", initial_value );

  bool failed = false;

  for( const auto& op: operations )
  {
    auto step = op.step.value_or( abacus::program::default_step );
    abacus::runtime::result< abacus::protocol::transaction_receipt > outcome;
    std::string_view action;

    switch( op.kind )
    {
      case abacus::client::operation_kind::increment:
        action  = "increment";
        outcome = client.increment( *counter, op.step );
        break;
      case abacus::client::operation_kind::decrement:
        action  = "decrement";
        outcome = client.decrement( *counter, op.step );
        break;
      case abacus::client::operation_kind::raw:
        action = "submit";
        LOG_INFO( abacus::log::instance(),
                  "Submitting instruction data {}",
                  abacus::log::hex{ op.data.data(), op.data.size() } );
        outcome = client.submit( *counter, op.data );
        break;
    }

    if( !outcome )
    {
      LOG_ERROR( abacus::log::instance(), "Failed to submit {} transaction: {}", action, outcome.error().message() );
      failed = true;
      continue;
    }

    log_receipt( *outcome );

    if( outcome->reverted )
    {
      LOG_ERROR( abacus::log::instance(), "Failed to {} counter: {}", action, outcome->error.message() );
      failed = true;
      continue;
    }

    if( op.kind == abacus::client::operation_kind::increment )
      LOG_INFO( abacus::log::instance(), "Counter incremented by {}", step );
    else if( op.kind == abacus::client::operation_kind::decrement )
      LOG_INFO( abacus::log::instance(), "Counter decremented by {}", step );
    else
      LOG_INFO( abacus::log::instance(), "Instruction data accepted" );
  }

  auto value = client.value( *counter );
  if( !value )
  {
    LOG_ERROR( abacus::log::instance(), "Failed to read counter value: {}", value.error().message() );
    return EXIT_FAILURE;
  }

  std::println( "{}", *value );

  return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
