#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <wrapcoin/controller.hpp>
#include <wrapcoin/crypto.hpp>
#include <wrapcoin/encode.hpp>
#include <wrapcoin/log.hpp>
#include <wrapcoin/program.hpp>
#include <wrapcoin/protocol.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service = "wrapcoin"s;

constexpr auto help_option            = "help,h"s;
constexpr auto version_option         = "version,v"s;
constexpr auto basedir_option         = "basedir,d"s;
constexpr auto basedir_default        = "."s;
constexpr auto log_level_option       = "log-level,l"s;
constexpr auto log_level_default      = "info"s;
constexpr auto stack_limit_option     = "stack-limit"s;
constexpr auto coin_name_option       = "coin-name"s;
constexpr auto coin_symbol_option     = "coin-symbol"s;
constexpr auto coin_decimals_option   = "coin-decimals"s;
constexpr auto wrapper_name_option    = "wrapper-name"s;
constexpr auto wrapper_symbol_option  = "wrapper-symbol"s;
constexpr auto issuer_option          = "issuer,i"s;
constexpr auto issuer_default         = "issuer"s;
constexpr auto script_option          = "script,s"s;
constexpr auto script_default         = "script.yml"s;
constexpr std::uint64_t stack_limit_default = wrapcoin::controller::controller::default_stack_limit;

const auto coin_name_default      = std::string( wrapcoin::program::coin::default_name );
const auto coin_symbol_default    = std::string( wrapcoin::program::coin::default_symbol );
const auto wrapper_name_default   = std::string( wrapcoin::program::wrapper::default_name );
const auto wrapper_symbol_default = std::string( wrapcoin::program::wrapper::default_symbol );

constexpr std::uint64_t coin_decimals_default = wrapcoin::program::coin::default_decimals;

const auto coin_account    = wrapcoin::protocol::system_program( "coin" );
const auto wrapper_account = wrapcoin::protocol::system_program( "wrapper" );

} // namespace constants

using namespace boost;
using namespace wrapcoin;

const std::string& version_string();

namespace {

// Strip the short form from an option declaration
std::string option_key( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

template< typename T >
T get_option( const std::string& option,
              T default_value,
              const program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  auto key = option_key( option );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

class script_runner
{
public:
  script_runner( controller::controller& controller, const protocol::account& issuer ):
      _controller( controller ),
      _issuer( issuer )
  {}

  void run( const YAML::Node& script )
  {
    auto transactions = script[ "transactions" ];
    if( !transactions || !transactions.IsSequence() )
      throw std::runtime_error( "script does not contain a transactions sequence" );

    for( const auto& node: transactions )
      apply( node );

    report();
  }

private:
  protocol::account resolve( const std::string& name )
  {
    if( name == "coin" )
      return constants::coin_account;

    if( name == "wrapper" )
      return constants::wrapper_account;

    if( name == "issuer" )
      return _issuer;

    auto account = protocol::user_account( crypto::hash( name ) );
    _users.emplace( name, account );
    return account;
  }

  protocol::account resolve( const YAML::Node& node, const char* field )
  {
    if( !node[ field ] )
      throw std::runtime_error( std::string( "operation is missing field '" ) + field + "'" );

    return resolve( node[ field ].as< std::string >() );
  }

  static std::uint64_t amount( const YAML::Node& node )
  {
    if( !node[ "amount" ] )
      throw std::runtime_error( "operation is missing field 'amount'" );

    return node[ "amount" ].as< std::uint64_t >();
  }

  static protocol::operation call( const protocol::account& id, std::vector< std::byte >&& stdin )
  {
    protocol::call_program op;
    op.id          = id;
    op.input.stdin = std::move( stdin );
    return op;
  }

  protocol::operation make_operation( const std::string& kind, const YAML::Node& node )
  {
    if( kind == "mint" )
      return call( constants::coin_account,
                   program::make_input( program::coin::instruction::mint, resolve( node, "to" ), amount( node ) ) );

    if( kind == "transfer" )
    {
      auto token = node[ "token" ] ? resolve( node, "token" ) : constants::coin_account;
      return call(
        token,
        program::make_input( program::token::instruction::transfer, resolve( node, "from" ), resolve( node, "to" ), amount( node ) ) );
    }

    if( kind == "create_custody_account" )
      return call( constants::wrapper_account,
                   program::make_input( program::wrapper::instruction::create_custody_account, resolve( node, "user" ) ) );

    if( kind == "deposit" )
    {
      auto user = resolve( node, "user" );
      return call( constants::coin_account,
                   program::make_input( program::token::instruction::transfer,
                                        user,
                                        protocol::derived_program( constants::wrapper_account, user ),
                                        amount( node ) ) );
    }

    if( kind == "wrap" )
      return call( constants::wrapper_account,
                   program::make_input( program::wrapper::instruction::wrap, resolve( node, "user" ), amount( node ) ) );

    if( kind == "unwrap" )
      return call( constants::wrapper_account,
                   program::make_input( program::wrapper::instruction::unwrap, resolve( node, "user" ), amount( node ) ) );

    throw std::runtime_error( "unknown operation '" + kind + "'" );
  }

  void apply( const YAML::Node& node )
  {
    auto signer = resolve( node, "signer" );

    protocol::transaction transaction;
    for( const auto& op: node[ "operations" ] )
    {
      if( !op.IsMap() || op.size() != 1 )
        throw std::runtime_error( "each operation must be a single-key map" );

      auto entry = op.begin();
      transaction.operations.emplace_back( make_operation( entry->first.as< std::string >(), entry->second ) );
    }

    transaction.nonce = _controller.account_nonce( signer ) + 1;
    transaction.payer = signer;
    transaction.authorizations.emplace_back( signer );
    transaction.id = protocol::make_id( transaction );

    auto receipt = _controller.process( transaction );
    if( !receipt )
    {
      std::cout << "rejected " << encode::to_hex( transaction.id ) << ": " << receipt.error().message() << '\n';
      return;
    }

    std::cout << ( receipt->reverted ? "reverted " : "applied  " ) << encode::to_hex( receipt->id );
    if( receipt->reverted )
      std::cout << ": " << receipt->error.message();
    std::cout << '\n';

    for( const auto& e: receipt->events )
      std::cout << "  event " << e.sequence << ' ' << e.name << ' ' << encode::to_hex( e.data ) << '\n';

    for( const auto& message: receipt->logs )
      std::cout << "  log   " << message << '\n';
  }

  std::uint64_t query( const protocol::account& token, std::vector< std::byte >&& stdin )
  {
    protocol::program_input input;
    input.stdin = std::move( stdin );

    auto response = _controller.read_program( token, input );
    if( !response )
      throw std::runtime_error( "query failed: " + response.error().message() );

    auto value = program::decode_output< std::uint64_t >( *response );
    if( !value )
      throw std::runtime_error( "query returned a malformed result" );

    return *value;
  }

  void report()
  {
    auto coin_of = [ & ]( const protocol::account& owner )
    {
      return query( constants::coin_account, program::make_input( program::token::instruction::balance_of, owner ) );
    };

    auto synthetic_of = [ & ]( const protocol::account& owner )
    {
      return query( constants::wrapper_account, program::make_input( program::token::instruction::balance_of, owner ) );
    };

    for( const auto& [ name, account ]: _users )
      std::cout << name << ": coin " << coin_of( account ) << ", synthetic " << synthetic_of( account ) << ", custody "
                << coin_of( protocol::derived_program( constants::wrapper_account, account ) ) << '\n';

    auto supply  = query( constants::wrapper_account, program::make_input( program::token::instruction::total_supply ) );
    auto reserve = coin_of( constants::wrapper_account );

    std::cout << "synthetic supply " << supply << ", wrapper reserve " << reserve << '\n';

    if( supply != reserve )
      LOG_CRITICAL( wrapcoin::log::instance(), "Synthetic supply {} is not backed by reserve {}", supply, reserve );
  }

  controller::controller& _controller;
  protocol::account _issuer;
  std::map< std::string, protocol::account > _users;
};

} // namespace

int main( int argc, char** argv )
{
  std::string log_level, coin_name, coin_symbol, wrapper_name, wrapper_symbol, issuer_name;
  std::uint64_t stack_limit = 0, coin_decimals = 0;
  std::filesystem::path script_file;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::version_option.data()       , "Print version string and exit" )
      ( constants::basedir_option.data()       , program_options::value< std::string >()->default_value( constants::basedir_default ), "Wrapcoin base directory" )
      ( constants::log_level_option.data()     , program_options::value< std::string >()  , "The log filtering level" )
      ( constants::stack_limit_option.data()   , program_options::value< std::uint64_t >(), "The maximum call depth" )
      ( constants::coin_name_option.data()     , program_options::value< std::string >()  , "The underlying coin name" )
      ( constants::coin_symbol_option.data()   , program_options::value< std::string >()  , "The underlying coin symbol" )
      ( constants::coin_decimals_option.data() , program_options::value< std::uint64_t >(), "The underlying coin decimals" )
      ( constants::wrapper_name_option.data()  , program_options::value< std::string >()  , "The synthetic token name" )
      ( constants::wrapper_symbol_option.data(), program_options::value< std::string >()  , "The synthetic token symbol" )
      ( constants::issuer_option.data()        , program_options::value< std::string >()  , "The user allowed to mint the underlying coin" )
      ( constants::script_option.data()        , program_options::value< std::string >()  , "The transaction script (absolute path or relative to basedir)" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( option_key( constants::help_option ) ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( option_key( constants::version_option ) ) )
    {
      std::cout << version_string() << "\n";
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ option_key( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node wrapcoin_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
    {
      yaml_config = basedir / "config.yaml";
    }

    if( std::filesystem::exists( yaml_config ) )
    {
      config          = YAML::LoadFile( yaml_config.string() );
      global_config   = config[ "global" ];
      wrapcoin_config = config[ constants::service ];
    }

    // clang-format off
    log_level      = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, wrapcoin_config, global_config );
    stack_limit    = get_option< std::uint64_t >( constants::stack_limit_option, constants::stack_limit_default, args, wrapcoin_config, global_config );
    coin_name      = get_option< std::string >( constants::coin_name_option, constants::coin_name_default, args, wrapcoin_config, global_config );
    coin_symbol    = get_option< std::string >( constants::coin_symbol_option, constants::coin_symbol_default, args, wrapcoin_config, global_config );
    coin_decimals  = get_option< std::uint64_t >( constants::coin_decimals_option, constants::coin_decimals_default, args, wrapcoin_config, global_config );
    wrapper_name   = get_option< std::string >( constants::wrapper_name_option, constants::wrapper_name_default, args, wrapcoin_config, global_config );
    wrapper_symbol = get_option< std::string >( constants::wrapper_symbol_option, constants::wrapper_symbol_default, args, wrapcoin_config, global_config );
    issuer_name    = get_option< std::string >( constants::issuer_option, constants::issuer_default, args, wrapcoin_config, global_config );
    script_file    = std::filesystem::path( get_option< std::string >( constants::script_option, constants::script_default, args, wrapcoin_config, global_config ) );
    // clang-format on

    wrapcoin::log::initialize( log_level );

    LOG_INFO( wrapcoin::log::instance(), "{}", version_string() );

    if( config.IsNull() )
    {
      LOG_WARNING( wrapcoin::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );
    }

    if( coin_decimals > std::numeric_limits< std::uint32_t >::max() )
      throw std::runtime_error( "coin decimals must fit in 32 bits" );

    if( script_file.is_relative() )
      script_file = basedir / script_file;

    if( !std::filesystem::exists( script_file ) )
      throw std::runtime_error( "unable to locate script file at " + script_file.string() );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;

  try
  {
    controller::controller controller( stack_limit );

    auto issuer = protocol::user_account( crypto::hash( issuer_name ) );

    auto& registry = controller.registry();
    registry.emplace_program(
      constants::coin_account,
      std::make_unique< program::coin >( issuer, coin_name, coin_symbol, static_cast< std::uint32_t >( coin_decimals ) ) );
    registry.emplace_program(
      constants::wrapper_account,
      std::make_unique< program::wrapper >( constants::coin_account, wrapper_name, wrapper_symbol ) );
    registry.emplace_code( program::custody::code_name, std::make_unique< program::custody >() );

    controller.open( {} );

    LOG_INFO( wrapcoin::log::instance(), "Applying script {}", script_file.string() );

    script_runner runner( controller, issuer );
    runner.run( YAML::LoadFile( script_file.string() ) );

    controller.close();
  }
  catch( const YAML::Exception& e )
  {
    LOG_CRITICAL( wrapcoin::log::instance(), "Malformed script: {}", e.what() );
    retcode = EXIT_FAILURE;
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( wrapcoin::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  LOG_INFO( wrapcoin::log::instance(), "Shut down gracefully" );

  return retcode;
}

const std::string& version_string()
{
  static std::string v_str = "Wrapcoin Ledger v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                             + std::to_string( PROJECT_MINOR_VERSION ) + "." + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}
