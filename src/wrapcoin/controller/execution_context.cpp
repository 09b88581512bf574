#include <algorithm>
#include <expected>
#include <ranges>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/endian.hpp>
#include <boost/locale/utf.hpp>

#include <wrapcoin/controller/execution_context.hpp>
#include <wrapcoin/controller/state.hpp>
#include <wrapcoin/log.hpp>
#include <wrapcoin/memory.hpp>

namespace wrapcoin::controller {

constexpr auto event_name_limit = 128;

// Every program answers authority queries at instruction 0
constexpr std::uint32_t authorize_entry_point = 0;

template< typename T >
bool validate_utf( std::basic_string_view< T > str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< T >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

execution_context::execution_context( const program_registry& registry,
                                      std::size_t stack_limit,
                                      intent i ):
    _registry( &registry ),
    _stack( stack_limit ),
    _intent( i )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::clear_state_node()
{
  _state_node.reset();
}

chronicler& execution_context::chronicler() noexcept
{
  return _chronicler;
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _transaction = &transaction;

  if( auto authorized = check_authority( transaction.payer ); authorized )
  {
    if( !authorized.value() )
      return std::unexpected( controller_errc::authorization_failure );
  }
  else
  {
    return std::unexpected( authorized.error() );
  }

  if( account_nonce( transaction.payer ) + 1 != transaction.nonce )
    return std::unexpected( controller_errc::invalid_nonce );

  // The nonce is consumed even when the operations revert
  set_account_nonce( transaction.payer, transaction.nonce );

  auto transaction_node = _state_node;

  auto error = [ & ]() -> std::error_code
  {
    auto operation_node = transaction_node->make_child();
    _state_node         = operation_node;

    for( const auto& o: transaction.operations )
      if( auto error = apply( o ); error )
        return error;

    operation_node->squash();
    return controller_errc::ok;
  }();

  _state_node = transaction_node;

  protocol::transaction_receipt receipt;

  if( error )
  {
    if( error.category() == reversion_category() || error.category() == program::program_category() )
    {
      receipt.reverted = true;
      receipt.error    = error;
      _chronicler.rollback( 0 );
      _chronicler.push_log( "transaction reverted: " + error.message() );
    }
    else
    {
      return std::unexpected( error );
    }
  }

  receipt.id     = transaction.id;
  receipt.payer  = transaction.payer;
  receipt.nonce  = transaction.nonce;
  receipt.events = _chronicler.events();
  receipt.logs   = _chronicler.logs();

  return receipt;
}

std::error_code execution_context::apply( const protocol::call_program& op )
{
  auto result = call_program( op.id, op.input.stdin, op.input.arguments );

  if( !result )
    return result.error();

  return controller_errc::ok;
}

std::uint64_t execution_context::account_nonce( protocol::account_view account ) const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto nonce_bytes = _state_node->get( state::space::transaction_nonce(), account ); nonce_bytes )
  {
    auto nonce = memory::bit_cast< std::uint64_t >( *nonce_bytes );
    boost::endian::little_to_native_inplace( nonce );
    return nonce;
  }

  return 0;
}

void execution_context::set_account_nonce( protocol::account_view account, std::uint64_t nonce )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  boost::endian::native_to_little_inplace( nonce );
  _state_node->put( state::space::transaction_nonce(), account, memory::as_bytes( nonce ) );
}

std::span< const std::string > execution_context::arguments()
{
  return _stack.current().arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = _stack.current().stdout;
    output.insert( output.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    auto& error = _stack.current().stderr;
    error.insert( error.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  auto& frame = _stack.current();

  if( frame.stdin.size() < buffer.size() )
    return reversion_errc::end_of_input;

  std::ranges::copy( frame.stdin.first( buffer.size() ), buffer.begin() );
  frame.stdin = frame.stdin.subspan( buffer.size() );

  return reversion_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id )
{
  return state::space::program_object( _stack.current().program_id, id );
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

void execution_context::log( std::string_view message )
{
  _chronicler.push_log( std::string( message ) );
}

std::error_code execution_context::event( std::string_view name,
                                          std::span< const std::byte > data,
                                          const std::vector< protocol::account >& impacted )
{
  if( name.empty() )
    return reversion_errc::invalid_event_name;

  if( name.size() > event_name_limit )
    return reversion_errc::invalid_event_name;

  if( !validate_utf( name ) )
    return reversion_errc::invalid_event_name;

  protocol::event event;
  event.source   = _stack.current().program_id;
  event.name     = std::string( name );
  event.data     = std::vector( data.begin(), data.end() );
  event.impacted = impacted;

  _chronicler.push_event( std::move( event ) );

  return reversion_errc::ok;
}

result< bool > execution_context::check_authority( protocol::account_view account )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  if( account.program() )
  {
    auto output = call_program( account, program::make_input( authorize_entry_point ) );
    if( !output )
      return std::unexpected( output.error() );

    if( output->stdout.size() != sizeof( bool ) )
      return std::unexpected( reversion_errc::failure );

    return output->stdout.front() != std::byte{ 0x00 };
  }

  // User accounts authorize by signing the transaction
  if( _transaction == nullptr )
    throw std::runtime_error( "transaction required for check authority" );

  return std::ranges::any_of( _transaction->authorizations,
                              [ & ]( const protocol::account& signer )
                              {
                                return std::ranges::equal( signer, account );
                              } );
}

std::span< const std::byte > execution_context::get_caller()
{
  if( _stack.depth() < 2 )
    return std::span< const std::byte >{};

  return _stack.current().caller;
}

std::span< const std::byte > execution_context::get_self()
{
  return _stack.current().program_id;
}

program::program* execution_context::resolve_program( protocol::account_view account ) const
{
  if( auto p = _registry->find_program( account ); p )
    return p;

  if( auto code = _state_node->get( state::space::program_data(), account ); code )
    return _registry->find_code( memory::as_string_view( *code ) );

  return nullptr;
}

std::error_code execution_context::execute( program::program& p )
{
  try
  {
    return p.run( this, _stack.current().arguments );
  }
  catch( const std::exception& e )
  {
    const auto& id = _stack.current().program_id;
    LOG_WARNING( log::instance(), "Program {} failed with exception: {}", log::hex{ id.data(), id.size() }, e.what() );
  }

  return reversion_errc::failure;
}

result< protocol::program_output > execution_context::call_program( protocol::account_view account,
                                                                    std::span< const std::byte > stdin,
                                                                    std::span< const std::string > arguments )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( !account.program() )
    return std::unexpected( reversion_errc::invalid_program );

  auto program = resolve_program( account );
  if( !program )
    return std::unexpected( reversion_errc::invalid_program );

  scoped_frame frame( _stack, account, arguments, stdin );
  if( frame.error() )
    return std::unexpected( frame.error() );

  // Each call runs in its own state node and only lands in the caller's
  // state when it succeeds
  auto parent_node = _state_node;
  auto checkpoint  = _chronicler.checkpoint();
  _state_node      = parent_node->make_child();

  auto error     = execute( *program );
  auto call_node = std::exchange( _state_node, parent_node );

  if( error )
  {
    _chronicler.rollback( checkpoint );
    return std::unexpected( error );
  }

  call_node->squash();

  auto& output = _stack.current();
  return protocol::program_output{ .code = 0, .stdout = std::move( output.stdout ), .stderr = std::move( output.stderr ) };
}

result< protocol::account > execution_context::create_program( std::string_view code, std::span< const std::byte > salt )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  if( !_registry->find_code( code ) )
    return std::unexpected( reversion_errc::invalid_program );

  auto address = protocol::derived_program( _stack.current().program_id, salt );

  if( _registry->find_program( address ) || _state_node->get( state::space::program_data(), address ) )
    return std::unexpected( reversion_errc::program_exists );

  _state_node->put( state::space::program_data(), address, memory::as_bytes( code ) );

  LOG_DEBUG( log::instance(),
             "Created {} program {}",
             code,
             log::hex{ address.data(), address.size() } );

  return address;
}

} // namespace wrapcoin::controller
