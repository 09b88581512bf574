#include <wrapcoin/controller/controller.hpp>
#include <wrapcoin/controller/execution_context.hpp>
#include <wrapcoin/controller/state.hpp>

#include <wrapcoin/log.hpp>
#include <wrapcoin/program/error.hpp>

#include <memory>
#include <stdexcept>

namespace wrapcoin::controller {

controller::controller( std::size_t stack_limit ):
    _stack_limit( stack_limit )
{
  if( _stack_limit == 0 )
    throw std::invalid_argument( "stack limit must be greater than zero" );
}

controller::~controller()
{
  close();
}

program_registry& controller::registry() noexcept
{
  return _registry;
}

void controller::open( const state::genesis_data& data )
{
  _db.open(
    [ & ]( const state_db::state_node_ptr& root )
    {
      for( const auto& entry: data )
      {
        if( root->get( entry.space, entry.key ) )
          throw std::runtime_error( "encountered unexpected object in initial state" );

        root->put( entry.space, entry.key, entry.value );
      }
      LOG_INFO( wrapcoin::log::instance(), "Wrote {} genesis objects into new database", data.size() );
    } );
}

void controller::close()
{
  _db.close();
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  if( !transaction.validate() )
    return std::unexpected( controller_errc::malformed_transaction );

  LOG_DEBUG( wrapcoin::log::instance(),
             "Pushing transaction - ID: {}",
             wrapcoin::log::hex{ transaction.id.data(), transaction.id.size() } );

  auto head             = _db.head();
  auto transaction_node = head->make_child();

  execution_context context( _registry, _stack_limit, intent::transaction_application );
  context.set_state_node( transaction_node );

  auto receipt = context.apply( transaction );

  if( !receipt )
  {
    LOG_INFO( wrapcoin::log::instance(),
              "Transaction rejected - ID: {}, Reason: {}",
              wrapcoin::log::hex{ transaction.id.data(), transaction.id.size() },
              receipt.error().message() );
    return receipt;
  }

  transaction_node->squash();

  if( receipt->reverted )
  {
    if( receipt->error == program::program_errc::insufficient_wrapper_reserve )
      LOG_CRITICAL( wrapcoin::log::instance(),
                    "Wrapper reserve does not cover the synthetic supply - ID: {}",
                    wrapcoin::log::hex{ transaction.id.data(), transaction.id.size() } );
    else
      LOG_INFO( wrapcoin::log::instance(),
                "Transaction reverted - ID: {}, Reason: {}",
                wrapcoin::log::hex{ transaction.id.data(), transaction.id.size() },
                receipt->error.message() );
  }
  else
  {
    LOG_DEBUG( wrapcoin::log::instance(),
               "Transaction applied - ID: {} [{} event(s)]",
               wrapcoin::log::hex{ transaction.id.data(), transaction.id.size() },
               receipt->events.size() );
  }

  return receipt;
}

result< protocol::program_output > controller::read_program( const protocol::account& account,
                                                             const protocol::program_input& input ) const
{
  execution_context context( _registry, _stack_limit );
  context.set_state_node( _db.head()->make_child() );

  return context.call_program( account, input.stdin, input.arguments );
}

std::uint64_t controller::account_nonce( const protocol::account& account ) const
{
  execution_context context( _registry, _stack_limit );
  context.set_state_node( _db.head() );
  return context.account_nonce( account );
}

} // namespace wrapcoin::controller
