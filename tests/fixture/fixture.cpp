// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/endian.hpp>

#include <wrapcoin/controller.hpp>
#include <wrapcoin/crypto.hpp>
#include <wrapcoin/encode.hpp>
#include <wrapcoin/log.hpp>
#include <wrapcoin/protocol.hpp>

#include <stdexcept>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  wrapcoin::log::initialize( log_level );
  LOG_INFO( wrapcoin::log::instance(), "Starting {} fixture", name );

  _controller = std::make_unique< wrapcoin::controller::controller >();

  auto& registry = _controller->registry();
  registry.emplace_program( _coin, std::make_unique< wrapcoin::program::coin >( _issuer ) );
  registry.emplace_program( _wrapper, std::make_unique< wrapcoin::program::wrapper >( _coin ) );
  registry.emplace_code( wrapcoin::program::custody::code_name, std::make_unique< wrapcoin::program::custody >() );

  registry.emplace_program( _reentrant_coin, std::make_unique< test::reentrant_coin >( _issuer, _reentrant_wrapper ) );
  registry.emplace_program( _reentrant_wrapper, std::make_unique< wrapcoin::program::wrapper >( _reentrant_coin ) );
  registry.emplace_program( _counterfeit_coin, std::make_unique< test::counterfeit_coin >( _issuer ) );
  registry.emplace_program( _counterfeit_wrapper, std::make_unique< wrapcoin::program::wrapper >( _counterfeit_coin ) );
  registry.emplace_program( _rewrapping_coin,
                            std::make_unique< test::rewrapping_coin >( _issuer, _rewrapping_wrapper, user( "alice" ) ) );
  registry.emplace_program( _rewrapping_wrapper, std::make_unique< wrapcoin::program::wrapper >( _rewrapping_coin ) );
  registry.emplace_program( _recursive, std::make_unique< test::recursive_program >() );
  registry.emplace_program( _throwing, std::make_unique< test::throwing_program >() );

  _controller->open( _genesis_data );
}

fixture::~fixture()
{
  _controller->close();
}

void fixture::reset( const wrapcoin::controller::state::genesis_data& data )
{
  _genesis_data = data;
  _controller->close();
  _controller->open( _genesis_data );
}

wrapcoin::protocol::account fixture::user( std::string_view name )
{
  return wrapcoin::protocol::user_account( wrapcoin::crypto::hash( name ) );
}

wrapcoin::protocol::operation fixture::make_call_operation( const wrapcoin::protocol::account& id,
                                                            std::vector< std::byte >&& stdin )
{
  wrapcoin::protocol::call_program op;
  op.id          = id;
  op.input.stdin = std::move( stdin );
  return op;
}

wrapcoin::protocol::operation fixture::make_mint_operation( const wrapcoin::protocol::account& id,
                                                            const wrapcoin::protocol::account& to,
                                                            std::uint64_t amount )
{
  return make_call_operation( id, make_stdin( wrapcoin::program::coin::instruction::mint, to, amount ) );
}

wrapcoin::protocol::operation fixture::make_transfer_operation( const wrapcoin::protocol::account& id,
                                                                const wrapcoin::protocol::account& from,
                                                                const wrapcoin::protocol::account& to,
                                                                std::uint64_t amount )
{
  return make_call_operation( id, make_stdin( wrapcoin::program::token::instruction::transfer, from, to, amount ) );
}

wrapcoin::protocol::operation fixture::make_create_custody_account_operation( const wrapcoin::protocol::account& id,
                                                                              const wrapcoin::protocol::account& user )
{
  return make_call_operation( id, make_stdin( wrapcoin::program::wrapper::instruction::create_custody_account, user ) );
}

wrapcoin::protocol::operation fixture::make_wrap_operation( const wrapcoin::protocol::account& id,
                                                            const wrapcoin::protocol::account& user,
                                                            std::uint64_t amount )
{
  return make_call_operation( id, make_stdin( wrapcoin::program::wrapper::instruction::wrap, user, amount ) );
}

wrapcoin::protocol::operation fixture::make_unwrap_operation( const wrapcoin::protocol::account& id,
                                                              const wrapcoin::protocol::account& user,
                                                              std::uint64_t amount )
{
  return make_call_operation( id, make_stdin( wrapcoin::program::wrapper::instruction::unwrap, user, amount ) );
}

wrapcoin::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                       std::vector< std::string >&& arguments ) const noexcept
{
  wrapcoin::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

std::uint64_t fixture::balance_of( const wrapcoin::protocol::account& token,
                                   const wrapcoin::protocol::account& owner ) const
{
  auto response = _controller->read_program(
    token,
    make_input( make_stdin( wrapcoin::program::token::instruction::balance_of, owner ) ) );

  if( !response )
    throw std::runtime_error( "balance_of failed: " + response.error().message() );

  auto balance = wrapcoin::program::decode_output< std::uint64_t >( *response );
  if( !balance )
    throw std::runtime_error( "balance_of returned a malformed result" );

  return *balance;
}

std::uint64_t fixture::total_supply( const wrapcoin::protocol::account& token ) const
{
  auto response =
    _controller->read_program( token, make_input( make_stdin( wrapcoin::program::token::instruction::total_supply ) ) );

  if( !response )
    throw std::runtime_error( "total_supply failed: " + response.error().message() );

  auto supply = wrapcoin::program::decode_output< std::uint64_t >( *response );
  if( !supply )
    throw std::runtime_error( "total_supply returned a malformed result" );

  return *supply;
}

wrapcoin::protocol::account fixture::custody_account_of( const wrapcoin::protocol::account& wrapper,
                                                         const wrapcoin::protocol::account& user ) const
{
  auto response = _controller->read_program(
    wrapper,
    make_input( make_stdin( wrapcoin::program::wrapper::instruction::custody_account_of, user ) ) );

  if( !response )
    throw std::runtime_error( "custody_account_of failed: " + response.error().message() );

  auto account = wrapcoin::program::decode_output< wrapcoin::protocol::account >( *response );
  if( !account )
    throw std::runtime_error( "custody_account_of returned a malformed result" );

  return *account;
}

bool fixture::verify( wrapcoin::controller::result< wrapcoin::protocol::transaction_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( wrapcoin::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( wrapcoin::log::instance(),
                 "Transaction ID {} was reverted: {}",
                 wrapcoin::log::hex{ receipt->id.data(), receipt->id.size() },
                 receipt->error.message() );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND
