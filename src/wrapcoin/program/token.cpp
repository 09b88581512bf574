#include <wrapcoin/program/io.hpp>
#include <wrapcoin/program/token.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace wrapcoin::program {

static std::array< std::byte, 2 * protocol::account_length > allowance_key( protocol::account_view owner,
                                                                            protocol::account_view spender )
{
  std::array< std::byte, 2 * protocol::account_length > key{};
  std::ranges::copy( owner, key.begin() );
  std::ranges::copy( spender, key.begin() + protocol::account_length );
  return key;
}

token::token( std::string name, std::string symbol, std::uint32_t decimals ):
    _name( std::move( name ) ),
    _symbol( std::move( symbol ) ),
    _decimals( decimals )
{}

std::error_code token::run( system_interface* system, std::span< const std::string > )
{
  std::uint32_t instruction = 0;

  if( auto error = read_input( system, instruction ); error )
    return error;

  return dispatch( system, instruction );
}

std::error_code token::dispatch( system_interface* system, std::uint32_t instr )
{
  switch( instr )
  {
    case std::to_underlying( instruction::authorize ):
      {
        return write_output( system, false );
      }
    case std::to_underlying( instruction::name ):
      {
        return write_output( system, std::string_view( _name ) );
      }
    case std::to_underlying( instruction::symbol ):
      {
        return write_output( system, std::string_view( _symbol ) );
      }
    case std::to_underlying( instruction::decimals ):
      {
        return write_output( system, _decimals );
      }
    case std::to_underlying( instruction::total_supply ):
      {
        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        return write_output( system, *supply );
      }
    case std::to_underlying( instruction::balance_of ):
      {
        protocol::account owner;

        if( auto error = read_input( system, owner ); error )
          return error;

        auto balance = balance_of( system, owner );
        if( !balance )
          return balance.error();

        return write_output( system, *balance );
      }
    case std::to_underlying( instruction::transfer ):
      {
        protocol::account from;
        protocol::account to;
        std::uint64_t value = 0;

        if( auto error = read_input( system, from ); error )
          return error;

        if( auto error = read_input( system, to ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        if( from == to )
          return program_errc::invalid_argument;

        if( auto permitted = authorized( system, from ); !permitted )
          return permitted.error();
        else if( !*permitted )
          return program_errc::unauthorized;

        return transfer( system, from, to, value );
      }
    case std::to_underlying( instruction::allowance ):
      {
        protocol::account owner;
        protocol::account spender;

        if( auto error = read_input( system, owner ); error )
          return error;

        if( auto error = read_input( system, spender ); error )
          return error;

        auto value = allowance( system, owner, spender );
        if( !value )
          return value.error();

        return write_output( system, *value );
      }
    case std::to_underlying( instruction::approve ):
      {
        protocol::account owner;
        protocol::account spender;
        std::uint64_t value = 0;

        if( auto error = read_input( system, owner ); error )
          return error;

        if( auto error = read_input( system, spender ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        if( auto permitted = authorized( system, owner ); !permitted )
          return permitted.error();
        else if( !*permitted )
          return program_errc::unauthorized;

        auto key = allowance_key( owner, spender );

        if( auto error = put_uint64( system, allowance_id, key, value ); error )
          return error;

        return system->event( "approval", make_input( owner, spender, value ), { owner, spender } );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        protocol::account spender;
        protocol::account from;
        protocol::account to;
        std::uint64_t value = 0;

        if( auto error = read_input( system, spender ); error )
          return error;

        if( auto error = read_input( system, from ); error )
          return error;

        if( auto error = read_input( system, to ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        if( from == to )
          return program_errc::invalid_argument;

        if( auto permitted = authorized( system, spender ); !permitted )
          return permitted.error();
        else if( !*permitted )
          return program_errc::unauthorized;

        auto approved = allowance( system, from, spender );
        if( !approved )
          return approved.error();

        if( *approved < value )
          return program_errc::insufficient_allowance;

        auto key = allowance_key( from, spender );

        if( auto error = put_uint64( system, allowance_id, key, *approved - value ); error )
          return error;

        return transfer( system, from, to, value );
      }
    default:
      return program_errc::invalid_instruction;
  }
}

result< std::uint64_t > token::total_supply( system_interface* system )
{
  return get_uint64( system, supply_id, std::span< const std::byte >{} );
}

result< std::uint64_t > token::balance_of( system_interface* system, protocol::account_view owner )
{
  return get_uint64( system, balance_id, owner );
}

result< std::uint64_t >
token::allowance( system_interface* system, protocol::account_view owner, protocol::account_view spender )
{
  return get_uint64( system, allowance_id, allowance_key( owner, spender ) );
}

std::error_code
token::transfer( system_interface* system, protocol::account_view from, protocol::account_view to, std::uint64_t value )
{
  auto from_balance = balance_of( system, from );
  if( !from_balance )
    return from_balance.error();

  if( *from_balance < value )
    return program_errc::insufficient_balance;

  if( auto error = put_uint64( system, balance_id, from, *from_balance - value ); error )
    return error;

  // Read after the debit so a transfer to self nets to zero
  auto to_balance = balance_of( system, to );
  if( !to_balance )
    return to_balance.error();

  if( auto error = put_uint64( system, balance_id, to, *to_balance + value ); error )
    return error;

  return system->event( "transfer",
                        make_input( from, to, value ),
                        { protocol::account_cast( from ), protocol::account_cast( to ) } );
}

std::error_code token::mint( system_interface* system, protocol::account_view to, std::uint64_t value )
{
  auto supply = total_supply( system );
  if( !supply )
    return supply.error();

  if( std::numeric_limits< std::uint64_t >::max() - value < *supply )
    return program_errc::overflow;

  auto to_balance = balance_of( system, to );
  if( !to_balance )
    return to_balance.error();

  if( auto error = put_uint64( system, supply_id, std::span< const std::byte >{}, *supply + value ); error )
    return error;

  if( auto error = put_uint64( system, balance_id, to, *to_balance + value ); error )
    return error;

  return system->event( "mint", make_input( to, value ), { protocol::account_cast( to ) } );
}

std::error_code token::burn( system_interface* system, protocol::account_view from, std::uint64_t value )
{
  auto from_balance = balance_of( system, from );
  if( !from_balance )
    return from_balance.error();

  if( *from_balance < value )
    return program_errc::insufficient_balance;

  auto supply = total_supply( system );
  if( !supply )
    return supply.error();

  if( *supply < value )
    return program_errc::insufficient_supply;

  if( auto error = put_uint64( system, supply_id, std::span< const std::byte >{}, *supply - value ); error )
    return error;

  if( auto error = put_uint64( system, balance_id, from, *from_balance - value ); error )
    return error;

  return system->event( "burn", make_input( from, value ), { protocol::account_cast( from ) } );
}

} // namespace wrapcoin::program
