#include <wrapcoin/program/custody.hpp>
#include <wrapcoin/program/io.hpp>
#include <wrapcoin/program/wrapper.hpp>

#include <utility>

namespace wrapcoin::program {

wrapper::wrapper( const protocol::account& underlying, std::string name, std::string symbol ):
    token( std::move( name ), std::move( symbol ), 0 ),
    _underlying( underlying )
{}

std::error_code wrapper::dispatch( system_interface* system, std::uint32_t instr )
{
  switch( instr )
  {
    case std::to_underlying( instruction::create_custody_account ):
      {
        protocol::account user;

        if( auto error = read_input( system, user ); error )
          return error;

        return create_custody_account( system, user );
      }
    case std::to_underlying( instruction::custody_account_of ):
      {
        protocol::account user;

        if( auto error = read_input( system, user ); error )
          return error;

        auto account = custody_account_of( system, user );
        if( !account )
          return account.error();

        return write_output( system, *account );
      }
    case std::to_underlying( instruction::wrap ):
      {
        protocol::account user;
        std::uint64_t value = 0;

        if( auto error = read_input( system, user ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        return wrap( system, user, value );
      }
    case std::to_underlying( instruction::unwrap ):
      {
        protocol::account user;
        std::uint64_t value = 0;

        if( auto error = read_input( system, user ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        return unwrap( system, user, value );
      }
    case std::to_underlying( instruction::underlying ):
      {
        return write_output( system, _underlying );
      }
    default:
      return token::dispatch( system, instr );
  }
}

result< protocol::account > wrapper::custody_account_of( system_interface* system, protocol::account_view user )
{
  auto object = system->get_object( custody_registry_id, user );
  if( object.empty() )
    return protocol::null_account;

  if( object.size() != protocol::account_length )
    return std::unexpected( program_errc::unexpected_object );

  return memory::bit_cast< protocol::account >( object );
}

result< std::uint64_t > wrapper::underlying_balance( system_interface* system, protocol::account_view owner )
{
  auto output = system->call_program( _underlying, make_input( token::instruction::balance_of, owner ) );
  if( !output )
    return std::unexpected( output.error() );

  return decode_output< std::uint64_t >( *output );
}

std::error_code wrapper::create_custody_account( system_interface* system, const protocol::account& user )
{
  if( auto permitted = authorized( system, user ); !permitted )
    return permitted.error();
  else if( !*permitted )
    return program_errc::unauthorized;

  auto existing = custody_account_of( system, user );
  if( !existing )
    return existing.error();

  if( !existing->null() )
    return program_errc::already_exists;

  // The registry entry is written before any call leaves the wrapper
  auto account = protocol::derived_program( self_account( system ), user );

  if( auto error = system->put_object( custody_registry_id, user, account ); error )
    return error;

  auto created = system->create_program( custody::code_name, user );
  if( !created )
    return created.error();

  if( *created != account )
    return program_errc::unexpected_object;

  if( auto output = system->call_program( account, make_input( custody::instruction::initialize ) ); !output )
    return output.error();

  return system->event( "custody_account_created", make_input( user, account ), { user, account } );
}

std::error_code wrapper::wrap( system_interface* system, const protocol::account& user, std::uint64_t value )
{
  if( value == 0 )
    return program_errc::invalid_amount;

  if( auto permitted = authorized( system, user ); !permitted )
    return permitted.error();
  else if( !*permitted )
    return program_errc::unauthorized;

  auto custody_account = custody_account_of( system, user );
  if( !custody_account )
    return custody_account.error();

  if( custody_account->null() )
    return program_errc::no_custody_account;

  auto deposited = underlying_balance( system, *custody_account );
  if( !deposited )
    return deposited.error();

  if( *deposited < value )
    return program_errc::insufficient_custody_funds;

  auto self = self_account( system );

  auto reserve = underlying_balance( system, self );
  if( !reserve )
    return reserve.error();

  auto supply = total_supply( system );
  if( !supply )
    return supply.error();

  if( auto output =
        system->call_program( *custody_account, make_input( custody::instruction::collect, _underlying, value ) );
      !output )
    return output.error();

  // Mint only what actually arrived, and only if nothing was minted against
  // it while the collection was in flight
  auto collected = underlying_balance( system, self );
  if( !collected )
    return collected.error();

  auto supply_after = total_supply( system );
  if( !supply_after )
    return supply_after.error();

  if( *supply_after != *supply )
    return program_errc::collection_shortfall;

  if( *collected < *reserve || *collected - *reserve < value )
    return program_errc::collection_shortfall;

  if( auto error = mint( system, user, value ); error )
    return error;

  return system->event( "wrapped", make_input( value, user ), { user } );
}

std::error_code wrapper::unwrap( system_interface* system, const protocol::account& user, std::uint64_t value )
{
  if( value == 0 )
    return program_errc::invalid_amount;

  if( auto permitted = authorized( system, user ); !permitted )
    return permitted.error();
  else if( !*permitted )
    return program_errc::unauthorized;

  auto balance = balance_of( system, user );
  if( !balance )
    return balance.error();

  if( *balance < value )
    return program_errc::insufficient_synthetic_balance;

  // Burn before the coin is released so a reentrant unwrap sees the reduced balance
  if( auto error = burn( system, user, value ); error )
    return error;

  auto self = self_account( system );

  auto reserve = underlying_balance( system, self );
  if( !reserve )
    return reserve.error();

  if( *reserve < value )
    return program_errc::insufficient_wrapper_reserve;

  if( auto output = system->call_program( _underlying, make_input( token::instruction::transfer, self, user, value ) );
      !output )
    return output.error();

  return system->event( "unwrapped", make_input( value, user ), { user } );
}

} // namespace wrapcoin::program
