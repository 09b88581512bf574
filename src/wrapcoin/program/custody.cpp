#include <wrapcoin/program/custody.hpp>
#include <wrapcoin/program/io.hpp>
#include <wrapcoin/program/token.hpp>

#include <algorithm>
#include <utility>

namespace wrapcoin::program {

result< protocol::account > custody::controller( system_interface* system )
{
  auto object = system->get_object( controller_id, std::span< const std::byte >{} );
  if( object.empty() )
    return protocol::null_account;

  if( object.size() != protocol::account_length )
    return std::unexpected( program_errc::unexpected_object );

  return memory::bit_cast< protocol::account >( object );
}

std::error_code custody::run( system_interface* system, std::span< const std::string > )
{
  std::uint32_t instr = 0;

  if( auto error = read_input( system, instr ); error )
    return error;

  switch( instr )
  {
    case std::to_underlying( instruction::authorize ):
      {
        return write_output( system, false );
      }
    case std::to_underlying( instruction::initialize ):
      {
        auto current = controller( system );
        if( !current )
          return current.error();

        if( !current->null() )
          return program_errc::already_initialized;

        auto caller = system->get_caller();
        if( caller.size() != protocol::account_length )
          return program_errc::unauthorized;

        return system->put_object( controller_id, std::span< const std::byte >{}, caller );
      }
    case std::to_underlying( instruction::controller ):
      {
        auto current = controller( system );
        if( !current )
          return current.error();

        return write_output( system, *current );
      }
    case std::to_underlying( instruction::collect ):
      {
        protocol::account asset;
        std::uint64_t value = 0;

        if( auto error = read_input( system, asset ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        auto current = controller( system );
        if( !current )
          return current.error();

        if( current->null() || !std::ranges::equal( system->get_caller(), *current ) )
          return program_errc::unauthorized;

        auto output = system->call_program(
          asset,
          make_input( token::instruction::transfer, self_account( system ), *current, value ) );
        if( !output )
          return output.error();

        return program_errc::ok;
      }
    default:
      return program_errc::invalid_instruction;
  }
}

} // namespace wrapcoin::program
