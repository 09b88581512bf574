#include <wrapcoin/program/coin.hpp>
#include <wrapcoin/program/io.hpp>

#include <utility>

namespace wrapcoin::program {

coin::coin( const protocol::account& issuer, std::string name, std::string symbol, std::uint32_t decimals ):
    token( std::move( name ), std::move( symbol ), decimals ),
    _issuer( issuer )
{}

std::error_code coin::dispatch( system_interface* system, std::uint32_t instr )
{
  switch( instr )
  {
    case std::to_underlying( instruction::mint ):
      {
        protocol::account to;
        std::uint64_t value = 0;

        if( auto error = read_input( system, to ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        if( _issuer.null() )
          return program_errc::unauthorized;

        if( auto permitted = authorized( system, _issuer ); !permitted )
          return permitted.error();
        else if( !*permitted )
          return program_errc::unauthorized;

        return mint( system, to, value );
      }
    case std::to_underlying( instruction::burn ):
      {
        protocol::account from;
        std::uint64_t value = 0;

        if( auto error = read_input( system, from ); error )
          return error;

        if( auto error = read_input( system, value ); error )
          return error;

        if( auto permitted = authorized( system, from ); !permitted )
          return permitted.error();
        else if( !*permitted )
          return program_errc::unauthorized;

        return burn( system, from, value );
      }
    default:
      return token::dispatch( system, instr );
  }
}

} // namespace wrapcoin::program
