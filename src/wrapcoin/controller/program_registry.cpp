#include <wrapcoin/controller/program_registry.hpp>

#include <stdexcept>

namespace wrapcoin::controller {

void program_registry::emplace_program( const protocol::account& id, std::unique_ptr< program::program > p )
{
  if( !id.program() )
    throw std::invalid_argument( "native programs must be bound to a program account" );

  if( !p )
    throw std::invalid_argument( "program is null" );

  if( !_programs.emplace( id, std::move( p ) ).second )
    throw std::invalid_argument( "a program is already bound to the account" );
}

void program_registry::emplace_code( std::string_view name, std::unique_ptr< program::program > p )
{
  if( name.empty() )
    throw std::invalid_argument( "program code name is empty" );

  if( !p )
    throw std::invalid_argument( "program is null" );

  if( !_codes.emplace( std::string( name ), std::move( p ) ).second )
    throw std::invalid_argument( "program code is already registered" );
}

program::program* program_registry::find_program( protocol::account_view id ) const
{
  if( auto itr = _programs.find( protocol::account_cast( id ) ); itr != _programs.end() )
    return itr->second.get();

  return nullptr;
}

program::program* program_registry::find_code( std::string_view name ) const
{
  if( auto itr = _codes.find( name ); itr != _codes.end() )
    return itr->second.get();

  return nullptr;
}

} // namespace wrapcoin::controller
