#include <wrapcoin/state_db/database.hpp>

#include <stdexcept>

namespace wrapcoin::state_db {

database::~database()
{
  close();
}

void database::open( const genesis_init_function& init )
{
  if( _root )
    throw std::runtime_error( "database is already open" );

  auto root = std::make_shared< state_node >( std::make_shared< state_delta >() );

  if( init )
    init( root );

  _root = root;
}

void database::close()
{
  _root.reset();
}

state_node_ptr database::head() const
{
  if( !_root )
    throw std::runtime_error( "database is not open" );

  return _root;
}

} // namespace wrapcoin::state_db
