#include <wrapcoin/state_db/state_node.hpp>

#include <algorithm>
#include <iterator>

#include <boost/endian.hpp>

#include <wrapcoin/memory.hpp>

namespace wrapcoin::state_db {

std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( bool ) + space.address.size() + sizeof( space.id ) + key.size() );

  compound_key.push_back( space.system ? std::byte{ 0x01 } : std::byte{ 0x00 } );
  std::ranges::copy( space.address, std::back_inserter( compound_key ) );

  auto id = boost::endian::native_to_little( space.id );
  std::ranges::copy( memory::as_bytes( id ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );

  return compound_key;
}

state_node::state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return _delta->get( make_compound_key( space, key ) );
}

void state_node::put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value )
{
  _delta->put( make_compound_key( space, key ), value );
}

void state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  _delta->remove( make_compound_key( space, key ) );
}

state_node_ptr state_node::make_child()
{
  return std::make_shared< state_node >( _delta->make_child() );
}

void state_node::squash()
{
  _delta->squash();
}

std::uint64_t state_node::revision() const noexcept
{
  return _delta->revision();
}

} // namespace wrapcoin::state_db
