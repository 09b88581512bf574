#include <wrapcoin/state_db/state_delta.hpp>

#include <stdexcept>

namespace wrapcoin::state_db {

state_delta::state_delta( const std::shared_ptr< state_delta >& parent ) noexcept:
    _parent( parent ),
    _revision( parent ? parent->revision() + 1 : 0 )
{}

void state_delta::put( std::vector< std::byte >&& key, std::span< const std::byte > value )
{
  if( _squashed )
    throw std::runtime_error( "cannot modify a squashed state delta" );

  if( !root() )
    _removed_objects.erase( key );

  _objects.insert_or_assign( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

void state_delta::remove( std::vector< std::byte >&& key )
{
  if( _squashed )
    throw std::runtime_error( "cannot modify a squashed state delta" );

  _objects.erase( key );

  // The root has nothing beneath it to shadow
  if( !root() && _parent->get( key ) )
    _removed_objects.emplace( std::move( key ) );
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* delta = this; delta; delta = delta->_parent.get() )
  {
    if( auto itr = delta->_objects.find( key ); itr != delta->_objects.end() )
      return std::span< const std::byte >( itr->second );

    if( delta->removed( key ) )
      return {};
  }

  return {};
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  if( _squashed )
    throw std::runtime_error( "cannot make a child of a squashed state delta" );

  return std::make_shared< state_delta >( shared_from_this() );
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a state delta with no parent" );

  if( _squashed )
    throw std::runtime_error( "state delta has already been squashed" );

  auto& parent = *_parent;

  // A removal here hides the object in the parent. If the parent is the root
  // the object can simply be erased, otherwise the parent has to keep
  // shadowing whatever lies beneath it.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    parent._objects.erase( *itr );

    if( !parent.root() )
      parent._removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  for( auto itr = _objects.begin(); itr != _objects.end(); itr = _objects.begin() )
  {
    auto node = _objects.extract( itr );

    if( !parent.root() )
      parent._removed_objects.erase( node.key() );

    parent._objects.insert_or_assign( std::move( node.key() ), std::move( node.mapped() ) );
  }

  _squashed = true;
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const noexcept
{
  return !_parent;
}

std::uint64_t state_delta::revision() const noexcept
{
  return _revision;
}

const std::shared_ptr< state_delta >& state_delta::parent() const noexcept
{
  return _parent;
}

} // namespace wrapcoin::state_db
