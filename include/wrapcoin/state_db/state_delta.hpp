#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace wrapcoin::state_db {

/*
 * A state delta holds the objects written and removed on top of its parent.
 * Reads fall through to the parent chain. A child delta is either squashed
 * into its parent or dropped, which discards every write made in it.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  state_delta() noexcept = default;
  explicit state_delta( const std::shared_ptr< state_delta >& parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  void put( std::vector< std::byte >&& key, std::span< const std::byte > value );
  void remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  std::shared_ptr< state_delta > make_child();
  void squash();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const noexcept;
  std::uint64_t revision() const noexcept;
  const std::shared_ptr< state_delta >& parent() const noexcept;

private:
  std::shared_ptr< state_delta > _parent;
  std::map< std::vector< std::byte >, std::vector< std::byte > > _objects;
  std::set< std::vector< std::byte > > _removed_objects;
  std::uint64_t _revision = 0;
  bool _squashed          = false;
};

} // namespace wrapcoin::state_db
