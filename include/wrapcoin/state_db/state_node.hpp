#pragma once

#include <wrapcoin/state_db/state_delta.hpp>
#include <wrapcoin/state_db/types.hpp>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace wrapcoin::state_db {

/**
 * Serialize an object space and key into a single state key. The space is
 * written field by field, the id little endian.
 */
std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key );

class state_node final
{
public:
  explicit state_node( const std::shared_ptr< state_delta >& delta ) noexcept;
  state_node( const state_node& node ) = delete;
  state_node( state_node&& node )      = delete;
  ~state_node()                        = default;

  state_node& operator=( const state_node& node ) = delete;
  state_node& operator=( state_node&& node )      = delete;

  /**
   * Fetch an object if one exists.
   *
   * The returned span is valid until the object is next written or removed.
   */
  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  /**
   * Write an object into the state node.
   */
  void put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value );

  /**
   * Remove an object from the state node.
   */
  void remove( const object_space& space, std::span< const std::byte > key );

  /**
   * Returns a child state node with this node as its parent.
   */
  state_node_ptr make_child();

  /**
   * Squash the node in to the parent node. This call invalidates this state node.
   */
  void squash();

  /**
   * Returns the revision of the state node.
   */
  std::uint64_t revision() const noexcept;

private:
  std::shared_ptr< state_delta > _delta;
};

} // namespace wrapcoin::state_db
