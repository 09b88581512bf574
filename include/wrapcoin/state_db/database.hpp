#pragma once

#include <wrapcoin/state_db/state_node.hpp>

namespace wrapcoin::state_db {

/**
 * database owns the root of the state tree. All reads and writes happen
 * against state nodes. Work that may fail is done in a child node of the
 * head and squashed back only when it succeeds.
 *
 * database is not thread safe.
 */
class database final
{
public:
  database() noexcept = default;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database. The init function populates an empty root.
   */
  void open( const genesis_init_function& init );

  /**
   * Close the database.
   */
  void close();

  /**
   * Get and return the current "head" node.
   *
   * Throws std::runtime_error if the database is not open.
   */
  state_node_ptr head() const;

private:
  state_node_ptr _root;
};

} // namespace wrapcoin::state_db
