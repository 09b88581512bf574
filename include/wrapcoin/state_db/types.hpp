#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>

#include <wrapcoin/protocol/account.hpp>

namespace wrapcoin::state_db {

class state_node;
class state_delta;

/*
 * Objects live in spaces. System spaces belong to the runtime, every other
 * space is owned by the program at `address` and addressed by `id`.
 */
struct object_space
{
  bool system = false;
  protocol::account address{};
  std::uint32_t id = 0;
};

using state_node_ptr        = std::shared_ptr< state_node >;
using genesis_init_function = std::function< void( const state_node_ptr& ) >;

} // namespace wrapcoin::state_db
