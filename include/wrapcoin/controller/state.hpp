#pragma once

#include <cstdint>
#include <vector>

#include <wrapcoin/protocol.hpp>
#include <wrapcoin/state_db.hpp>

namespace wrapcoin::controller { namespace state {

namespace space {

const state_db::object_space& program_data();
const state_db::object_space& transaction_nonce();

/*
 * The space a program sees as object id `id`.
 */
state_db::object_space program_object( protocol::account_view program, std::uint32_t id );

} // namespace space

struct genesis_entry
{
  state_db::object_space space;
  std::vector< std::byte > key;
  std::vector< std::byte > value;
};

using genesis_data = std::vector< genesis_entry >;

}} // namespace wrapcoin::controller::state
