#include <wrapcoin/controller/state.hpp>

#include <algorithm>
#include <utility>

namespace wrapcoin::controller { namespace state {

namespace space {

namespace detail {

enum class system_space_id : std::uint32_t // NOLINT(performance-enum-size)
{
  program_data,
  transaction_nonce
};

static state_db::object_space make_system_space( system_space_id id )
{
  return state_db::object_space{ .system = true, .address = {}, .id = std::to_underlying( id ) };
}

} // namespace detail

const state_db::object_space& program_data()
{
  static const auto space = detail::make_system_space( detail::system_space_id::program_data );
  return space;
}

const state_db::object_space& transaction_nonce()
{
  static const auto space = detail::make_system_space( detail::system_space_id::transaction_nonce );
  return space;
}

state_db::object_space program_object( protocol::account_view program, std::uint32_t id )
{
  state_db::object_space space{ .system = false, .address = {}, .id = id };
  std::ranges::copy( program, space.address.begin() );
  return space;
}

} // namespace space

}} // namespace wrapcoin::controller::state
