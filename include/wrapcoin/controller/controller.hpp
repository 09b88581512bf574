#pragma once

#include <wrapcoin/controller/error.hpp>
#include <wrapcoin/controller/program_registry.hpp>
#include <wrapcoin/controller/state.hpp>
#include <wrapcoin/protocol.hpp>
#include <wrapcoin/state_db.hpp>

#include <cstddef>
#include <cstdint>

namespace wrapcoin::controller {

class controller
{
public:
  static constexpr std::size_t default_stack_limit = 32;

  explicit controller( std::size_t stack_limit = default_stack_limit );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Programs must be registered before any transaction refers to them.
   */
  program_registry& registry() noexcept;

  void open( const state::genesis_data& data );
  void close();

  /**
   * Apply a transaction to head. A transaction whose operations fail is
   * still applied, its receipt is marked reverted and only the nonce is
   * consumed. Rejected transactions leave head untouched.
   */
  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  result< protocol::program_output > read_program( const protocol::account& account,
                                                   const protocol::program_input& input = {} ) const;

  std::uint64_t account_nonce( const protocol::account& account ) const;

private:
  state_db::database _db;
  program_registry _registry;
  std::size_t _stack_limit;
};

} // namespace wrapcoin::controller
