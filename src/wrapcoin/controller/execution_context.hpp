#pragma once

#include <wrapcoin/controller/call_stack.hpp>
#include <wrapcoin/controller/chronicler.hpp>
#include <wrapcoin/controller/error.hpp>
#include <wrapcoin/controller/program_registry.hpp>
#include <wrapcoin/controller/state.hpp>
#include <wrapcoin/program.hpp>
#include <wrapcoin/state_db.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wrapcoin::controller {

enum class intent : std::uint8_t
{
  read_only,
  transaction_application
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const program_registry& registry, std::size_t stack_limit, intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void clear_state_node();

  class chronicler& chronicler() noexcept;

  result< protocol::transaction_receipt > apply( const protocol::transaction& );

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  void log( std::string_view message ) final;
  std::error_code event( std::string_view name,
                         std::span< const std::byte > data,
                         const std::vector< protocol::account >& impacted ) final;

  result< bool > check_authority( protocol::account_view account ) final;

  std::span< const std::byte > get_caller() final;
  std::span< const std::byte > get_self() final;

  result< protocol::program_output > call_program( protocol::account_view account,
                                                   std::span< const std::byte > stdin,
                                                   std::span< const std::string > arguments = {} ) final;

  result< protocol::account > create_program( std::string_view code, std::span< const std::byte > salt ) final;

  std::uint64_t account_nonce( protocol::account_view ) const;

private:
  std::error_code apply( const protocol::call_program& );
  void set_account_nonce( protocol::account_view account, std::uint64_t nonce );

  state_db::object_space create_object_space( std::uint32_t id );
  program::program* resolve_program( protocol::account_view account ) const;
  std::error_code execute( program::program& p );

  const program_registry* _registry;
  state_db::state_node_ptr _state_node;
  call_stack _stack;

  const protocol::transaction* _transaction = nullptr;

  class chronicler _chronicler;
  intent _intent;
};

} // namespace wrapcoin::controller
