#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <wrapcoin/controller/error.hpp>
#include <wrapcoin/protocol.hpp>

namespace wrapcoin::controller {

/*
 * One program invocation. Reads consume the front of stdin, output is
 * buffered until the call returns.
 */
struct stack_frame final
{
  protocol::account program_id{};
  protocol::account caller{};
  std::span< const std::string > arguments;
  std::span< const std::byte > stdin;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

class call_stack final
{
public:
  explicit call_stack( std::size_t depth_limit );

  /**
   * The new frame's caller is the program of the current frame, or the null
   * account at the top level.
   */
  std::error_code
  push( protocol::account_view program, std::span< const std::string > arguments, std::span< const std::byte > stdin );

  stack_frame& current();
  void pop();

  std::size_t depth() const noexcept;

private:
  std::vector< stack_frame > _frames;
  std::size_t _depth_limit;
};

/*
 * Holds a frame for the lifetime of a call. Nothing is popped if the push
 * failed.
 */
class scoped_frame final
{
public:
  scoped_frame( call_stack& stack,
                protocol::account_view program,
                std::span< const std::string > arguments,
                std::span< const std::byte > stdin );
  scoped_frame( const scoped_frame& ) = delete;
  scoped_frame( scoped_frame&& )      = delete;
  ~scoped_frame();

  scoped_frame& operator=( const scoped_frame& ) = delete;
  scoped_frame& operator=( scoped_frame&& )      = delete;

  const std::error_code& error() const noexcept;

private:
  call_stack& _stack;
  std::error_code _error;
};

} // namespace wrapcoin::controller
