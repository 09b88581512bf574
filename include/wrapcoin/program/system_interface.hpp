#pragma once

#include <wrapcoin/program/error.hpp>
#include <wrapcoin/protocol.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wrapcoin::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  /**
   * Fill the buffer from stdin. A short read fails with end of input and
   * consumes nothing.
   */
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer ) = 0;

  /**
   * Objects are scoped to the running program. An absent object is an empty span.
   */
  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual void log( std::string_view message ) = 0;
  virtual std::error_code
  event( std::string_view name, std::span< const std::byte > data, const std::vector< protocol::account >& impacted ) = 0;

  virtual result< bool > check_authority( protocol::account_view account ) = 0;

  /**
   * The program that called the running program, empty at the top level.
   */
  virtual std::span< const std::byte > get_caller() = 0;
  virtual std::span< const std::byte > get_self()   = 0;

  virtual result< protocol::program_output > call_program( protocol::account_view account,
                                                           std::span< const std::byte > stdin,
                                                           std::span< const std::string > arguments = {} ) = 0;

  /**
   * Instantiate a registered program code at the address derived from the
   * running program and the salt.
   */
  virtual result< protocol::account > create_program( std::string_view code, std::span< const std::byte > salt ) = 0;
};

} // namespace wrapcoin::program
