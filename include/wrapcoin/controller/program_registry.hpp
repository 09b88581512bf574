#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <wrapcoin/program.hpp>
#include <wrapcoin/protocol.hpp>

namespace wrapcoin::controller {

/*
 * Native programs are bound either to a fixed account or to a code name.
 * Programs created at runtime record their code name in state and share the
 * code's instance, so program instances must keep all of their state in
 * object storage.
 */
class program_registry final
{
public:
  program_registry()                          = default;
  program_registry( const program_registry& ) = delete;
  program_registry( program_registry&& )      = delete;
  ~program_registry()                         = default;

  program_registry& operator=( const program_registry& ) = delete;
  program_registry& operator=( program_registry&& )      = delete;

  /**
   * Bind a program to an account. Throws std::invalid_argument if the
   * account is not a program account or is already bound.
   */
  void emplace_program( const protocol::account& id, std::unique_ptr< program::program > p );

  /**
   * Register code that programs can be created from. Throws
   * std::invalid_argument if the name is empty or already registered.
   */
  void emplace_code( std::string_view name, std::unique_ptr< program::program > p );

  program::program* find_program( protocol::account_view id ) const;
  program::program* find_code( std::string_view name ) const;

private:
  std::map< protocol::account, std::unique_ptr< program::program > > _programs;
  std::map< std::string, std::unique_ptr< program::program >, std::less<> > _codes;
};

} // namespace wrapcoin::controller
