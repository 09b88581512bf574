#pragma once

#include <span>
#include <string>
#include <system_error>

#include <wrapcoin/program/system_interface.hpp>

namespace wrapcoin::program {

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace wrapcoin::program
