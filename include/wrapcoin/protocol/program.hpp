#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wrapcoin::protocol {

struct program_input
{
  std::vector< std::string > arguments;
  std::vector< std::byte > stdin;
};

struct program_output
{
  std::int32_t code = 0;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

} // namespace wrapcoin::protocol
