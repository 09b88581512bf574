#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace wrapcoin::encode {

/*
 * Lowercase, 0x prefixed. Used for ids and accounts in logs and reports.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

} // namespace wrapcoin::encode
