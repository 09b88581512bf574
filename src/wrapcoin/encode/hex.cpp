#include <wrapcoin/encode/hex.hpp>

#include <cstdint>
#include <string_view>

namespace wrapcoin::encode {

namespace {

constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr std::string_view hex_prefix = "0x";

} // namespace

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string out( hex_prefix.size() + s.size() * 2, '0' );
  out[ 1 ] = 'x';

  auto it = out.begin() + static_cast< std::ptrdiff_t >( hex_prefix.size() );
  for( const auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    *it++      = hex_digits[ value / hex_digits.size() ];
    *it++      = hex_digits[ value % hex_digits.size() ];
  }

  return out;
}

} // namespace wrapcoin::encode
