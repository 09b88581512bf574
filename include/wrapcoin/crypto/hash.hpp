#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace wrapcoin::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

/*
 * Incremental hashing. The hasher state is thread local, so a
 * reset/update/finalize sequence must not be interleaved with another one
 * on the same thread.
 */
void hasher_reset() noexcept;
void hasher_update( const void* ptr, std::size_t len ) noexcept;
void hasher_update( std::span< const std::byte > bytes ) noexcept;
void hasher_update( std::string_view sv ) noexcept;
digest hasher_finalize() noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  hasher_update( &t, sizeof( T ) );
}

digest hash( const void* ptr, std::size_t len ) noexcept;
digest hash( std::span< const std::byte > bytes ) noexcept;
digest hash( std::string_view sv ) noexcept;

} // namespace wrapcoin::crypto
