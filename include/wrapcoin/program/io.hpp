#pragma once

#include <algorithm>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <wrapcoin/memory.hpp>
#include <wrapcoin/program/error.hpp>
#include <wrapcoin/program/system_interface.hpp>
#include <wrapcoin/protocol.hpp>

/*
 * Programs exchange little endian integers and raw 33 byte accounts over
 * stdin and stdout, and store integers little endian.
 */

namespace wrapcoin::program {

template< typename T >
  requires std::is_integral_v< T >
std::error_code read_input( system_interface* system, T& value )
{
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( value ) ); error )
    return error;

  if constexpr( !std::is_same_v< T, bool > )
    boost::endian::little_to_native_inplace( value );

  return program_errc::ok;
}

inline std::error_code read_input( system_interface* system, protocol::account& account )
{
  return system->read( file_descriptor::stdin, memory::as_writable_bytes( account ) );
}

template< typename T >
  requires std::is_integral_v< T >
std::error_code write_output( system_interface* system, T value )
{
  if constexpr( !std::is_same_v< T, bool > )
    boost::endian::native_to_little_inplace( value );

  return system->write( file_descriptor::stdout, memory::as_bytes( value ) );
}

inline std::error_code write_output( system_interface* system, protocol::account_view account )
{
  return system->write( file_descriptor::stdout, account );
}

inline std::error_code write_output( system_interface* system, std::string_view str )
{
  return system->write( file_descriptor::stdout, memory::as_bytes( str ) );
}

inline result< std::uint64_t >
get_uint64( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto object = system->get_object( id, key );
  if( object.empty() )
    return 0;

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  auto value = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( value );
  return value;
}

/*
 * A zero value is stored as an absent object, which get_uint64 reads back as zero.
 */
inline std::error_code
put_uint64( system_interface* system, std::uint32_t id, std::span< const std::byte > key, std::uint64_t value )
{
  if( value == 0 )
    return system->remove_object( id, key );

  boost::endian::native_to_little_inplace( value );
  return system->put_object( id, key, memory::as_bytes( value ) );
}

inline protocol::account self_account( system_interface* system )
{
  return protocol::account_cast( protocol::account_view( system->get_self().data(), protocol::account_length ) );
}

/*
 * An account acts through a program call when it is the calling program,
 * otherwise it has to pass the runtime's authority check.
 */
inline result< bool > authorized( system_interface* system, protocol::account_view account )
{
  if( std::ranges::equal( system->get_caller(), account ) )
    return true;

  return system->check_authority( account );
}

namespace detail {

// Only the widths programs read are accepted, so an unsuffixed literal does
// not silently change the encoding
template< typename T >
concept wire_integral =
  std::is_same_v< T, bool > || std::is_same_v< T, std::uint32_t > || std::is_same_v< T, std::uint64_t >;

template< typename T >
  requires wire_integral< T >
void append( std::vector< std::byte >& buffer, T value )
{
  if constexpr( !std::is_same_v< T, bool > )
    boost::endian::native_to_little_inplace( value );

  auto bytes = memory::as_bytes( value );
  buffer.insert( buffer.end(), bytes.begin(), bytes.end() );
}

template< typename T >
  requires std::is_enum_v< T >
void append( std::vector< std::byte >& buffer, T value )
{
  append( buffer, std::to_underlying( value ) );
}

inline void append( std::vector< std::byte >& buffer, protocol::account_view account )
{
  buffer.insert( buffer.end(), account.begin(), account.end() );
}

} // namespace detail

/*
 * Encode an instruction and its arguments as program input.
 */
template< typename... Args >
std::vector< std::byte > make_input( const Args&... args )
{
  std::vector< std::byte > input;
  ( detail::append( input, args ), ... );
  return input;
}

template< typename T >
  requires std::is_integral_v< T >
result< T > decode_output( const protocol::program_output& output )
{
  if( output.stdout.size() != sizeof( T ) )
    return std::unexpected( program_errc::unexpected_object );

  auto value = memory::bit_cast< T >( output.stdout );

  if constexpr( !std::is_same_v< T, bool > )
    boost::endian::little_to_native_inplace( value );

  return value;
}

template< typename T >
  requires std::is_same_v< T, protocol::account >
result< T > decode_output( const protocol::program_output& output )
{
  if( output.stdout.size() != protocol::account_length )
    return std::unexpected( program_errc::unexpected_object );

  return memory::bit_cast< protocol::account >( output.stdout );
}

} // namespace wrapcoin::program
