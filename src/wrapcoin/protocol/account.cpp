#include <wrapcoin/protocol/account.hpp>

#include <algorithm>
#include <utility>

namespace wrapcoin::protocol {

constexpr auto user_account_prefix           = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix        = std::byte{ std::to_underlying( account_type::program ) };
constexpr auto native_program_account_prefix = std::byte{ std::to_underlying( account_type::native_program ) };

static account_type account_prefix_to_type( std::byte prefix ) noexcept
{
  switch( std::to_integer< std::uint8_t >( prefix ) )
  {
    case std::to_underlying( account_type::user ):
      return account_type::user;
    case std::to_underlying( account_type::program ):
      return account_type::program;
    case std::to_underlying( account_type::native_program ):
      return account_type::native_program;
    default:
      return account_type::invalid;
  }
}

static bool is_null( std::span< const std::byte > bytes ) noexcept
{
  return std::ranges::all_of( bytes,
                              []( std::byte b )
                              {
                                return b == std::byte{ 0x00 };
                              } );
}

account_type account::type() const noexcept
{
  return account_prefix_to_type( front() );
}

bool account::user() const noexcept
{
  return type() == account_type::user;
}

bool account::program() const noexcept
{
  auto t = type();
  return t == account_type::program || t == account_type::native_program;
}

bool account::null() const noexcept
{
  return is_null( *this );
}

account_view::account_view( const account& acc ) noexcept:
    std::span< const std::byte, account_length >( acc )
{}

account_view::account_view( const std::byte* ptr, std::size_t length ) noexcept:
    std::span< const std::byte, account_length >( ptr, length )
{}

account_type account_view::type() const noexcept
{
  return account_prefix_to_type( front() );
}

bool account_view::user() const noexcept
{
  return type() == account_type::user;
}

bool account_view::program() const noexcept
{
  auto t = type();
  return t == account_type::program || t == account_type::native_program;
}

bool account_view::null() const noexcept
{
  return is_null( *this );
}

account user_account( const crypto::digest& d ) noexcept
{
  account a{ user_account_prefix };
  std::ranges::copy( d, a.begin() + 1 );
  return a;
}

account program_account( const crypto::digest& d ) noexcept
{
  account a{ program_account_prefix };
  std::ranges::copy( d, a.begin() + 1 );
  return a;
}

account system_program( std::string_view str ) noexcept
{
  account a{};
  a.front() = native_program_account_prefix;

  std::size_t length = std::min( str.length(), a.size() - 1 );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i + 1 ) = static_cast< std::byte >( str[ i ] );

  return a;
}

account account_cast( account_view view ) noexcept
{
  account a;
  std::ranges::copy( view, a.begin() );
  return a;
}

account derived_program( account_view creator, std::span< const std::byte > salt ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( std::span< const std::byte >( creator ) );
  crypto::hasher_update( salt );
  return program_account( crypto::hasher_finalize() );
}

} // namespace wrapcoin::protocol
