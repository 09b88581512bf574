#include <wrapcoin/protocol/transaction.hpp>

#include <algorithm>

namespace wrapcoin::protocol {

constexpr std::size_t max_argument_count = 16;

bool call_program::validate() const noexcept
{
  if( !id.program() )
    return false;

  if( input.arguments.size() > max_argument_count )
    return false;

  return true;
}

bool transaction::validate() const noexcept
{
  if( !payer.user() )
    return false;

  if( operations.empty() )
    return false;

  if( authorizations.size() > 1 )
    return false;

  if( !std::ranges::all_of( authorizations,
                            [ & ]( const account& a )
                            {
                              return a == payer;
                            } ) )
    return false;

  if( make_id( *this ) != id )
    return false;

  return std::ranges::all_of( operations,
                              []( const operation& o )
                              {
                                return o.validate();
                              } );
}

crypto::digest make_id( const transaction& t ) noexcept
{
  crypto::hasher_reset();

  crypto::hasher_update( std::span< const std::byte >( t.payer ) );
  crypto::hasher_update( t.nonce );

  for( const auto& operation: t.operations )
  {
    crypto::hasher_update( std::span< const std::byte >( operation.id ) );
    crypto::hasher_update( operation.input.arguments.size() );

    for( const auto& argument: operation.input.arguments )
    {
      crypto::hasher_update( argument.size() );
      crypto::hasher_update( std::string_view( argument ) );
    }

    crypto::hasher_update( operation.input.stdin.size() );
    crypto::hasher_update( std::span< const std::byte >( operation.input.stdin ) );
  }

  for( const auto& authorization: t.authorizations )
    crypto::hasher_update( std::span< const std::byte >( authorization ) );

  return crypto::hasher_finalize();
}

} // namespace wrapcoin::protocol
