#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <wrapcoin/controller.hpp>
#include <wrapcoin/crypto.hpp>
#include <wrapcoin/memory.hpp>
#include <wrapcoin/program.hpp>
#include <wrapcoin/protocol.hpp>

#include <test/programs.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  /**
   * Reopen the controller on a fresh state built from the given genesis data.
   */
  void reset( const wrapcoin::controller::state::genesis_data& data );

  static wrapcoin::protocol::account user( std::string_view name );

  wrapcoin::protocol::operation make_call_operation( const wrapcoin::protocol::account& id,
                                                     std::vector< std::byte >&& stdin );
  wrapcoin::protocol::operation
  make_mint_operation( const wrapcoin::protocol::account& id, const wrapcoin::protocol::account& to, std::uint64_t amount );
  wrapcoin::protocol::operation make_transfer_operation( const wrapcoin::protocol::account& id,
                                                         const wrapcoin::protocol::account& from,
                                                         const wrapcoin::protocol::account& to,
                                                         std::uint64_t amount );
  wrapcoin::protocol::operation make_create_custody_account_operation( const wrapcoin::protocol::account& id,
                                                                       const wrapcoin::protocol::account& user );
  wrapcoin::protocol::operation make_wrap_operation( const wrapcoin::protocol::account& id,
                                                     const wrapcoin::protocol::account& user,
                                                     std::uint64_t amount );
  wrapcoin::protocol::operation make_unwrap_operation( const wrapcoin::protocol::account& id,
                                                       const wrapcoin::protocol::account& user,
                                                       std::uint64_t amount );

  template< Operation... Args >
  wrapcoin::protocol::transaction make_transaction( const wrapcoin::protocol::account& signer, Args... args )
  {
    wrapcoin::protocol::transaction t;
    ( ( t.operations.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.nonce = _controller->account_nonce( signer ) + 1;
    t.payer = signer;
    t.authorizations.emplace_back( signer );
    t.id = wrapcoin::protocol::make_id( t );
    return t;
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const
  {
    return wrapcoin::program::make_input( args... );
  }

  wrapcoin::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                                std::vector< std::string >&& arguments = {} ) const noexcept;

  std::uint64_t balance_of( const wrapcoin::protocol::account& token, const wrapcoin::protocol::account& owner ) const;
  std::uint64_t total_supply( const wrapcoin::protocol::account& token ) const;
  wrapcoin::protocol::account custody_account_of( const wrapcoin::protocol::account& wrapper,
                                                  const wrapcoin::protocol::account& user ) const;

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_reversion = 1 << 1
  };

  bool verify( wrapcoin::controller::result< wrapcoin::protocol::transaction_receipt > receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< wrapcoin::controller::controller > _controller;
  wrapcoin::controller::state::genesis_data _genesis_data;

  const wrapcoin::protocol::account _issuer  = user( "issuer" );
  const wrapcoin::protocol::account _coin    = wrapcoin::protocol::system_program( "coin" );
  const wrapcoin::protocol::account _wrapper = wrapcoin::protocol::system_program( "wrapper" );

  const wrapcoin::protocol::account _reentrant_coin    = wrapcoin::protocol::system_program( "reentrant_coin" );
  const wrapcoin::protocol::account _reentrant_wrapper = wrapcoin::protocol::system_program( "reentrant_wrapper" );
  const wrapcoin::protocol::account _counterfeit_coin  = wrapcoin::protocol::system_program( "counterfeit_coin" );
  const wrapcoin::protocol::account _counterfeit_wrapper =
    wrapcoin::protocol::system_program( "counterfeit_wrapper" );
  const wrapcoin::protocol::account _rewrapping_coin    = wrapcoin::protocol::system_program( "rewrapping_coin" );
  const wrapcoin::protocol::account _rewrapping_wrapper = wrapcoin::protocol::system_program( "rewrapping_wrapper" );
  const wrapcoin::protocol::account _recursive = wrapcoin::protocol::system_program( "recursive" );
  const wrapcoin::protocol::account _throwing  = wrapcoin::protocol::system_program( "throwing" );
};

} // namespace test
