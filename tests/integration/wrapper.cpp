// NOLINTBEGIN

#include <boost/endian/conversion.hpp>
#include <gtest/gtest.h>
#include <wrapcoin/log.hpp>
#include <wrapcoin/memory.hpp>
#include <wrapcoin/program.hpp>
#include <test/fixture.hpp>

class wrapping: public ::testing::Test,
                public test::fixture
{
public:
  wrapping():
      test::fixture( "wrapping", "info" ),
      alice( user( "alice" ) ),
      bob( user( "bob" ) )
  {}

  wrapping( const wrapping& ) = delete;
  wrapping( wrapping&& )      = delete;

  ~wrapping() override = default;

  wrapping& operator=( const wrapping& ) = delete;
  wrapping& operator=( wrapping&& )      = delete;

  void fund( const wrapcoin::protocol::account& to, std::uint64_t amount )
  {
    ASSERT_TRUE( verify( _controller->process( make_transaction( _issuer, make_mint_operation( _coin, to, amount ) ) ),
                         test::fixture::verification::processed | test::fixture::verification::without_reversion ) );
  }

  void create_custody_account( const wrapcoin::protocol::account& who )
  {
    ASSERT_TRUE(
      verify( _controller->process( make_transaction( who, make_create_custody_account_operation( _wrapper, who ) ) ),
              test::fixture::verification::processed | test::fixture::verification::without_reversion ) );
  }

  void deposit( const wrapcoin::protocol::account& who, std::uint64_t amount )
  {
    ASSERT_TRUE( verify( _controller->process( make_transaction(
                           who,
                           make_transfer_operation( _coin, who, custody_account_of( _wrapper, who ), amount ) ) ),
                         test::fixture::verification::processed | test::fixture::verification::without_reversion ) );
  }

  void wrap( const wrapcoin::protocol::account& who, std::uint64_t amount )
  {
    ASSERT_TRUE( verify( _controller->process( make_transaction( who, make_wrap_operation( _wrapper, who, amount ) ) ),
                         test::fixture::verification::processed | test::fixture::verification::without_reversion ) );
  }

  void unwrap( const wrapcoin::protocol::account& who, std::uint64_t amount )
  {
    ASSERT_TRUE( verify( _controller->process( make_transaction( who, make_unwrap_operation( _wrapper, who, amount ) ) ),
                         test::fixture::verification::processed | test::fixture::verification::without_reversion ) );
  }

  std::uint64_t reserve() const
  {
    return balance_of( _coin, _wrapper );
  }

  wrapcoin::protocol::account alice;
  wrapcoin::protocol::account bob;
};

TEST_F( wrapping, metadata )
{
  auto response =
    _controller->read_program( _wrapper, make_input( make_stdin( wrapcoin::program::token::instruction::name ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( wrapcoin::memory::as_string_view( response->stdout ), "Wrapped Coin" );

  response =
    _controller->read_program( _wrapper, make_input( make_stdin( wrapcoin::program::token::instruction::symbol ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( wrapcoin::memory::as_string_view( response->stdout ), "WCOIN" );

  response =
    _controller->read_program( _wrapper, make_input( make_stdin( wrapcoin::program::token::instruction::decimals ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( wrapcoin::program::decode_output< std::uint32_t >( *response ).value(), 0 );

  response = _controller->read_program(
    _wrapper,
    make_input( make_stdin( wrapcoin::program::wrapper::instruction::underlying ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( wrapcoin::program::decode_output< wrapcoin::protocol::account >( *response ).value(), _coin );

  EXPECT_EQ( total_supply( _wrapper ), 0 );
}

TEST_F( wrapping, custody_account_lifecycle )
{
  EXPECT_EQ( custody_account_of( _wrapper, alice ), wrapcoin::protocol::null_account );

  auto receipt =
    _controller->process( make_transaction( alice, make_create_custody_account_operation( _wrapper, alice ) ) );

  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed | test::fixture::verification::without_reversion ) );

  auto custody = custody_account_of( _wrapper, alice );
  EXPECT_FALSE( custody.null() );
  EXPECT_EQ( custody, wrapcoin::protocol::derived_program( _wrapper, alice ) );
  EXPECT_EQ( custody.type(), wrapcoin::protocol::account_type::program );

  ASSERT_FALSE( receipt->events.empty() );
  const auto& created = receipt->events.back();
  EXPECT_EQ( created.name, "custody_account_created" );
  EXPECT_EQ( created.source, _wrapper );
  EXPECT_EQ( created.data, make_stdin( alice, custody ) );

  auto response = _controller->read_program(
    custody,
    make_input( make_stdin( wrapcoin::program::custody::instruction::controller ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( wrapcoin::program::decode_output< wrapcoin::protocol::account >( *response ).value(), _wrapper );

  // Custody accounts are created once and never reassigned
  receipt = _controller->process( make_transaction( alice, make_create_custody_account_operation( _wrapper, alice ) ) );

  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::already_exists );
  EXPECT_EQ( custody_account_of( _wrapper, alice ), custody );

  // Users get distinct custody accounts
  EXPECT_EQ( custody_account_of( _wrapper, bob ), wrapcoin::protocol::null_account );
  create_custody_account( bob );
  EXPECT_NE( custody_account_of( _wrapper, bob ), custody );
  EXPECT_EQ( custody_account_of( _wrapper, alice ), custody );
}

TEST_F( wrapping, create_custody_account_requires_user_authority )
{
  auto receipt =
    _controller->process( make_transaction( bob, make_create_custody_account_operation( _wrapper, alice ) ) );

  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::unauthorized );
  EXPECT_EQ( custody_account_of( _wrapper, alice ), wrapcoin::protocol::null_account );
}

TEST_F( wrapping, wrap_and_unwrap )
{
  fund( alice, 100 );
  create_custody_account( alice );
  auto custody = custody_account_of( _wrapper, alice );

  deposit( alice, 100 );
  EXPECT_EQ( balance_of( _coin, alice ), 0 );
  EXPECT_EQ( balance_of( _coin, custody ), 100 );

  // Deposited funds back nothing until they are wrapped
  EXPECT_EQ( total_supply( _wrapper ), 0 );
  EXPECT_EQ( reserve(), 0 );

  auto receipt = _controller->process( make_transaction( alice, make_wrap_operation( _wrapper, alice, 100 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed | test::fixture::verification::without_reversion ) );

  EXPECT_EQ( balance_of( _wrapper, alice ), 100 );
  EXPECT_EQ( total_supply( _wrapper ), 100 );
  EXPECT_EQ( balance_of( _coin, custody ), 0 );
  EXPECT_EQ( reserve(), 100 );

  ASSERT_EQ( receipt->events.size(), 3 );
  EXPECT_EQ( receipt->events[ 0 ].name, "transfer" );
  EXPECT_EQ( receipt->events[ 0 ].source, _coin );
  EXPECT_EQ( receipt->events[ 1 ].name, "mint" );
  EXPECT_EQ( receipt->events[ 1 ].source, _wrapper );
  EXPECT_EQ( receipt->events[ 2 ].name, "wrapped" );
  EXPECT_EQ( receipt->events[ 2 ].source, _wrapper );
  EXPECT_EQ( receipt->events[ 2 ].data, make_stdin( std::uint64_t( 100 ), alice ) );

  receipt = _controller->process( make_transaction( alice, make_unwrap_operation( _wrapper, alice, 30 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed | test::fixture::verification::without_reversion ) );

  EXPECT_EQ( balance_of( _wrapper, alice ), 70 );
  EXPECT_EQ( total_supply( _wrapper ), 70 );
  EXPECT_EQ( reserve(), 70 );
  EXPECT_EQ( balance_of( _coin, alice ), 30 );

  ASSERT_EQ( receipt->events.size(), 3 );
  EXPECT_EQ( receipt->events[ 0 ].name, "burn" );
  EXPECT_EQ( receipt->events[ 1 ].name, "transfer" );
  EXPECT_EQ( receipt->events[ 2 ].name, "unwrapped" );
  EXPECT_EQ( receipt->events[ 2 ].data, make_stdin( std::uint64_t( 30 ), alice ) );
}

TEST_F( wrapping, round_trip )
{
  fund( alice, 100 );
  create_custody_account( alice );

  deposit( alice, 60 );
  wrap( alice, 60 );
  unwrap( alice, 60 );

  EXPECT_EQ( balance_of( _coin, alice ), 100 );
  EXPECT_EQ( balance_of( _coin, custody_account_of( _wrapper, alice ) ), 0 );
  EXPECT_EQ( balance_of( _wrapper, alice ), 0 );
  EXPECT_EQ( total_supply( _wrapper ), 0 );
  EXPECT_EQ( reserve(), 0 );
  EXPECT_EQ( total_supply( _coin ), 100 );
}

TEST_F( wrapping, partial_wraps_reuse_custody )
{
  fund( alice, 100 );
  create_custody_account( alice );
  auto custody = custody_account_of( _wrapper, alice );

  deposit( alice, 100 );
  wrap( alice, 40 );

  EXPECT_EQ( balance_of( _coin, custody ), 60 );
  EXPECT_EQ( balance_of( _wrapper, alice ), 40 );

  wrap( alice, 60 );

  EXPECT_EQ( balance_of( _coin, custody ), 0 );
  EXPECT_EQ( balance_of( _wrapper, alice ), 100 );
  EXPECT_EQ( reserve(), 100 );
  EXPECT_EQ( custody_account_of( _wrapper, alice ), custody );
}

TEST_F( wrapping, wrap_preconditions )
{
  fund( alice, 100 );

  auto receipt = _controller->process( make_transaction( alice, make_wrap_operation( _wrapper, alice, 10 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::no_custody_account );

  create_custody_account( alice );
  deposit( alice, 50 );

  receipt = _controller->process( make_transaction( alice, make_wrap_operation( _wrapper, alice, 0 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::invalid_amount );

  receipt = _controller->process( make_transaction( alice, make_wrap_operation( _wrapper, alice, 100 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::insufficient_custody_funds );
  EXPECT_TRUE( receipt->events.empty() );

  receipt = _controller->process( make_transaction( bob, make_wrap_operation( _wrapper, alice, 50 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::unauthorized );

  EXPECT_EQ( balance_of( _coin, custody_account_of( _wrapper, alice ) ), 50 );
  EXPECT_EQ( balance_of( _wrapper, alice ), 0 );
  EXPECT_EQ( total_supply( _wrapper ), 0 );
  EXPECT_EQ( reserve(), 0 );
}

TEST_F( wrapping, unwrap_preconditions )
{
  fund( alice, 100 );
  create_custody_account( alice );
  deposit( alice, 100 );
  wrap( alice, 100 );

  auto receipt = _controller->process( make_transaction( alice, make_unwrap_operation( _wrapper, alice, 0 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::invalid_amount );

  receipt = _controller->process( make_transaction( alice, make_unwrap_operation( _wrapper, alice, 101 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::insufficient_synthetic_balance );

  receipt = _controller->process( make_transaction( bob, make_unwrap_operation( _wrapper, alice, 10 ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::processed ) );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->error, wrapcoin::program::program_errc::unauthorized );

  EXPECT_EQ( balance_of( _wrapper, alice ), 100 );
  EXPECT_EQ( total_supply( _wrapper ), 100 );
  EXPECT_EQ( reserve(), 100 );
  EXPECT_EQ( balance_of( _coin, alice ), 0 );
  EXPECT_EQ( balance_of( _coin, bob ), 0 );
}

TEST_F( wrapping, synthetic_tokens_are_fungible )
{
  fund( alice, 100 );
  create_custody_account( alice );
  deposit( alice, 100 );
  wrap( alice, 100 );

  ASSERT_TRUE(
    verify( _controller->process( make_transaction( alice, make_transfer_operation( _wrapper, alice, bob, 20 ) ) ),
            test::fixture::verification::processed | test::fixture::verification::without_reversion ) );

  EXPECT_EQ( balance_of( _wrapper, alice ), 80 );
  EXPECT_EQ( balance_of( _wrapper, bob ), 20 );

  // Bob never deposited but may unwrap what he holds
  unwrap( bob, 20 );

  EXPECT_EQ( balance_of( _wrapper, bob ), 0 );
  EXPECT_EQ( balance_of( _coin, bob ), 20 );
  EXPECT_EQ( reserve(), 80 );
  EXPECT_EQ( total_supply( _wrapper ), 80 );
}

TEST_F( wrapping, conservation )
{
  fund( alice, 500 );
  fund( bob, 300 );
  create_custody_account( alice );
  create_custody_account( bob );

  auto check_conservation = [ & ]()
  {
    EXPECT_EQ( balance_of( _wrapper, alice ) + balance_of( _wrapper, bob ), total_supply( _wrapper ) );
    EXPECT_EQ( total_supply( _wrapper ), reserve() );
    EXPECT_EQ( total_supply( _coin ), 800 );
  };

  deposit( alice, 200 );
  check_conservation();
  wrap( alice, 150 );
  check_conservation();
  deposit( bob, 300 );
  wrap( bob, 100 );
  check_conservation();
  unwrap( alice, 50 );
  check_conservation();
  wrap( bob, 200 );
  check_conservation();

  ASSERT_TRUE(
    verify( _controller->process( make_transaction( bob, make_transfer_operation( _wrapper, bob, alice, 120 ) ) ),
            test::fixture::verification::processed | test::fixture::verification::without_reversion ) );
  check_conservation();

  unwrap( alice, 220 );
  check_conservation();
  wrap( alice, 50 );
  unwrap( bob, 180 );
  check_conservation();

  EXPECT_EQ( total_supply( _wrapper ), 50 );
  EXPECT_EQ( balance_of( _coin, custody_account_of( _wrapper, alice ) ), 0 );
  EXPECT_EQ( balance_of( _coin, custody_account_of( _wrapper, bob ) ), 0 );
}

// NOLINTEND
