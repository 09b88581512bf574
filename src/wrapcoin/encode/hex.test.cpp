#include <gtest/gtest.h>

#include <array>
#include <cstdint>

#include <wrapcoin/encode/hex.hpp>
#include <wrapcoin/memory.hpp>
#include <wrapcoin/protocol/account.hpp>

TEST( hex, bytes )
{
  constexpr std::array< std::uint8_t, 6 > data{ 0, 1, 42, 127, 200, 255 };

  EXPECT_EQ( wrapcoin::encode::to_hex( wrapcoin::memory::as_bytes( data ) ), "0x00012a7fc8ff" );
  EXPECT_EQ( wrapcoin::encode::to_hex( std::span< const std::byte >{} ), "0x" );
}

TEST( hex, accounts )
{
  auto hex = wrapcoin::encode::to_hex( wrapcoin::protocol::null_account );
  ASSERT_EQ( hex.size(), 2 + wrapcoin::protocol::account_length * 2 );
  EXPECT_EQ( hex, "0x" + std::string( wrapcoin::protocol::account_length * 2, '0' ) );

  auto account   = wrapcoin::protocol::null_account;
  account.back() = std::byte{ 0xab };
  EXPECT_TRUE( wrapcoin::encode::to_hex( account ).ends_with( "00ab" ) );
}
