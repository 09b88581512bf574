#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <wrapcoin/crypto.hpp>

namespace wrapcoin::protocol {

constexpr std::size_t account_length = crypto::digest_length + 1;

enum class account_type : std::uint8_t
{
  invalid        = 0x00,
  user           = 0x01,
  program        = 0x02,
  native_program = 0x03
};

/*
 * An account is a type prefix followed by a 32 byte body. The all-zero
 * account is never a valid identity and is used as the "no account" value.
 */
struct account: std::array< std::byte, account_length >
{
  account_type type() const noexcept;

  bool user() const noexcept;
  bool program() const noexcept;
  bool null() const noexcept;
};

struct account_view: std::span< const std::byte, account_length >
{
  account_view( const account& ) noexcept;
  account_view( const std::byte*, std::size_t ) noexcept;

  account_type type() const noexcept;

  bool user() const noexcept;
  bool program() const noexcept;
  bool null() const noexcept;
};

constexpr account null_account{};

account user_account( const crypto::digest& ) noexcept;
account program_account( const crypto::digest& ) noexcept;
account system_program( std::string_view str ) noexcept;

account account_cast( account_view view ) noexcept;

/*
 * The address of a program created by `creator`. Distinct salts yield
 * distinct addresses, the same salt always yields the same address.
 */
account derived_program( account_view creator, std::span< const std::byte > salt ) noexcept;

} // namespace wrapcoin::protocol
