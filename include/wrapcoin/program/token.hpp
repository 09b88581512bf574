#pragma once

#include <cstdint>
#include <string>

#include <wrapcoin/program/error.hpp>
#include <wrapcoin/program/program.hpp>

namespace wrapcoin::program {

/*
 * Fungible balance bookkeeping shared by the coin and the wrapper. Derived
 * programs extend the instruction set by overriding dispatch and deferring
 * to token::dispatch for the common instructions.
 */
class token: public program
{
public:
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    authorize,
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    transfer,
    allowance,
    approve,
    transfer_from
  };

  token( std::string name, std::string symbol, std::uint32_t decimals );
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) final;

protected:
  static constexpr std::uint32_t supply_id    = 0;
  static constexpr std::uint32_t balance_id   = 1;
  static constexpr std::uint32_t allowance_id = 2;

  virtual std::error_code dispatch( system_interface* system, std::uint32_t instruction );

  result< std::uint64_t > total_supply( system_interface* system );
  result< std::uint64_t > balance_of( system_interface* system, protocol::account_view owner );
  result< std::uint64_t >
  allowance( system_interface* system, protocol::account_view owner, protocol::account_view spender );

  std::error_code
  transfer( system_interface* system, protocol::account_view from, protocol::account_view to, std::uint64_t value );
  std::error_code mint( system_interface* system, protocol::account_view to, std::uint64_t value );
  std::error_code burn( system_interface* system, protocol::account_view from, std::uint64_t value );

private:
  std::string _name;
  std::string _symbol;
  std::uint32_t _decimals;
};

} // namespace wrapcoin::program
