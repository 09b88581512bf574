#pragma once

#include <string>
#include <string_view>

#include <wrapcoin/program/token.hpp>

namespace wrapcoin::program {

/*
 * A synthetic token backed 1:1 by the underlying coin it holds.
 *
 * Users deposit the coin into a custody account created for them and wrap
 * it, which collects the deposit into the wrapper and mints the same amount
 * of the synthetic token. Unwrapping burns synthetic units and releases the
 * coin from the wrapper's own balance.
 */
class wrapper final: public token
{
public:
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    create_custody_account = 16,
    custody_account_of,
    wrap,
    unwrap,
    underlying
  };

  static constexpr std::string_view default_name   = "Wrapped Coin";
  static constexpr std::string_view default_symbol = "WCOIN";

  explicit wrapper( const protocol::account& underlying,
                    std::string name   = std::string( default_name ),
                    std::string symbol = std::string( default_symbol ) );
  wrapper( const wrapper& ) = delete;
  wrapper( wrapper&& )      = delete;
  ~wrapper() override       = default;

  wrapper& operator=( const wrapper& ) = delete;
  wrapper& operator=( wrapper&& )      = delete;

protected:
  std::error_code dispatch( system_interface* system, std::uint32_t instruction ) override;

private:
  static constexpr std::uint32_t custody_registry_id = 3;

  result< protocol::account > custody_account_of( system_interface* system, protocol::account_view user );
  result< std::uint64_t > underlying_balance( system_interface* system, protocol::account_view owner );

  std::error_code create_custody_account( system_interface* system, const protocol::account& user );
  std::error_code wrap( system_interface* system, const protocol::account& user, std::uint64_t value );
  std::error_code unwrap( system_interface* system, const protocol::account& user, std::uint64_t value );

  protocol::account _underlying;
};

} // namespace wrapcoin::program
