#pragma once

#include <string>
#include <string_view>

#include <wrapcoin/program/token.hpp>

namespace wrapcoin::program {

/*
 * The underlying asset. Only the issuer may mint, holders burn their own
 * balance.
 */
class coin: public token
{
public:
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    mint = 10,
    burn
  };

  static constexpr std::string_view default_name   = "Coin";
  static constexpr std::string_view default_symbol = "COIN";
  static constexpr std::uint32_t default_decimals  = 8;

  explicit coin( const protocol::account& issuer,
                 std::string name       = std::string( default_name ),
                 std::string symbol     = std::string( default_symbol ),
                 std::uint32_t decimals = default_decimals );
  coin( const coin& ) = delete;
  coin( coin&& )      = delete;
  ~coin() override    = default;

  coin& operator=( const coin& ) = delete;
  coin& operator=( coin&& )      = delete;

protected:
  std::error_code dispatch( system_interface* system, std::uint32_t instruction ) override;

private:
  protocol::account _issuer;
};

} // namespace wrapcoin::program
