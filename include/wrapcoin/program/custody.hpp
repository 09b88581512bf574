#pragma once

#include <cstdint>
#include <string_view>

#include <wrapcoin/program/error.hpp>
#include <wrapcoin/program/program.hpp>

namespace wrapcoin::program {

/*
 * A custody account holds one user's deposits until its controller, the
 * program that created it, collects them. It never moves funds on its own.
 */
class custody final: public program
{
public:
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    authorize,
    initialize,
    controller,
    collect
  };

  static constexpr std::string_view code_name = "custody";

  custody()                 = default;
  custody( const custody& ) = delete;
  custody( custody&& )      = delete;
  ~custody() override       = default;

  custody& operator=( const custody& ) = delete;
  custody& operator=( custody&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

private:
  static constexpr std::uint32_t controller_id = 0;

  result< protocol::account > controller( system_interface* system );
};

} // namespace wrapcoin::program
