#include <wrapcoin/program/error.hpp>

#include <string>
#include <utility>

namespace wrapcoin::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "program";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< program_errc >( condition ) )
    {
      case program_errc::ok:
        return "ok"s;
      case program_errc::unauthorized:
        return "unauthorized"s;
      case program_errc::invalid_instruction:
        return "invalid instruction"s;
      case program_errc::insufficient_balance:
        return "insufficient balance"s;
      case program_errc::insufficient_supply:
        return "insufficient supply"s;
      case program_errc::insufficient_allowance:
        return "insufficient allowance"s;
      case program_errc::invalid_argument:
        return "invalid argument"s;
      case program_errc::unexpected_object:
        return "unexpected object"s;
      case program_errc::overflow:
        return "overflow"s;
      case program_errc::invalid_amount:
        return "invalid amount"s;
      case program_errc::already_exists:
        return "custody account already exists"s;
      case program_errc::already_initialized:
        return "already initialized"s;
      case program_errc::no_custody_account:
        return "no custody account"s;
      case program_errc::insufficient_custody_funds:
        return "insufficient custody funds"s;
      case program_errc::insufficient_synthetic_balance:
        return "insufficient synthetic balance"s;
      case program_errc::insufficient_wrapper_reserve:
        return "insufficient wrapper reserve"s;
      case program_errc::collection_shortfall:
        return "collection shortfall"s;
    }
    std::unreachable();
  }
};

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace wrapcoin::program
