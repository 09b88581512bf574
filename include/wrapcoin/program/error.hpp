#pragma once

#include <expected>
#include <system_error>

namespace wrapcoin::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unauthorized,
  invalid_instruction,
  insufficient_balance,
  insufficient_supply,
  insufficient_allowance,
  invalid_argument,
  unexpected_object,
  overflow,
  invalid_amount,
  already_exists,
  already_initialized,
  no_custody_account,
  insufficient_custody_funds,
  insufficient_synthetic_balance,
  insufficient_wrapper_reserve,
  collection_shortfall
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace wrapcoin::program

template<>
struct std::is_error_code_enum< wrapcoin::program::program_errc >: public std::true_type
{};
