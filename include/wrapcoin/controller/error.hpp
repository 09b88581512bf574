#pragma once

#include <expected>
#include <system_error>

namespace wrapcoin::controller {

/*
 * Reversion errors abort the running transaction and produce a reverted
 * receipt. Controller errors reject the transaction outright.
 */
enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  failure,
  invalid_program,
  program_exists,
  invalid_event_name,
  read_only_context,
  stack_overflow,
  bad_file_descriptor,
  end_of_input
};

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  malformed_transaction,
  invalid_nonce,
  authorization_failure
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace wrapcoin::controller

template<>
struct std::is_error_code_enum< wrapcoin::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< wrapcoin::controller::controller_errc >: public std::true_type
{};
