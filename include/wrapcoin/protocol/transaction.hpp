#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <wrapcoin/crypto.hpp>
#include <wrapcoin/protocol/account.hpp>
#include <wrapcoin/protocol/program.hpp>

namespace wrapcoin::protocol {

struct call_program
{
  account id{};
  program_input input;

  bool validate() const noexcept;
};

using operation = call_program;

/*
 * Submission is authenticated before a transaction reaches the controller,
 * and it only vouches for the payer. The payer is therefore the one account
 * a transaction may list as an authorization.
 */
struct transaction
{
  crypto::digest id{};
  account payer{};
  std::uint64_t nonce = 0;
  std::vector< operation > operations;
  std::vector< account > authorizations;

  bool validate() const noexcept;
};

/*
 * Sequence numbers are assigned per transaction in emission order.
 */
struct event
{
  std::uint32_t sequence = 0;
  account source{};
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;
};

struct transaction_receipt
{
  crypto::digest id{};
  account payer{};
  std::uint64_t nonce = 0;
  bool reverted       = false;
  std::error_code error;
  std::vector< event > events;
  std::vector< std::string > logs;
};

crypto::digest make_id( const transaction& t ) noexcept;

} // namespace wrapcoin::protocol

template< typename T >
concept Operation = std::same_as< wrapcoin::protocol::operation, T >;
