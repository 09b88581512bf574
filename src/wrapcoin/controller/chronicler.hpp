#pragma once

#include <wrapcoin/protocol.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace wrapcoin::controller {

/*
 * Records the events and logs of a transaction. Events emitted by a call
 * that fails are rolled back with it, logs are kept.
 */
class chronicler final
{
public:
  void push_event( protocol::event&& e );
  void push_log( std::string message );

  std::size_t checkpoint() const noexcept;
  void rollback( std::size_t checkpoint ) noexcept;

  std::vector< protocol::event >& events() noexcept;
  std::vector< std::string >& logs() noexcept;

private:
  std::vector< protocol::event > _events;
  std::vector< std::string > _logs;
};

} // namespace wrapcoin::controller
