#include <wrapcoin/controller/chronicler.hpp>

namespace wrapcoin::controller {

void chronicler::push_event( protocol::event&& e )
{
  e.sequence = static_cast< std::uint32_t >( _events.size() );
  _events.emplace_back( std::move( e ) );
}

void chronicler::push_log( std::string message )
{
  _logs.emplace_back( std::move( message ) );
}

std::size_t chronicler::checkpoint() const noexcept
{
  return _events.size();
}

void chronicler::rollback( std::size_t checkpoint ) noexcept
{
  if( checkpoint < _events.size() )
    _events.resize( checkpoint );
}

std::vector< protocol::event >& chronicler::events() noexcept
{
  return _events;
}

std::vector< std::string >& chronicler::logs() noexcept
{
  return _logs;
}

} // namespace wrapcoin::controller
