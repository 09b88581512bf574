#include <wrapcoin/controller/call_stack.hpp>

#include <stdexcept>

namespace wrapcoin::controller {

call_stack::call_stack( std::size_t depth_limit ):
    _depth_limit( depth_limit )
{
  // Frames never move, so spans handed out for the current frame stay valid
  // across nested calls
  _frames.reserve( depth_limit );
}

std::error_code call_stack::push( protocol::account_view program,
                                  std::span< const std::string > arguments,
                                  std::span< const std::byte > stdin )
{
  if( _frames.size() >= _depth_limit )
    return reversion_errc::stack_overflow;

  auto& frame      = _frames.emplace_back();
  frame.program_id = protocol::account_cast( program );
  frame.arguments  = arguments;
  frame.stdin      = stdin;

  if( _frames.size() > 1 )
    frame.caller = _frames[ _frames.size() - 2 ].program_id;

  return reversion_errc::ok;
}

stack_frame& call_stack::current()
{
  if( _frames.empty() )
    throw std::runtime_error( "call stack is empty" );

  return _frames.back();
}

void call_stack::pop()
{
  if( _frames.empty() )
    throw std::runtime_error( "call stack is empty" );

  _frames.pop_back();
}

std::size_t call_stack::depth() const noexcept
{
  return _frames.size();
}

scoped_frame::scoped_frame( call_stack& stack,
                            protocol::account_view program,
                            std::span< const std::string > arguments,
                            std::span< const std::byte > stdin ):
    _stack( stack ),
    _error( stack.push( program, arguments, stdin ) )
{}

scoped_frame::~scoped_frame()
{
  if( !_error )
    _stack.pop();
}

const std::error_code& scoped_frame::error() const noexcept
{
  return _error;
}

} // namespace wrapcoin::controller
