#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <wrapcoin/log/formatter.hpp>
#include <wrapcoin/log/frontend.hpp>

namespace wrapcoin::log {

/**
 * Start the logging backend and set the root logger filter.
 *
 * Throws std::invalid_argument if the level is not a quill level name
 * (tracel3, tracel2, tracel1, debug, info, notice, warning, error, critical, none).
 */
void initialize( std::string_view level = "info" );

logger* instance() noexcept;

} // namespace wrapcoin::log
