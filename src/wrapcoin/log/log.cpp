#include <wrapcoin/log/log.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/core/QuillError.h>
#include <quill/sinks/ConsoleSink.h>

namespace wrapcoin::log {

void initialize( std::string_view level )
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::LogLevel log_level;

  try
  {
    log_level = quill::loglevel_from_string( std::string( level ) );
  }
  catch( const quill::QuillError& )
  {
    throw std::invalid_argument( "invalid log level: " + std::string( level ) );
  }

  if( !quill::Backend::is_running() )
  {
    quill::BackendOptions options;
    options.sleep_duration = sleep_duration;
    options.error_notifier = []( const std::string& err ) noexcept
    {
      LOG_ERROR( wrapcoin::log::instance(), "Encountered backend logging error: {}", err );
    };

    quill::Backend::start( options );
  }

  instance()->set_log_level( log_level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace wrapcoin::log
