#include <diffdb/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/ConsoleSink.h>

namespace diffdb::log {

void initialize() noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( diffdb::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(tags)%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

bool set_level( std::string_view level ) noexcept
{
  quill::LogLevel log_level;

  if( level == "trace" )
    log_level = quill::LogLevel::TraceL1;
  else if( level == "debug" )
    log_level = quill::LogLevel::Debug;
  else if( level == "info" )
    log_level = quill::LogLevel::Info;
  else if( level == "warning" || level == "warn" )
    log_level = quill::LogLevel::Warning;
  else if( level == "error" )
    log_level = quill::LogLevel::Error;
  else if( level == "critical" )
    log_level = quill::LogLevel::Critical;
  else
    return false;

  instance()->set_log_level( log_level );
  return true;
}

} // namespace diffdb::log
