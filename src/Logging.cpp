#include "verifs/Logging.hpp"
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace verifs
{

namespace logging = boost::log;

namespace
{
  logging::trivial::severity_level ToSeverity(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Trace:   return logging::trivial::trace;
    case LogLevel::Debug:   return logging::trivial::debug;
    case LogLevel::Info:    return logging::trivial::info;
    case LogLevel::Warning: return logging::trivial::warning;
    case LogLevel::Error:   return logging::trivial::error;
    case LogLevel::Fatal:   return logging::trivial::fatal;
    }
    return logging::trivial::info;
  }
}

void SetLogLevel(LogLevel level)
{
  logging::core::get()->set_filter(logging::trivial::severity >= ToSeverity(level));
}

void InitConsoleLog()
{
  logging::add_common_attributes();
  logging::add_console_log(std::clog,
    logging::keywords::format = (
      logging::expressions::stream
        << "[" << logging::trivial::severity << "] "
        << logging::expressions::smessage));
}

}
