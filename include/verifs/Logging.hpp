#ifndef _VERIFS_API_LOGGING_H
#define _VERIFS_API_LOGGING_H

#include "verifs/Defs.hpp"

namespace verifs
{

enum class LogLevel
{
  Trace,
  Debug,
  Info,
  Warning,
  Error,
  Fatal
};

// Messages below 'level' are dropped
VERIFS_API_DECL void SetLogLevel(LogLevel level);

// Adds console sink writing to stderr
VERIFS_API_DECL void InitConsoleLog();

}

#endif
