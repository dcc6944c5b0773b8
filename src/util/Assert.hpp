#pragma once

#include <string>
#include "verifs/StreamError.hpp"

namespace verifs
{

[[noreturn]]
inline void ThrowStreamError(ErrorCode code, const char * description)
{
  throw StreamError(code, description);
}

[[noreturn]]
inline void ThrowStreamError(ErrorCode code, std::string const & description)
{
  throw StreamError(code, description.c_str());
}

}

#define VERIFS_STRINGIFY_(s) #s
#define VERIFS_STRINGIFY(s) VERIFS_STRINGIFY_(s)

#define VERIFS_FORMAT_ASSERT(expression) \
  (void)((!!(expression)) || (::verifs::ThrowStreamError(::verifs::ErrorCode::InvalidStorageFormat, \
    "Invalid storage format at " __FILE__ " (" VERIFS_STRINGIFY(__LINE__) ")"), false))

#define VERIFS_ASSERT(expression) \
  (void)((!!(expression)) || (::verifs::ThrowStreamError(::verifs::ErrorCode::InternalExpectationFail, \
    "Internal expectation fail at " __FILE__ " (" VERIFS_STRINGIFY(__LINE__) ")"), false))
