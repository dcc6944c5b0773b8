#ifndef _VERIFS_API_STREAM_ERROR_H
#define _VERIFS_API_STREAM_ERROR_H

#include <cstdint>
#include <boost/optional.hpp>
#include "verifs/Defs.hpp"

namespace verifs
{

enum class ErrorCode
{
  InvalidArgument,
  EndOfStream,
  ChecksumMismatch,
  UnsupportedOperation,
  InvalidConfiguration,
  InvalidStorageFormat,
  InternalExpectationFail
};

class VERIFS_API_DECL StreamError
{
public:
  StreamError(ErrorCode code, const char * msg);
  StreamError(ErrorCode code, const char * msg, int64_t position); // position of the corrupted data
  StreamError(StreamError const &);
  StreamError(StreamError &&);
  ~StreamError();

  StreamError & operator=(StreamError const &);
  StreamError & operator=(StreamError &&);

  ErrorCode code() const;
  const char * message() const;
  boost::optional<int64_t> position() const;

private:
  class Impl;
  Impl * m_impl;
};

}

#endif
