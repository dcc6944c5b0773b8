#include "verifs/StreamError.hpp"
#include <string>

namespace verifs
{

class StreamError::Impl
{
public:
  ErrorCode code;
  std::string message;
  boost::optional<int64_t> position;
};

StreamError::StreamError(ErrorCode code, const char * msg)
  : m_impl(new Impl)
{
  m_impl->message = msg;
  m_impl->code = code;
}

StreamError::StreamError(ErrorCode code, const char * msg, int64_t position)
  : StreamError(code, msg)
{
  m_impl->position = position;
}

StreamError::StreamError(StreamError && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

StreamError::StreamError(StreamError const & src)
  : m_impl(new Impl(*src.m_impl))
{
}

StreamError::~StreamError()
{
  delete m_impl;
}

StreamError & StreamError::operator=(StreamError const & src)
{
  if (m_impl)
    *m_impl = *src.m_impl;
  else
    m_impl = new Impl(*src.m_impl);
  return *this;
}

StreamError & StreamError::operator=(StreamError && src)
{
  delete m_impl;
  m_impl = src.m_impl;
  src.m_impl = nullptr;
  return *this;
}

ErrorCode StreamError::code() const
{
  return m_impl->code;
}

const char * StreamError::message() const
{
  return m_impl->message.c_str();
}

boost::optional<int64_t> StreamError::position() const
{
  return m_impl->position;
}

}
