#include "verifs/SeekableStream.hpp"
#include "verifs/StreamError.hpp"

namespace verifs
{

namespace
{
  [[noreturn]]
  void ThrowPrematureEnd()
  {
    throw StreamError(ErrorCode::EndOfStream, "End of file reached before reading fully");
  }
}

void SeekableStream::readFully(char * buffer, size_t bufferSize, size_t offset, size_t length)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  size_t n = 0;
  while (n < length)
  {
    int64_t const nread = read(buffer, bufferSize, offset + n, length - n);
    if (nread <= 0)
      ThrowPrematureEnd();
    n += size_t(nread);
  }
}

int64_t SeekableStream::readAt(int64_t position, char * buffer, size_t bufferSize, size_t offset, size_t length)
{
  // Checked before seeking, so a bad range causes no I/O
  if (offset > bufferSize || length > bufferSize - offset)
    throw StreamError(ErrorCode::InvalidArgument, "Read range is out of buffer bounds");
  if (length == 0)
    return 0;

  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  int64_t const savedPosition = this->position();
  int64_t nread;
  try
  {
    seek(position);
    nread = read(buffer, bufferSize, offset, length);
  }
  catch (...)
  {
    seek(savedPosition);
    throw;
  }
  seek(savedPosition);
  return nread;
}

void SeekableStream::readFullyAt(int64_t position, char * buffer, size_t bufferSize, size_t offset, size_t length)
{
  size_t n = 0;
  while (n < length)
  {
    int64_t const nread = readAt(position + int64_t(n), buffer, bufferSize, offset + n, length - n);
    if (nread <= 0)
      ThrowPrematureEnd();
    n += size_t(nread);
  }
}

void SeekableStream::readFullyAt(int64_t position, std::vector<char> & buffer)
{
  readFullyAt(position, buffer.data(), buffer.size(), 0, buffer.size());
}

}
