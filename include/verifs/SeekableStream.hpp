#ifndef _VERIFS_API_SEEKABLE_STREAM_H
#define _VERIFS_API_SEEKABLE_STREAM_H

#include <cstdint>
#include <mutex>
#include <vector>
#include "verifs/Common.hpp"
#include "verifs/Defs.hpp"

namespace verifs
{

// Input stream with random access. All operations on one instance are serialized.
class VERIFS_API_DECL SeekableStream
{
public:
  SeekableStream() = default;
  SeekableStream(SeekableStream const &) = delete;
  void operator =(SeekableStream const &) = delete;

  virtual ~SeekableStream() {}

  // Next read() will be from 'position'
  virtual void seek(int64_t position) = 0;
  virtual int64_t position() const = 0;

  // Seeks a different copy of the data. Returns true if a new source was found.
  virtual bool seekToNewSource(int64_t position) = 0;

  // Reads up to 'length' bytes to buffer[offset]. Returns number of bytes read
  // or EndOfStream if nothing was read because the end of data was reached.
  virtual int64_t read(char * buffer, size_t bufferSize, size_t offset, size_t length) = 0;

  // Reads exactly 'length' bytes, throws ErrorCode::EndOfStream on premature end of data
  void readFully(char * buffer, size_t bufferSize, size_t offset, size_t length);

  // Positioned reads. Current position is restored on return, also when read fails.
  int64_t readAt(int64_t position, char * buffer, size_t bufferSize, size_t offset, size_t length);
  void readFullyAt(int64_t position, char * buffer, size_t bufferSize, size_t offset, size_t length);
  void readFullyAt(int64_t position, std::vector<char> & buffer);

protected:
  mutable std::recursive_mutex m_mutex;
};

}

#endif
