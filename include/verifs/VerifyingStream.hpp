#ifndef _VERIFS_API_VERIFYING_STREAM_H
#define _VERIFS_API_VERIFYING_STREAM_H

#include <memory>
#include <string>
#include "verifs/Defs.hpp"
#include "verifs/IChecksum.hpp"
#include "verifs/IChunkSource.hpp"
#include "verifs/SeekableStream.hpp"

namespace verifs
{

struct StreamOptions
{
  bool verifyChecksum = true;
  size_t maxChunkSize = 512;          // data bytes covered by one checksum
  size_t checksumSize = ChecksumSize;
  unsigned retries = 3;               // fetch attempts per chunk when checksum fails
  std::string sourceName;             // used in error messages
};

// Buffered stream verifying checksums of every chunk read from IChunkSource.
// On checksum error switches to another copy of the data and retries.
class VERIFS_API_DECL VerifyingStream: public SeekableStream
{
public:
  // 'checksum' may be null, then nothing is verified
  VerifyingStream(IChunkSource &, std::unique_ptr<IChecksum> && checksum,
    StreamOptions const & = StreamOptions());
  ~VerifyingStream();

  // Returns next byte or -1 at the end of data
  int readByte();
  int64_t read(char * buffer, size_t bufferSize, size_t offset, size_t length) override;

  // Skipping past the end of data is allowed, subsequent read() returns EndOfStream
  int64_t skip(int64_t n);

  // Negative position is ignored
  void seek(int64_t position) override;
  int64_t position() const override;
  bool seekToNewSource(int64_t position) override;

  // Bytes that can be read without fetching from the source
  size_t available() const;

  bool markSupported() const { return false; }
  void mark(size_t readLimit);
  void reset();

  bool needChecksum() const;
  void setVerifyChecksum(bool);

private:
  class Impl;
  Impl * m_impl;
};

}

#endif
