#ifndef _VERIFS_API_ICHUNK_SOURCE_H
#define _VERIFS_API_ICHUNK_SOURCE_H

#include <cstdint>
#include "verifs/Common.hpp"

namespace verifs
{

// Backend supplying chunk-aligned data together with the stored checksums
class IChunkSource
{
public:
  // Reads data starting at chunk-aligned 'position' into 'buffer'.
  //
  // When 'checksums' is null, checksums aren't verified: 'size' may be any positive
  // value and implementations should simply pass through to the underlying data.
  //
  // Otherwise only an integer number of chunks may be read. The amount read is bounded
  // by 'size' and by checksumsSize / ChecksumSize chunks; 'size' isn't necessarily
  // a multiple of the chunk size. One big-endian checksum per chunk read is stored
  // to 'checksums'. The last chunk of the data may be short.
  //
  // Returns number of bytes read, 0 or -1 if there is no more data.
  virtual int64_t readChunk(int64_t position, char * buffer, size_t size,
    char * checksums, size_t checksumsSize) = 0;

  // Position of the beginning of the chunk containing 'position'
  virtual int64_t chunkPosition(int64_t position) const = 0;

  // Switches to another copy of the data. Returns false if no different copy was found.
  virtual bool seekToNewSource(int64_t position) = 0;

  virtual ~IChunkSource() {}
};

}

#endif
