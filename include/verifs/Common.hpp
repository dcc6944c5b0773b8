#ifndef _VERIFS_API_COMMON_H
#define _VERIFS_API_COMMON_H

#include <stddef.h>
#include <cstdint>

namespace verifs
{

// Number of checksum chunks that can be fetched by a single readChunk() call.
// Reads made to the underlying source are at most ChunksPerRead * maxChunkSize.
const size_t ChunksPerRead = 32;

// All checksums are 32-bit, stored big-endian
const size_t ChecksumSize = 4;

// Returned by read() when nothing was read because the end of data was reached
const int64_t EndOfStream = -1;

}

#endif
