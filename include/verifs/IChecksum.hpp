#ifndef _VERIFS_API_ICHECKSUM_H
#define _VERIFS_API_ICHECKSUM_H

#include <cstdint>
#include <memory>
#include "verifs/Common.hpp"
#include "verifs/Defs.hpp"

namespace verifs
{

// Running 32-bit checksum
class IChecksum
{
public:
  virtual void update(void const * data, size_t size) = 0;
  virtual uint32_t value() const = 0;
  virtual void reset() = 0;

  virtual ~IChecksum() {}
};

enum class ChecksumType
{
  Crc32,  // IEEE 802.3 polynomial, as in zlib
  Crc32c  // Castagnoli polynomial
};

VERIFS_API_DECL std::unique_ptr<IChecksum> MakeChecksum(ChecksumType = ChecksumType::Crc32);

class IStorage;
class IWritableStorage;

// Computes a checksum for every chunkSize bytes of 'data' and stores them in 'checksums'
// as big-endian 32-bit values. The last chunk may be shorter than chunkSize.
VERIFS_API_DECL void WriteChecksums(IStorage const & data, IWritableStorage & checksums,
  size_t chunkSize, IChecksum & checksum);

}

#endif
