#ifndef _VERIFS_API_STORAGE_CHUNK_SOURCE_H
#define _VERIFS_API_STORAGE_CHUNK_SOURCE_H

#include <memory>
#include <vector>
#include <boost/dynamic_bitset.hpp>
#include "verifs/Defs.hpp"
#include "verifs/IChunkSource.hpp"
#include "verifs/IStorage.hpp"

namespace verifs
{

// Chunk source reading fixed-size chunks from one of several copies of the same data.
// Every copy has its own checksums storage as written by WriteChecksums().
class VERIFS_API_DECL StorageChunkSource: public IChunkSource
{
public:
  struct Replica
  {
    std::shared_ptr<IStorage const> data;
    std::shared_ptr<IStorage const> checksums;
  };

  StorageChunkSource(std::vector<Replica> const & replicas, size_t chunkSize);

  int64_t readChunk(int64_t position, char * buffer, size_t size,
    char * checksums, size_t checksumsSize) override;
  int64_t chunkPosition(int64_t position) const override;
  bool seekToNewSource(int64_t position) override;

  size_t chunkSize() const { return m_chunkSize; }
  size_t currentReplica() const { return m_current; }
  uint64_t size() const;

private:
  std::vector<Replica> const m_replicas;
  size_t const m_chunkSize;
  size_t m_current;
  boost::dynamic_bitset<> m_failedReplicas;
};

}

#endif
