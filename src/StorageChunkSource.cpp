#include "verifs/StorageChunkSource.hpp"
#include <algorithm>
#include "verifs/StreamError.hpp"
#include "util/Assert.hpp"
#include "util/Chunks.hpp"
#include "util/Log.hpp"

namespace verifs
{

StorageChunkSource::StorageChunkSource(std::vector<Replica> const & replicas, size_t chunkSize)
  : m_replicas(replicas)
  , m_chunkSize(chunkSize)
  , m_current(0)
  , m_failedReplicas(replicas.size())
{
  if (m_replicas.empty())
    throw StreamError(ErrorCode::InvalidConfiguration, "At least one replica is required");
  if (m_chunkSize == 0)
    throw StreamError(ErrorCode::InvalidConfiguration, "Chunk size must be positive");
  for (auto const & replica: m_replicas)
    if (!replica.data || !replica.checksums)
      throw StreamError(ErrorCode::InvalidConfiguration, "Replica requires data and checksums storages");
}

uint64_t StorageChunkSource::size() const
{
  return m_replicas[m_current].data->size();
}

int64_t StorageChunkSource::chunkPosition(int64_t position) const
{
  return position - position % int64_t(m_chunkSize);
}

int64_t StorageChunkSource::readChunk(int64_t position, char * buffer, size_t size,
  char * checksums, size_t checksumsSize)
{
  Replica const & replica = m_replicas[m_current];
  uint64_t const dataSize = replica.data->size();
  if (position < 0 || uint64_t(position) >= dataSize)
    return -1;

  uint64_t const remaining = dataSize - uint64_t(position);
  if (!checksums)
  {
    size_t const nread = size_t(std::min(uint64_t(size), remaining));
    replica.data->read(uint64_t(position), nread, buffer);
    return int64_t(nread);
  }

  if (position % int64_t(m_chunkSize) != 0)
    throw StreamError(ErrorCode::InvalidArgument, "Read position isn't aligned to chunk boundary");

  uint64_t const chunks = std::min(size / m_chunkSize, checksumsSize / ChecksumSize);
  if (chunks == 0)
    throw StreamError(ErrorCode::InvalidArgument, "Read size is less than chunk size");

  size_t const nread = size_t(std::min(chunks * m_chunkSize, remaining));
  uint64_t const firstChunk = uint64_t(position) / m_chunkSize;
  size_t const checksumsCount = util::ChunksCount(nread, m_chunkSize);
  VERIFS_FORMAT_ASSERT((firstChunk + checksumsCount) * ChecksumSize <= replica.checksums->size());

  replica.data->read(uint64_t(position), nread, buffer);
  replica.checksums->read(firstChunk * ChecksumSize, checksumsCount * ChecksumSize, checksums);
  return int64_t(nread);
}

bool StorageChunkSource::seekToNewSource(int64_t position)
{
  m_failedReplicas.set(m_current);
  for (size_t step = 1; step < m_replicas.size(); ++step)
  {
    size_t const candidate = (m_current + step) % m_replicas.size();
    if (!m_failedReplicas.test(candidate))
    {
      VERIFS_LOG(info) << "Replica " << m_current << " failed at " << position
        << ", switching to replica " << candidate;
      m_current = candidate;
      return true;
    }
  }
  VERIFS_LOG(warning) << "No more replicas to read position " << position << " from";
  return false;
}

}
