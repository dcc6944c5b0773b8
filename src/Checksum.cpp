#include "verifs/IChecksum.hpp"
#include <algorithm>
#include <vector>
#include <boost/crc.hpp>
#include "verifs/IStorage.hpp"
#include "verifs/StreamError.hpp"
#include "util/Chunks.hpp"

namespace verifs
{

namespace
{

template<class Crc>
class CrcChecksum: public IChecksum
{
public:
  void update(void const * data, size_t size) override
  {
    m_crc.process_bytes(data, size);
  }

  uint32_t value() const override
  {
    return m_crc.checksum();
  }

  void reset() override
  {
    m_crc.reset();
  }

private:
  Crc m_crc;
};

typedef boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true> crc_32c_type;

}

std::unique_ptr<IChecksum> MakeChecksum(ChecksumType type)
{
  switch (type)
  {
  case ChecksumType::Crc32c:
    return std::unique_ptr<IChecksum>(new CrcChecksum<crc_32c_type>);
  case ChecksumType::Crc32:
  default:
    return std::unique_ptr<IChecksum>(new CrcChecksum<boost::crc_32_type>);
  }
}

void WriteChecksums(IStorage const & data, IWritableStorage & checksums, size_t chunkSize, IChecksum & checksum)
{
  if (chunkSize == 0)
    throw StreamError(ErrorCode::InvalidArgument, "Chunk size must be positive");

  uint64_t const dataSize = data.size();
  uint64_t const chunksCount = util::ChunksCount(dataSize, chunkSize);
  checksums.resize(chunksCount * ChecksumSize);

  std::vector<char> chunk(chunkSize);
  char stored[ChecksumSize];
  checksum.reset();
  for (uint64_t index = 0; index < chunksCount; ++index)
  {
    uint64_t const position = index * chunkSize;
    size_t const size = size_t(std::min(uint64_t(chunkSize), dataSize - position));
    data.read(position, size, chunk.data());
    checksum.update(chunk.data(), size);
    util::StoreChecksum(checksum.value(), stored);
    checksum.reset();
    checksums.write(index * ChecksumSize, ChecksumSize, stored);
  }
}

}
