#include "verifs/VerifyingStream.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <boost/algorithm/hex.hpp>
#include <boost/optional.hpp>
#include "util/Assert.hpp"
#include "util/Chunks.hpp"
#include "util/Log.hpp"

namespace verifs
{

namespace
{
  // Max number of bytes dumped to the log on checksum error
  const size_t MaxDumpSize = 64;

  struct ChecksumMismatch
  {
    int64_t position;
    uint32_t expected;
    uint32_t calculated;
  };

  std::string HexDump(char const * data, size_t size)
  {
    std::string result;
    boost::algorithm::hex(data, data + std::min(size, MaxDumpSize), std::back_inserter(result));
    if (size > MaxDumpSize)
      result += "...";
    return result;
  }
}

class VerifyingStream::Impl
{
public:
  Impl(IChunkSource & source, std::unique_ptr<IChecksum> && checksum, StreamOptions const & options)
    : m_source(source)
    , m_sum(std::move(checksum))
    , m_verifyChecksum(options.verifyChecksum)
    , m_maxChunkSize(options.maxChunkSize)
    , m_retries(options.retries)
    , m_sourceName(options.sourceName)
    , m_buffer(options.maxChunkSize)
    , m_checksums(ChunksPerRead * options.checksumSize)
    , m_pos(0)
    , m_count(0)
    , m_chunkPos(0)
  {}

  bool needChecksum() const { return m_verifyChecksum && m_sum; }
  void setVerifyChecksum(bool verify) { m_verifyChecksum = verify; }

  int readByte();
  int64_t read(char * buffer, size_t length);
  void seek(int64_t position);
  int64_t position() const { return m_chunkPos - int64_t(available()); }
  size_t available() const { return m_count - m_pos; }
  bool seekToNewSource(int64_t position) { return m_source.seekToNewSource(position); }

private:
  IChunkSource & m_source;
  std::unique_ptr<IChecksum> const m_sum;
  bool m_verifyChecksum;
  size_t const m_maxChunkSize;
  unsigned const m_retries;
  std::string const m_sourceName;
  std::vector<char> m_buffer;    // verified data of the last fetched chunk
  std::vector<char> m_checksums; // checksums fetched together with data
  size_t m_pos;                  // next byte to read in m_buffer
  size_t m_count;                // number of valid bytes in m_buffer
  int64_t m_chunkPos;            // source position of the next chunk to fetch

  int64_t read1(char * buffer, size_t length);
  void fill();
  void discard(int64_t size);
  int64_t readChecksumChunk(char * buffer, size_t length);
  boost::optional<ChecksumMismatch> verifySums(char const * buffer, size_t size);
  void resetState();
};

int VerifyingStream::Impl::readByte()
{
  if (m_pos >= m_count)
  {
    fill();
    if (m_pos >= m_count)
      return -1;
  }
  return static_cast<unsigned char>(m_buffer[m_pos++]);
}

int64_t VerifyingStream::Impl::read(char * buffer, size_t length)
{
  size_t n = 0;
  for (;;)
  {
    int64_t nread = read1(buffer + n, length - n);
    if (nread <= 0)
      return n == 0 ? nread : int64_t(n);
    n += size_t(nread);
    if (n >= length)
      return int64_t(n);
  }
}

// Reads from the source at most once
int64_t VerifyingStream::Impl::read1(char * buffer, size_t length)
{
  size_t avail = available();
  if (avail == 0)
  {
    if (length >= m_maxChunkSize)
      // Whole chunks go directly to the caller's buffer
      return readChecksumChunk(buffer, length);

    fill();
    if (m_count == 0)
      return EndOfStream;
    avail = m_count;
  }

  size_t const size = std::min(avail, length);
  memcpy(buffer, m_buffer.data() + m_pos, size);
  m_pos += size;
  return int64_t(size);
}

// Expects all buffered data to be consumed
void VerifyingStream::Impl::fill()
{
  VERIFS_ASSERT(m_pos >= m_count);
  int64_t const nread = readChecksumChunk(m_buffer.data(), m_maxChunkSize);
  m_count = nread > 0 ? size_t(nread) : 0;
}

void VerifyingStream::Impl::discard(int64_t size)
{
  while (size > 0)
  {
    if (m_pos >= m_count)
    {
      fill();
      if (m_count == 0)
        return; // past the end of data
    }
    size_t const step = size_t(std::min(int64_t(m_count - m_pos), size));
    m_pos += step;
    size -= int64_t(step);
  }
}

int64_t VerifyingStream::Impl::readChecksumChunk(char * buffer, size_t length)
{
  // invalidate buffer
  m_count = m_pos = 0;

  unsigned retriesLeft = m_retries;
  for (;;)
  {
    --retriesLeft;

    bool const verify = needChecksum();
    int64_t const nread = m_source.readChunk(m_chunkPos, buffer, length,
      verify ? m_checksums.data() : nullptr, verify ? m_checksums.size() : 0);
    if (nread <= 0)
      return EndOfStream;

    boost::optional<ChecksumMismatch> mismatch;
    if (verify)
      mismatch = verifySums(buffer, size_t(nread));
    if (!mismatch)
    {
      m_chunkPos += nread;
      return nread;
    }

    VERIFS_LOG(info) << "Found checksum error in " << m_sourceName
      << ": b[" << m_chunkPos << ", " << m_chunkPos + nread << "]="
      << HexDump(buffer, size_t(nread));

    std::string const message = "Checksum error: " + m_sourceName
      + " at " + std::to_string(mismatch->position)
      + " exp: " + std::to_string(mismatch->expected)
      + " got: " + std::to_string(mismatch->calculated);

    if (retriesLeft == 0)
      throw StreamError(ErrorCode::ChecksumMismatch, message.c_str(), mismatch->position);

    // Retrying the same copy would return the same data
    if (!m_source.seekToNewSource(m_chunkPos))
      throw StreamError(ErrorCode::ChecksumMismatch, message.c_str(), mismatch->position);

    VERIFS_LOG(warning) << "Switched " << m_sourceName << " to another source at "
      << m_chunkPos << ", " << retriesLeft << " attempts left";
    seek(m_chunkPos);
  }
}

boost::optional<ChecksumMismatch> VerifyingStream::Impl::verifySums(char const * buffer, size_t size)
{
  size_t const checksumsCount = util::ChunksCount(size, m_maxChunkSize);
  VERIFS_ASSERT(checksumsCount * ChecksumSize <= m_checksums.size());

  for (size_t index = 0, offset = 0; index < checksumsCount; ++index, offset += m_maxChunkSize)
  {
    m_sum->update(buffer + offset, std::min(size - offset, m_maxChunkSize));
    uint32_t const expected = util::LoadChecksum(m_checksums.data() + index * ChecksumSize);
    uint32_t const calculated = m_sum->value();
    m_sum->reset();

    if (expected != calculated)
      return ChecksumMismatch{ m_chunkPos + int64_t(offset), expected, calculated };
  }
  return boost::none;
}

void VerifyingStream::Impl::seek(int64_t position)
{
  if (position < 0)
    return;

  // Position inside of the buffered data
  int64_t const start = m_chunkPos - int64_t(m_count);
  if (position >= start && position < m_chunkPos)
  {
    m_pos = size_t(position - start);
    return;
  }

  resetState();
  m_chunkPos = m_source.chunkPosition(position);
  VERIFS_ASSERT(m_chunkPos <= position);

  // Data between chunk start and the position is verified as well
  discard(position - m_chunkPos);
}

void VerifyingStream::Impl::resetState()
{
  m_count = 0;
  m_pos = 0;
  if (m_sum)
    m_sum->reset();
}

VerifyingStream::VerifyingStream(IChunkSource & source, std::unique_ptr<IChecksum> && checksum,
    StreamOptions const & options)
  : m_impl(nullptr)
{
  if (options.maxChunkSize == 0)
    throw StreamError(ErrorCode::InvalidConfiguration, "Chunk size must be positive");
  if (options.retries == 0)
    throw StreamError(ErrorCode::InvalidConfiguration, "At least one read attempt is required");
  if (checksum && options.checksumSize != ChecksumSize)
    throw StreamError(ErrorCode::InvalidConfiguration, "Only 32-bit checksums are supported");

  m_impl = new Impl(source, std::move(checksum), options);
}

VerifyingStream::~VerifyingStream()
{
  delete m_impl;
}

int VerifyingStream::readByte()
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_impl->readByte();
}

int64_t VerifyingStream::read(char * buffer, size_t bufferSize, size_t offset, size_t length)
{
  if (offset > bufferSize || length > bufferSize - offset)
    throw StreamError(ErrorCode::InvalidArgument, "Read range is out of buffer bounds");
  if (length == 0)
    return 0;

  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_impl->read(buffer + offset, length);
}

int64_t VerifyingStream::skip(int64_t n)
{
  if (n <= 0)
    return 0;

  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  int64_t const position = m_impl->position();
  int64_t const maxPosition = std::numeric_limits<int64_t>::max();
  m_impl->seek(n > maxPosition - position ? maxPosition : position + n);
  return n;
}

void VerifyingStream::seek(int64_t position)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  m_impl->seek(position);
}

int64_t VerifyingStream::position() const
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_impl->position();
}

bool VerifyingStream::seekToNewSource(int64_t position)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_impl->seekToNewSource(position);
}

size_t VerifyingStream::available() const
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_impl->available();
}

void VerifyingStream::mark(size_t)
{
  throw StreamError(ErrorCode::UnsupportedOperation, "mark/reset not supported");
}

void VerifyingStream::reset()
{
  throw StreamError(ErrorCode::UnsupportedOperation, "mark/reset not supported");
}

bool VerifyingStream::needChecksum() const
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_impl->needChecksum();
}

void VerifyingStream::setVerifyChecksum(bool verify)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  m_impl->setVerifyChecksum(verify);
}

}
