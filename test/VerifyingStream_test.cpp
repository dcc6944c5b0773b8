#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>
#include <thread>
#include <vector>
#include "verifs/StreamError.hpp"
#include "verifs/VerifyingStream.hpp"
#include "ScriptedChunkSource.hpp"

namespace
{
  const size_t ChunkSize = 64;

  verifs::StreamOptions Options(unsigned retries = 3)
  {
    verifs::StreamOptions options;
    options.maxChunkSize = ChunkSize;
    options.retries = retries;
    options.sourceName = "test";
    return options;
  }

  std::unique_ptr<verifs::VerifyingStream> MakeStream(ScriptedChunkSource & source, unsigned retries = 3)
  {
    return std::unique_ptr<verifs::VerifyingStream>(
      new verifs::VerifyingStream(source, verifs::MakeChecksum(), Options(retries)));
  }

  std::vector<char> ReadToEnd(verifs::VerifyingStream & stream, size_t pieceSize)
  {
    std::vector<char> result;
    std::vector<char> buffer(pieceSize);
    for (;;)
    {
      int64_t nread = stream.read(buffer.data(), buffer.size(), 0, buffer.size());
      if (nread == verifs::EndOfStream)
        break;
      EXPECT_GT(nread, 0);
      result.insert(result.end(), buffer.begin(), buffer.begin() + nread);
    }
    return result;
  }

  template<class Func>
  verifs::StreamError CatchStreamError(Func const & func)
  {
    try
    {
      func();
    }
    catch (verifs::StreamError const & e)
    {
      return e;
    }
    ADD_FAILURE() << "StreamError expected";
    return verifs::StreamError(verifs::ErrorCode::InternalExpectationFail, "not thrown");
  }
}

TEST(VerifyingStream, SequentialReadReproducesData)
{
  auto const data = RandomData(10 * ChunkSize + 17);
  for (size_t pieceSize: { 1, 7, 63, 64, 65, 100, 300, 5000 })
  {
    ScriptedChunkSource source(data, ChunkSize);
    auto stream = MakeStream(source);
    EXPECT_EQ(data, ReadToEnd(*stream, pieceSize)) << "piece size " << pieceSize;
    EXPECT_EQ(int64_t(data.size()), stream->position());
  }
}

TEST(VerifyingStream, ReadByte)
{
  auto const data = RandomData(ChunkSize + 3);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  for (char expected: data)
    EXPECT_EQ(int(static_cast<unsigned char>(expected)), stream->readByte());
  EXPECT_EQ(-1, stream->readByte());
  EXPECT_EQ(-1, stream->readByte());
}

TEST(VerifyingStream, EmptyStream)
{
  ScriptedChunkSource source({}, ChunkSize);
  auto stream = MakeStream(source);
  char buffer[10];
  EXPECT_EQ(verifs::EndOfStream, stream->read(buffer, sizeof(buffer), 0, sizeof(buffer)));
  EXPECT_EQ(-1, stream->readByte());
  EXPECT_EQ(0, stream->position());
}

TEST(VerifyingStream, LargeReadBypassesLocalBuffer)
{
  auto const data = RandomData(4 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  std::vector<char> buffer(data.size());
  EXPECT_EQ(int64_t(data.size()), stream->read(buffer.data(), buffer.size(), 0, buffer.size()));
  EXPECT_EQ(data, buffer);
  EXPECT_EQ(1u, source.readCalls);
  EXPECT_EQ(0u, stream->available());
}

TEST(VerifyingStream, PositionAndAvailable)
{
  auto const data = RandomData(3 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  EXPECT_EQ(0, stream->position());
  EXPECT_EQ(0u, stream->available());

  char buffer[10];
  EXPECT_EQ(10, stream->read(buffer, sizeof(buffer), 0, sizeof(buffer)));
  EXPECT_EQ(10, stream->position());
  EXPECT_EQ(ChunkSize - 10, stream->available());
}

TEST(VerifyingStream, SeekInsideBufferDoesNotFetch)
{
  auto const data = RandomData(3 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  char buffer[10];
  stream->read(buffer, sizeof(buffer), 0, sizeof(buffer));
  ASSERT_EQ(1u, source.readCalls);

  for (int64_t position: { 3, 0, 63, 10 })
  {
    stream->seek(position);
    EXPECT_EQ(position, stream->position());
    EXPECT_EQ(int(static_cast<unsigned char>(data[position])), stream->readByte());
  }
  EXPECT_EQ(1u, source.readCalls);
}

TEST(VerifyingStream, SeekStartsFromChunkBoundary)
{
  auto const data = RandomData(5 * ChunkSize);
  for (int64_t position: { 200, 128, 64, 1, 319 })
  {
    ScriptedChunkSource source(data, ChunkSize);
    auto stream = MakeStream(source);
    stream->seek(position);
    EXPECT_EQ(position, stream->position());
    EXPECT_EQ(int(static_cast<unsigned char>(data[position])), stream->readByte());

    ASSERT_FALSE(source.readPositions.empty());
    int64_t const chunkStart = source.chunkPosition(position);
    EXPECT_EQ(chunkStart, source.readPositions.front());
    EXPECT_LE(source.readPositions.front(), position);
  }
}

TEST(VerifyingStream, SeekToChunkBoundaryDefersFetch)
{
  auto const data = RandomData(5 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(2 * ChunkSize);
  EXPECT_EQ(0u, source.readCalls);
  EXPECT_EQ(int64_t(2 * ChunkSize), stream->position());
  EXPECT_EQ(int(static_cast<unsigned char>(data[2 * ChunkSize])), stream->readByte());
  EXPECT_EQ(int64_t(2 * ChunkSize), source.readPositions.front());
}

TEST(VerifyingStream, SeekBackwardsOutsideBuffer)
{
  auto const data = RandomData(5 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(4 * ChunkSize + 5);
  stream->seek(70);
  std::vector<char> buffer(100);
  EXPECT_EQ(100, stream->read(buffer.data(), buffer.size(), 0, buffer.size()));
  EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), data.begin() + 70));
}

// Seeking before the beginning of the stream is silently ignored. This is
// kept on purpose: existing callers rely on it.
TEST(VerifyingStream, NegativeSeekIsIgnored)
{
  auto const data = RandomData(2 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(20);
  unsigned const readCalls = source.readCalls;
  stream->seek(-1);
  stream->seek(-1000);
  EXPECT_EQ(20, stream->position());
  EXPECT_EQ(readCalls, source.readCalls);
  EXPECT_EQ(int(static_cast<unsigned char>(data[20])), stream->readByte());
}

TEST(VerifyingStream, FailoverToAnotherCopy)
{
  auto const data = RandomData(10 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize, 2);
  source.corrupt(0, 70);
  auto stream = MakeStream(source);

  std::vector<char> buffer(data.size());
  EXPECT_EQ(int64_t(data.size()), stream->read(buffer.data(), buffer.size(), 0, buffer.size()));
  EXPECT_EQ(data, buffer);
  EXPECT_EQ(1u, source.switchCalls);
  EXPECT_EQ(2u, source.readCalls);
  EXPECT_EQ(1u, source.current);
}

TEST(VerifyingStream, FailoverOnLocalBufferFill)
{
  auto const data = RandomData(3 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize, 2);
  source.corrupt(0, 5);
  auto stream = MakeStream(source);

  EXPECT_EQ(data, ReadToEnd(*stream, 10));
  EXPECT_EQ(1u, source.switchCalls);
}

TEST(VerifyingStream, ChecksumErrorWithoutAnotherCopy)
{
  auto const data = RandomData(10 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  source.corrupt(0, 70);
  auto stream = MakeStream(source);

  std::vector<char> buffer(data.size());
  auto error = CatchStreamError([&]{ stream->read(buffer.data(), buffer.size(), 0, buffer.size()); });
  EXPECT_EQ(verifs::ErrorCode::ChecksumMismatch, error.code());
  ASSERT_TRUE(bool(error.position()));
  EXPECT_EQ(int64_t(ChunkSize), *error.position());
  EXPECT_EQ(1u, source.readCalls);
  EXPECT_EQ(1u, source.switchCalls);
}

TEST(VerifyingStream, ChecksumErrorWhenRetriesExhausted)
{
  auto const data = RandomData(4 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize, 3);
  for (size_t copy = 0; copy < 3; ++copy)
    source.corrupt(copy, 2 * ChunkSize + 1);
  auto stream = MakeStream(source, 2);

  std::vector<char> buffer(data.size());
  auto error = CatchStreamError([&]{ stream->read(buffer.data(), buffer.size(), 0, buffer.size()); });
  EXPECT_EQ(verifs::ErrorCode::ChecksumMismatch, error.code());
  ASSERT_TRUE(bool(error.position()));
  EXPECT_EQ(int64_t(2 * ChunkSize), *error.position());
  EXPECT_EQ(2u, source.readCalls);
  EXPECT_EQ(1u, source.switchCalls);
}

TEST(VerifyingStream, SingleAttemptDoesNotFailover)
{
  auto const data = RandomData(ChunkSize);
  ScriptedChunkSource source(data, ChunkSize, 2);
  source.corrupt(0, 0);
  auto stream = MakeStream(source, 1);
  EXPECT_EQ(verifs::ErrorCode::ChecksumMismatch, CatchStreamError([&]{ stream->readByte(); }).code());
  EXPECT_EQ(0u, source.switchCalls);
}

TEST(VerifyingStream, SeekVerifiesSkippedPartOfChunk)
{
  auto const data = RandomData(4 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  source.corrupt(0, 2 * ChunkSize + 3);
  auto stream = MakeStream(source);

  auto error = CatchStreamError([&]{ stream->seek(2 * ChunkSize + 10); });
  EXPECT_EQ(verifs::ErrorCode::ChecksumMismatch, error.code());
  EXPECT_EQ(int64_t(2 * ChunkSize), *error.position());
}

TEST(VerifyingStream, PartialReadAtEnd)
{
  auto const data = RandomData(160);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(100);

  std::vector<char> buffer(100);
  EXPECT_EQ(60, stream->read(buffer.data(), buffer.size(), 0, buffer.size()));
  EXPECT_TRUE(std::equal(data.begin() + 100, data.end(), buffer.begin()));
  EXPECT_EQ(verifs::EndOfStream, stream->read(buffer.data(), buffer.size(), 0, buffer.size()));
}

TEST(VerifyingStream, ReadFullyFailsAtEnd)
{
  auto const data = RandomData(160);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(100);

  std::vector<char> buffer(100);
  auto error = CatchStreamError([&]{ stream->readFully(buffer.data(), buffer.size(), 0, buffer.size()); });
  EXPECT_EQ(verifs::ErrorCode::EndOfStream, error.code());

  stream->seek(100);
  stream->readFully(buffer.data(), buffer.size(), 40, 60);
  EXPECT_TRUE(std::equal(data.begin() + 100, data.end(), buffer.begin() + 40));
}

TEST(VerifyingStream, SkipPastEnd)
{
  auto const data = RandomData(100);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  EXPECT_EQ(500, stream->skip(500));

  char buffer[10];
  EXPECT_EQ(verifs::EndOfStream, stream->read(buffer, sizeof(buffer), 0, sizeof(buffer)));
  EXPECT_EQ(-1, stream->readByte());
}

TEST(VerifyingStream, SkipToLargestPosition)
{
  auto const data = RandomData(100);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(10);
  EXPECT_EQ(std::numeric_limits<int64_t>::max(), stream->skip(std::numeric_limits<int64_t>::max()));
  EXPECT_EQ(-1, stream->readByte());

  char buffer[10];
  EXPECT_EQ(verifs::EndOfStream, stream->read(buffer, sizeof(buffer), 0, sizeof(buffer)));
}

TEST(VerifyingStream, SkipNonPositive)
{
  auto const data = RandomData(100);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  stream->seek(10);
  EXPECT_EQ(0, stream->skip(0));
  EXPECT_EQ(0, stream->skip(-5));
  EXPECT_EQ(10, stream->position());

  EXPECT_EQ(30, stream->skip(30));
  EXPECT_EQ(40, stream->position());
  EXPECT_EQ(int(static_cast<unsigned char>(data[40])), stream->readByte());
}

TEST(VerifyingStream, EmptyReadDoesNotTouchSource)
{
  auto const data = RandomData(100);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  char buffer[10];
  EXPECT_EQ(0, stream->read(buffer, sizeof(buffer), 0, 0));
  EXPECT_EQ(0, stream->read(buffer, sizeof(buffer), 5, 0));
  EXPECT_EQ(0, stream->read(buffer, sizeof(buffer), sizeof(buffer), 0));
  EXPECT_EQ(0u, source.readCalls);
}

TEST(VerifyingStream, InvalidReadRange)
{
  auto const data = RandomData(100);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);
  char buffer[10];
  EXPECT_EQ(verifs::ErrorCode::InvalidArgument,
    CatchStreamError([&]{ stream->read(buffer, sizeof(buffer), 11, 0); }).code());
  EXPECT_EQ(verifs::ErrorCode::InvalidArgument,
    CatchStreamError([&]{ stream->read(buffer, sizeof(buffer), 5, 6); }).code());
  EXPECT_EQ(verifs::ErrorCode::InvalidArgument,
    CatchStreamError([&]{ stream->read(buffer, sizeof(buffer), 0, 11); }).code());
  EXPECT_EQ(0u, source.readCalls);
}

TEST(VerifyingStream, MarkAndResetUnsupported)
{
  ScriptedChunkSource source(RandomData(100), ChunkSize);
  auto stream = MakeStream(source);
  EXPECT_FALSE(stream->markSupported());
  EXPECT_EQ(verifs::ErrorCode::UnsupportedOperation, CatchStreamError([&]{ stream->mark(10); }).code());
  EXPECT_EQ(verifs::ErrorCode::UnsupportedOperation, CatchStreamError([&]{ stream->reset(); }).code());
}

TEST(VerifyingStream, InvalidConfiguration)
{
  ScriptedChunkSource source(RandomData(100), ChunkSize);
  auto construct = [&](verifs::StreamOptions const & options, bool withChecksum)
  {
    return CatchStreamError([&]{
      verifs::VerifyingStream stream(source,
        withChecksum ? verifs::MakeChecksum() : std::unique_ptr<verifs::IChecksum>(), options);
    }).code();
  };

  auto options = Options();
  options.checksumSize = 8;
  EXPECT_EQ(verifs::ErrorCode::InvalidConfiguration, construct(options, true));

  options = Options();
  options.maxChunkSize = 0;
  EXPECT_EQ(verifs::ErrorCode::InvalidConfiguration, construct(options, true));

  options = Options();
  options.retries = 0;
  EXPECT_EQ(verifs::ErrorCode::InvalidConfiguration, construct(options, true));

  // Checksum size doesn't matter when there is nothing to verify
  options = Options();
  options.checksumSize = 8;
  EXPECT_NO_THROW({ verifs::VerifyingStream stream(source, std::unique_ptr<verifs::IChecksum>(), options); });
}

TEST(VerifyingStream, VerificationDisabled)
{
  auto const data = RandomData(3 * ChunkSize + 5);
  ScriptedChunkSource source(data, ChunkSize);
  source.corrupt(0, 10);
  auto options = Options();
  options.verifyChecksum = false;
  verifs::VerifyingStream stream(source, verifs::MakeChecksum(), options);
  EXPECT_FALSE(stream.needChecksum());

  auto expected = data;
  expected[10] ^= 0x5A;
  EXPECT_EQ(expected, ReadToEnd(stream, 50));
  for (bool requested: source.checksumsRequested)
    EXPECT_FALSE(requested);
}

TEST(VerifyingStream, NoChecksumAlgorithm)
{
  auto const data = RandomData(2 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  source.corrupt(0, 1);
  verifs::VerifyingStream stream(source, std::unique_ptr<verifs::IChecksum>(), Options());
  EXPECT_FALSE(stream.needChecksum());
  EXPECT_EQ(2 * ChunkSize, ReadToEnd(stream, 7).size());
}

TEST(VerifyingStream, ToggleVerification)
{
  auto const data = RandomData(2 * ChunkSize);
  ScriptedChunkSource source(data, ChunkSize);
  source.corrupt(0, ChunkSize + 1);
  auto stream = MakeStream(source);
  EXPECT_TRUE(stream->needChecksum());

  stream->setVerifyChecksum(false);
  std::vector<char> buffer(data.size());
  EXPECT_EQ(int64_t(data.size()), stream->read(buffer.data(), buffer.size(), 0, buffer.size()));

  stream->setVerifyChecksum(true);
  stream->seek(ChunkSize);
  EXPECT_EQ(verifs::ErrorCode::ChecksumMismatch, CatchStreamError([&]{ stream->readByte(); }).code());
}

TEST(VerifyingStream, ConcurrentPositionedReads)
{
  auto const data = RandomData(50 * ChunkSize + 11);
  ScriptedChunkSource source(data, ChunkSize);
  auto stream = MakeStream(source);

  std::vector<std::thread> threads;
  std::vector<unsigned> mismatches(4, 0);
  for (unsigned t = 0; t < mismatches.size(); ++t)
  {
    threads.emplace_back([&, t]{
      std::minstd_rand random_engine(t + 1);
      std::uniform_int_distribution<size_t> positions(0, data.size() - 100);
      std::vector<char> buffer(100);
      for (int i = 0; i < 200; ++i)
      {
        size_t const position = positions(random_engine);
        stream->readFullyAt(int64_t(position), buffer);
        if (!std::equal(buffer.begin(), buffer.end(), data.begin() + position))
          ++mismatches[t];
      }
    });
  }
  for (auto & thread: threads)
    thread.join();

  for (unsigned count: mismatches)
    EXPECT_EQ(0u, count);
  EXPECT_EQ(0, stream->position());
}
