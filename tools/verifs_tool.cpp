#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>
#include "verifs/Access.hpp"
#include "verifs/CommandFormat.hpp"
#include "verifs/DiskUsage.hpp"
#include "verifs/FileStorage.hpp"
#include "verifs/IChecksum.hpp"
#include "verifs/Logging.hpp"
#include "verifs/ModeParser.hpp"
#include "verifs/StorageChunkSource.hpp"
#include "verifs/StreamError.hpp"
#include "verifs/VerifyingStream.hpp"

namespace
{

const size_t ChunkSize = 512;
const char * const ChecksumsExtension = ".crc";

void PrintUsage()
{
  std::cerr <<
    "Usage: verifs-tool [-v] <command> ...\n"
    "  checksum [-c32c] <file>                 write checksums of <file> to <file>.crc\n"
    "  cat [-noverify] [-c32c] <file> [copy...] print <file> verifying checksums\n"
    "  du <path>                               print disk usage of <path>\n"
    "  chmod [-dir] <mode> <octal mode>        print mode after applying <mode>\n";
}

verifs::ChecksumType ChecksumTypeOf(verifs::CommandFormat const & format)
{
  return format.getOpt("c32c") ? verifs::ChecksumType::Crc32c : verifs::ChecksumType::Crc32;
}

std::shared_ptr<verifs::IStorage const> OpenReadOnly(std::string const & fileName)
{
  return verifs::OpenFileStorage(fileName.c_str());
}

int Checksum(std::vector<std::string> const & args)
{
  verifs::CommandFormat format("checksum", 1, 1, { "c32c" });
  auto const params = format.parse(args, 1);

  auto data = OpenReadOnly(params[0]);
  auto checksums = verifs::OpenWritableFileStorage((params[0] + ChecksumsExtension).c_str());
  verifs::WriteChecksums(*data, *checksums, ChunkSize, *verifs::MakeChecksum(ChecksumTypeOf(format)));
  return 0;
}

int Cat(std::vector<std::string> const & args)
{
  verifs::CommandFormat format("cat", 1, std::numeric_limits<size_t>::max(), { "noverify", "c32c" });
  auto const params = format.parse(args, 1);

  std::vector<verifs::StorageChunkSource::Replica> replicas;
  for (auto const & fileName: params)
    replicas.push_back({ OpenReadOnly(fileName), OpenReadOnly(fileName + ChecksumsExtension) });
  verifs::StorageChunkSource source(replicas, ChunkSize);

  verifs::StreamOptions options;
  options.verifyChecksum = !format.getOpt("noverify");
  options.maxChunkSize = ChunkSize;
  options.retries = unsigned(replicas.size());
  options.sourceName = params[0];
  verifs::VerifyingStream stream(source, verifs::MakeChecksum(ChecksumTypeOf(format)), options);

  std::vector<char> buffer(verifs::ChunksPerRead * ChunkSize);
  for (;;)
  {
    int64_t const nread = stream.read(buffer.data(), buffer.size(), 0, buffer.size());
    if (nread < 0)
      break;
    std::cout.write(buffer.data(), std::streamsize(nread));
  }
  std::cout.flush();
  return 0;
}

int Du(std::vector<std::string> const & args)
{
  verifs::CommandFormat format("du", 1, 1);
  auto const params = format.parse(args, 1);

  verifs::DiskUsage usage(params[0], std::chrono::milliseconds(0));
  std::cout << usage.toString() << std::endl;
  return 0;
}

int Chmod(std::vector<std::string> const & args)
{
  verifs::CommandFormat format("chmod", 2, 2, { "dir" });
  auto const params = format.parse(args, 1);

  verifs::ModeParser parser(params[0]);
  uint16_t const existing = uint16_t(std::stoul(params[1], nullptr, 8));
  uint16_t const mode = parser.applyNewPermission(existing, format.getOpt("dir"));

  std::cout << std::oct << std::setw(4) << std::setfill('0') << mode << " "
    << verifs::Symbol(verifs::Access((mode >> 6) & 7))
    << verifs::Symbol(verifs::Access((mode >> 3) & 7))
    << verifs::Symbol(verifs::Access(mode & 7))
    << ((mode & 01000) ? " sticky" : "") << std::endl;
  return 0;
}

}

int main(int argc, char ** argv)
{
  std::vector<std::string> args(argv + 1, argv + argc);

  verifs::InitConsoleLog();
  verifs::SetLogLevel(verifs::LogLevel::Info);
  if (!args.empty() && args[0] == "-v")
  {
    verifs::SetLogLevel(verifs::LogLevel::Debug);
    args.erase(args.begin());
  }

  if (args.empty())
  {
    PrintUsage();
    return 1;
  }

  try
  {
    std::string const & command = args[0];
    if (command == "checksum")
      return Checksum(args);
    if (command == "cat")
      return Cat(args);
    if (command == "du")
      return Du(args);
    if (command == "chmod")
      return Chmod(args);
    PrintUsage();
    return 1;
  }
  catch (verifs::StreamError const & e)
  {
    std::cerr << args[0] << ": " << e.message() << std::endl;
    return 2;
  }
  catch (std::invalid_argument const & e)
  {
    std::cerr << args[0] << ": " << e.what() << std::endl;
    PrintUsage();
    return 1;
  }
  catch (std::exception const & e)
  {
    std::cerr << args[0] << ": " << e.what() << std::endl;
    return 2;
  }
}
