#include "verifs/FileStorage.hpp"
#include <algorithm>
#include <fstream>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "verifs/StreamError.hpp"
#include "util/Assert.hpp"

namespace verifs
{

namespace fs = boost::filesystem;

namespace
{

// Read-only instances are handed out only through IStorage
class FileStorage: public IWritableStorage
{
public:
  FileStorage(fs::path const & fileName, bool writable)
    : m_fileName(fs::absolute(fileName)) // Reopen on truncate shouldn't rely on current directory
    , m_writable(writable)
  {
    open();
    m_stream.seekg(0, std::ios_base::end);
    m_size = uint64_t(m_stream.tellg());
  }

  uint64_t size() const override { return m_size; }

  void read(uint64_t position, size_t size, void * data) const override
  {
    if (position > m_size || size > m_size - position)
      ThrowStreamError(ErrorCode::InvalidArgument, "Read past the end of " + m_fileName.string());
    m_stream.seekg(std::streamoff(position));
    m_stream.read(reinterpret_cast<char *>(data), std::streamsize(size));
  }

  void write(uint64_t position, size_t size, void const * data) override
  {
    m_stream.seekp(std::streamoff(position));
    m_stream.write(reinterpret_cast<const char *>(data), std::streamsize(size));
    m_size = std::max(m_size, position + size);
  }

  void resize(uint64_t size) override
  {
    if (size > m_size)
    {
      m_stream.seekp(std::streamoff(size - 1));
      char zeroChar = 0;
      m_stream.write(&zeroChar, 1);
    }
    else if (size < m_size)
    {
      m_stream.close();
      fs::resize_file(m_fileName, size);
      open();
    }
    m_size = size;
  }

private:
  fs::path const m_fileName;
  bool const m_writable;
  mutable fs::fstream m_stream;
  uint64_t m_size;

  void open()
  {
    std::ios_base::openmode openmode = std::ios_base::binary | std::ios_base::in;
    if (m_writable)
    {
      openmode |= std::ios_base::out;
      if (!fs::exists(m_fileName))
        openmode |= std::ios_base::trunc;
    }
    m_stream.exceptions(std::ios_base::goodbit);
    m_stream.open(m_fileName, openmode);
    if (!m_stream.is_open())
      ThrowStreamError(ErrorCode::InvalidArgument, "Can't open file " + m_fileName.string());
    m_stream.exceptions(std::fstream::failbit | std::fstream::badbit);
  }
};

}

std::unique_ptr<IStorage> OpenFileStorage(const char * fileName)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName, false));
}

std::unique_ptr<IStorage> OpenFileStorage(const wchar_t * fileName)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName, false));
}

std::unique_ptr<IWritableStorage> OpenWritableFileStorage(const char * fileName)
{
  return std::unique_ptr<IWritableStorage>(new FileStorage(fileName, true));
}

std::unique_ptr<IWritableStorage> OpenWritableFileStorage(const wchar_t * fileName)
{
  return std::unique_ptr<IWritableStorage>(new FileStorage(fileName, true));
}

}
