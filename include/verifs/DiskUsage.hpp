#ifndef _VERIFS_API_DISK_USAGE_H
#define _VERIFS_API_DISK_USAGE_H

#include <chrono>
#include <cstdint>
#include <string>
#include "verifs/Defs.hpp"

namespace verifs
{

// Disk space used by a directory as reported by "du -sk".
// Optionally refreshed periodically by a background thread.
class VERIFS_API_DECL DiskUsage
{
public:
  DiskUsage(std::string const & path,
    std::chrono::milliseconds refreshInterval = std::chrono::minutes(10)); // runs "du" once
  ~DiskUsage();

  DiskUsage(DiskUsage const &) = delete;
  void operator =(DiskUsage const &) = delete;

  // Starts refresh thread if refresh interval is positive
  void start();
  void shutdown();

  // Bytes used. Runs "du" if refresh thread isn't started, otherwise
  // throws the error happened on the last refresh, if any.
  int64_t used();
  void incUsed(int64_t value);
  void decUsed(int64_t value);

  std::string const & dirPath() const;
  std::string toString() const;

private:
  struct Impl;
  Impl * m_impl;
};

}

#endif
