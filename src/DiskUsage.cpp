#include "verifs/DiskUsage.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/process.hpp>
#include "util/Log.hpp"

namespace verifs
{

namespace bp = boost::process;

struct DiskUsage::Impl
{
  Impl(std::string const & path, std::chrono::milliseconds refreshInterval)
    : dirPath(boost::filesystem::canonical(path).string())
    , refreshInterval(refreshInterval)
    , used(0)
    , shouldRun(true)
  {}

  std::string const dirPath;
  std::chrono::milliseconds const refreshInterval;
  std::atomic<int64_t> used;

  std::mutex mutex;
  std::condition_variable wakeUp;
  bool shouldRun;
  std::exception_ptr lastError; // error of the last refresh, reported once by used()
  std::thread refreshThread;

  void run();
  void refreshLoop();
};

// Runs "du -sk <path>" and parses "<kilobytes>\t<path>"
void DiskUsage::Impl::run()
{
  boost::filesystem::path const du = bp::search_path("du");
  if (du.empty())
    throw std::runtime_error("Can't find \"du\" utility");

  bp::ipstream output;
  bp::child child(du, "-sk", dirPath, bp::std_out > output, bp::std_err > bp::null);

  std::string line, rest;
  bool const gotLine = bool(std::getline(output, line));
  while (std::getline(output, rest))
  {}
  child.wait();

  if (child.exit_code() != 0)
    throw std::runtime_error("\"du -sk " + dirPath + "\" failed with exit code "
      + std::to_string(child.exit_code()));
  if (!gotLine)
    throw std::runtime_error("Expecting a line not the end of stream");

  std::string const kilobytes = line.substr(0, line.find('\t'));
  try
  {
    used = boost::lexical_cast<int64_t>(kilobytes) * 1024;
  }
  catch (boost::bad_lexical_cast const &)
  {
    throw std::runtime_error("Illegal du output: " + line);
  }
}

void DiskUsage::Impl::refreshLoop()
{
  std::unique_lock<std::mutex> lock(mutex);
  for (;;)
  {
    if (wakeUp.wait_for(lock, refreshInterval, [this]{ return !shouldRun; }))
      return;

    lock.unlock();
    std::exception_ptr error;
    try
    {
      run();
    }
    catch (std::exception const & e)
    {
      VERIFS_LOG(warning) << "Could not get disk usage information for " << dirPath << ": " << e.what();
      error = std::current_exception();
    }
    lock.lock();
    if (error)
      lastError = error;
  }
}

DiskUsage::DiskUsage(std::string const & path, std::chrono::milliseconds refreshInterval)
  : m_impl(new Impl(path, refreshInterval))
{
  try
  {
    m_impl->run();
  }
  catch (...)
  {
    delete m_impl;
    throw;
  }
}

DiskUsage::~DiskUsage()
{
  shutdown();
  delete m_impl;
}

void DiskUsage::start()
{
  if (m_impl->refreshInterval.count() <= 0 || m_impl->refreshThread.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->shouldRun = true;
  }
  m_impl->refreshThread = std::thread(&Impl::refreshLoop, m_impl);
}

void DiskUsage::shutdown()
{
  {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->shouldRun = false;
  }
  m_impl->wakeUp.notify_all();
  if (m_impl->refreshThread.joinable())
    m_impl->refreshThread.join();
}

int64_t DiskUsage::used()
{
  if (!m_impl->refreshThread.joinable())
    m_impl->run();
  else
  {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    if (m_impl->lastError)
    {
      std::exception_ptr error = m_impl->lastError;
      m_impl->lastError = nullptr;
      std::rethrow_exception(error);
    }
  }
  return m_impl->used;
}

void DiskUsage::incUsed(int64_t value)
{
  m_impl->used += value;
}

void DiskUsage::decUsed(int64_t value)
{
  m_impl->used -= value;
}

std::string const & DiskUsage::dirPath() const
{
  return m_impl->dirPath;
}

std::string DiskUsage::toString() const
{
  return "du -sk " + m_impl->dirPath + "\n" + std::to_string(m_impl->used.load()) + "\t" + m_impl->dirPath;
}

}
