#include "base/logging.hpp"

#include "base/assert.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace
{
std::mutex g_logMutex;

class ElapsedTimer
{
public:
  ElapsedTimer() : m_start(std::chrono::steady_clock::now()) {}

  double ElapsedSeconds() const
  {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start).count();
  }

private:
  std::chrono::steady_clock::time_point m_start;
};

ElapsedTimer const & GetTimer()
{
  static ElapsedTimer const timer;
  return timer;
}
}  // namespace

namespace base
{
std::string ToString(LogLevel level)
{
  auto const & names = GetLogLevelNames();
  CHECK_LESS(level, names.size(), ());
  return names[level];
}

std::optional<LogLevel> FromString(std::string const & s)
{
  ASSERT(!s.empty(), ("Log level should not be empty"));

  auto const & names = GetLogLevelNames();
  auto const it = std::find(names.begin(), names.end(), s);
  if (it == names.end())
    return {};
  return static_cast<LogLevel>(std::distance(names.begin(), it));
}

std::array<char const *, NUM_LOG_LEVELS> const & GetLogLevelNames()
{
  // If you're going to modify the behavior of the function, please,
  // check validity of LogHelper ctor.
  static std::array<char const *, NUM_LOG_LEVELS> const kNames = {
      {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}};
  return kNames;
}

void LogMessageDefault(LogLevel level, SrcPoint const & srcPoint, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostringstream out;
  out << ToString(level) << " " << std::fixed << std::setprecision(5)
      << GetTimer().ElapsedSeconds() << " " << DebugPrint(srcPoint) << msg << std::endl;
  std::cerr << out.str();

  if (level >= g_LogAbortLevel)
    std::abort();
}

void LogMessageTests(LogLevel level, SrcPoint const &, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostringstream out;
  out << msg << std::endl;
  std::cerr << out.str();

  if (level >= g_LogAbortLevel)
    std::abort();
}

LogMessageFn LogMessage = &LogMessageDefault;

LogMessageFn SetLogMessageFn(LogMessageFn fn)
{
  std::swap(LogMessage, fn);
  return fn;
}

LogLevel GetDefaultLogLevel()
{
#if defined(DEBUG)
  return LDEBUG;
#else
  return LINFO;
#endif
}

LogLevel GetDefaultLogAbortLevel()
{
#if defined(DEBUG)
  return LERROR;
#else
  return LCRITICAL;
#endif
}

AtomicLogLevel g_LogLevel = {GetDefaultLogLevel()};
AtomicLogLevel g_LogAbortLevel = {GetDefaultLogAbortLevel()};
}  // namespace base
