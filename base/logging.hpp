#pragma once

#include "base/internal/message.hpp"
#include "base/src_point.hpp"

#include <array>
#include <atomic>
#include <optional>
#include <string>

namespace base
{
enum LogLevel
{
  LDEBUG,
  LINFO,
  LWARNING,
  LERROR,
  LCRITICAL,

  NUM_LOG_LEVELS
};

std::string ToString(LogLevel level);
std::optional<LogLevel> FromString(std::string const & s);
std::array<char const *, NUM_LOG_LEVELS> const & GetLogLevelNames();

using AtomicLogLevel = std::atomic<LogLevel>;
using LogMessageFn = void (*)(LogLevel level, SrcPoint const &, std::string const &);

LogLevel GetDefaultLogLevel();
LogLevel GetDefaultLogAbortLevel();

extern LogMessageFn LogMessage;
extern AtomicLogLevel g_LogLevel;
extern AtomicLogLevel g_LogAbortLevel;

/// @return Pointer to previous message function.
LogMessageFn SetLogMessageFn(LogMessageFn fn);

void LogMessageDefault(LogLevel level, SrcPoint const & srcPoint, std::string const & msg);
void LogMessageTests(LogLevel level, SrcPoint const & srcPoint, std::string const & msg);

/// Scoped log level setter.
class ScopedLogLevelChanger
{
public:
  explicit ScopedLogLevelChanger(LogLevel temporaryLogLevel = LERROR)
  {
    m_old = g_LogLevel;
    g_LogLevel = temporaryLogLevel;
  }

  ~ScopedLogLevelChanger() { g_LogLevel = m_old; }

private:
  LogLevel m_old;
};
}  // namespace base

using ::base::LDEBUG;
using ::base::LINFO;
using ::base::LWARNING;
using ::base::LERROR;
using ::base::LCRITICAL;
using ::base::NUM_LOG_LEVELS;

// Logging macro.
// Example usage: LOG(LINFO, (Calc(), m_Var, "Some string constant"));
#define LOG(level, msg)                                        \
  do                                                           \
  {                                                            \
    if ((level) >= ::base::g_LogLevel)                         \
      ::base::LogMessage(level, SRC(), ::base::Message msg);   \
  } while (false)

// Conditional log. Logs @msg with level @level in case when @X returns false.
#define CLOG(level, X, msg)                                         \
  do                                                                \
  {                                                                 \
    if (!(X))                                                       \
      LOG(level, (SRC(), "CLOG(" #X ")", ::base::Message msg));     \
  } while (false)
