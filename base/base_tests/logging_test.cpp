#include "testing/testing.hpp"

#include "base/exception.hpp"
#include "base/logging.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{
std::vector<std::pair<base::LogLevel, std::string>> g_messages;

void CollectMessage(base::LogLevel level, base::SrcPoint const &, std::string const & msg)
{
  g_messages.emplace_back(level, msg);
}

class ScopedLogCollector
{
public:
  ScopedLogCollector() : m_prev(base::SetLogMessageFn(&CollectMessage)) { g_messages.clear(); }
  ~ScopedLogCollector() { base::SetLogMessageFn(m_prev); }

private:
  base::LogMessageFn m_prev;
};

DECLARE_EXCEPTION(TestException, RootException);
DECLARE_EXCEPTION(DerivedTestException, TestException);

void ThrowDerived(int value) { MYTHROW(DerivedTestException, ("Value is", value)); }
}  // namespace

UNIT_TEST(Logging_Level)
{
  ScopedLogCollector collector;
  base::ScopedLogLevelChanger changer(LWARNING);

  LOG(LINFO, ("Not logged"));
  LOG(LWARNING, ("Logged", 1, 2.5));
  LOG(LERROR, ("Logged too"));

  TEST_EQUAL(g_messages.size(), 2, ());
  TEST_EQUAL(g_messages[0].first, LWARNING, ());
  TEST_EQUAL(g_messages[0].second, "Logged 1 2.5", ());
  TEST_EQUAL(g_messages[1].first, LERROR, ());
}

UNIT_TEST(Logging_ScopedLevelIsRestored)
{
  auto const before = base::g_LogLevel.load();
  {
    base::ScopedLogLevelChanger changer(LCRITICAL);
    TEST_EQUAL(base::g_LogLevel.load(), LCRITICAL, ());
  }
  TEST_EQUAL(base::g_LogLevel.load(), before, ());
}

UNIT_TEST(Logging_ConditionalLog)
{
  ScopedLogCollector collector;
  base::ScopedLogLevelChanger changer(LDEBUG);

  CLOG(LINFO, 1 + 1 == 2, ("Not logged"));
  CLOG(LINFO, 1 + 1 == 3, ("Logged"));
  TEST_EQUAL(g_messages.size(), 1, ());
}

UNIT_TEST(LogLevel_Names)
{
  TEST_EQUAL(base::ToString(LDEBUG), "DEBUG", ());
  TEST_EQUAL(base::ToString(LCRITICAL), "CRITICAL", ());
  TEST_EQUAL(base::FromString("WARNING"), std::optional<base::LogLevel>(LWARNING), ());
  TEST(!base::FromString("VERBOSE"), ());
}

UNIT_TEST(Message_DebugPrint)
{
  TEST_EQUAL(base::Message(), "", ());
  TEST_EQUAL(base::Message("a", 1, 'c', true), "a 1 c true", ());
  std::vector<int> const v = {1, 2, 3};
  TEST_EQUAL(DebugPrint(v), "[3: 1 2 3 ]", ());
  TEST_EQUAL(DebugPrint(std::make_pair(1, std::string("x"))), "(1, x)", ());
  TEST_EQUAL(DebugPrint(std::optional<int>()), "nullopt", ());
  TEST_EQUAL(DebugPrint(std::optional<int>(5)), "optional(5)", ());
}

UNIT_TEST(Exception_Hierarchy)
{
  TEST_THROW(ThrowDerived(42), TestException, ());
  try
  {
    ThrowDerived(42);
    TEST(false, ("Exception was not thrown"));
  }
  catch (RootException const & e)
  {
    TEST_EQUAL(e.Msg(), "Value is 42", ());
    TEST_NOT_EQUAL(std::string(e.what()).find("DerivedTestException"), std::string::npos, ());
  }
}
