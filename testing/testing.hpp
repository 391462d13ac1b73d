#pragma once

#include "testing/testregister.hpp"

#include "base/exception.hpp"
#include "base/logging.hpp"
#include "base/math.hpp"
#include "base/src_point.hpp"

#include <string>

#define UNIT_TEST(name)                                                  \
  void UnitTest_##name();                                                \
  TestRegister g_testRegister_##name(#name, __FILE__, &UnitTest_##name); \
  void UnitTest_##name()

DECLARE_EXCEPTION(TestFailureException, RootException);

namespace base
{
inline void OnTestFailed(SrcPoint const & srcPoint, std::string const & msg)
{
  LOG(LINFO, ("FAILED"));
  LOG(LINFO, (::DebugPrint(srcPoint.FileName()) + ":" + ::DebugPrint(srcPoint.Line()), msg));
  MYTHROW(TestFailureException, (srcPoint.FileName(), srcPoint.Line(), msg));
}
}  // namespace base

#define TEST(X, msg)                                                                  \
  do                                                                                  \
  {                                                                                   \
    if (X)                                                                            \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X ")", ::base::Message msg)); \
    }                                                                                 \
  } while (0)
#define TEST_EQUAL(X, Y, msg)                                                         \
  do                                                                                  \
  {                                                                                   \
    if ((X) == (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X " == " #Y ")",           \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_NOT_EQUAL(X, Y, msg)                                                     \
  do                                                                                  \
  {                                                                                   \
    if ((X) != (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X " != " #Y ")",           \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_LESS(X, Y, msg)                                                          \
  do                                                                                  \
  {                                                                                   \
    if ((X) < (Y))                                                                    \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X " < " #Y ")",            \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_LESS_OR_EQUAL(X, Y, msg)                                                 \
  do                                                                                  \
  {                                                                                   \
    if ((X) <= (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X " <= " #Y ")",           \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_GREATER(X, Y, msg)                                                       \
  do                                                                                  \
  {                                                                                   \
    if ((X) > (Y))                                                                    \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X " > " #Y ")",            \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_GREATER_OR_EQUAL(X, Y, msg)                                              \
  do                                                                                  \
  {                                                                                   \
    if ((X) >= (Y))                                                                   \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(" #X " >= " #Y ")",           \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_ALMOST_EQUAL_ULPS(X, Y, msg)                                             \
  do                                                                                  \
  {                                                                                   \
    if (::base::AlmostEqualULPs(X, Y))                                                \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("TEST(base::AlmostEqualULPs(" #X ", " #Y ")", \
                                                  ::base::Message(X, Y),              \
                                                  ::base::Message msg));              \
    }                                                                                 \
  } while (0)
#define TEST_ALMOST_EQUAL_ABS(X, Y, eps, msg)                                         \
  do                                                                                  \
  {                                                                                   \
    if (::base::AlmostEqualAbs(X, Y, eps))                                            \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(),                                                     \
                           ::base::Message("TEST(base::AlmostEqualAbs(" #X ", " #Y ", " #eps ")", \
                                           ::base::Message(X, Y, eps),                \
                                           ::base::Message msg));                     \
    }                                                                                 \
  } while (0)
#define TEST_ALMOST_EQUAL_REL(X, Y, eps, msg)                                         \
  do                                                                                  \
  {                                                                                   \
    if (::base::AlmostEqualRel(X, Y, eps))                                            \
    {                                                                                 \
    }                                                                                 \
    else                                                                              \
    {                                                                                 \
      ::base::OnTestFailed(SRC(),                                                     \
                           ::base::Message("TEST(base::AlmostEqualRel(" #X ", " #Y ", " #eps ")", \
                                           ::base::Message(X, Y, eps),                \
                                           ::base::Message msg));                     \
    }                                                                                 \
  } while (0)

#define TEST_THROW(X, exception, msg)                                                 \
  do                                                                                  \
  {                                                                                   \
    bool expected_exception = false;                                                  \
    try                                                                               \
    {                                                                                 \
      X;                                                                              \
    }                                                                                 \
    catch (exception const &)                                                         \
    {                                                                                 \
      expected_exception = true;                                                      \
    }                                                                                 \
    catch (...)                                                                       \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("Unexpected exception at TEST(" #X ")", \
                                                  ::base::Message msg));              \
    }                                                                                 \
    if (!expected_exception)                                                          \
      ::base::OnTestFailed(SRC(), ::base::Message("Expected exception " #exception    \
                                                  " was not thrown in TEST(" #X ")",  \
                                                  ::base::Message msg));              \
  } while (0)
#define TEST_NO_THROW(X, msg)                                                         \
  do                                                                                  \
  {                                                                                   \
    try                                                                               \
    {                                                                                 \
      X;                                                                              \
    }                                                                                 \
    catch (RootException const & ex)                                                  \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("Unexpected exception at TEST(" #X ")", \
                                                  ex.Msg(), ::base::Message msg));    \
    }                                                                                 \
    catch (std::exception const & ex)                                                 \
    {                                                                                 \
      ::base::OnTestFailed(SRC(), ::base::Message("Unexpected exception at TEST(" #X ")", \
                                                  ex.what(), ::base::Message msg));   \
    }                                                                                 \
  } while (0)
