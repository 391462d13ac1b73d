#include "base/assert.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace
{
std::mutex g_assertMutex;

bool OnAssertFailedDefault(base::SrcPoint const & srcPoint, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_assertMutex);

  std::cerr << "ASSERT FAILED" << std::endl
            << srcPoint.FileName() << ":" << srcPoint.Line() << std::endl
            << msg << std::endl;
  return true;
}
}  // namespace

namespace base
{
AssertFailedFn OnAssertFailed = &OnAssertFailedDefault;

AssertFailedFn SetAssertFunction(AssertFailedFn fn)
{
  std::swap(fn, OnAssertFailed);
  return fn;
}
}  // namespace base
