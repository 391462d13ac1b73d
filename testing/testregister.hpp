#pragma once

#include <functional>
#include <utility>

class TestRegister
{
public:
  TestRegister(char const * testName, char const * fileName, std::function<void()> && fnTest)
    : m_testName(testName), m_fileName(fileName), m_fn(std::move(fnTest)), m_next(nullptr)
  {
    if (FirstRegister() == nullptr)
    {
      FirstRegister() = this;
      LastRegister() = this;
    }
    else
    {
      LastRegister()->m_next = this;
      LastRegister() = this;
    }
  }

  // Test name.
  char const * m_testName;
  // File name.
  char const * m_fileName;
  // Test function.
  std::function<void()> m_fn;
  // Next test in chain.
  TestRegister * m_next;

  static TestRegister *& FirstRegister()
  {
    static TestRegister * s_pRegister = nullptr;
    return s_pRegister;
  }

  static TestRegister *& LastRegister()
  {
    static TestRegister * s_pRegister = nullptr;
    return s_pRegister;
  }
};
