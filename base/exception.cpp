#include "base/exception.hpp"

RootException::RootException(char const * what, std::string const & msg)
  : m_whatWithAscii(what), m_msg(msg)
{
  if (!m_msg.empty())
    m_whatWithAscii += ", \"" + m_msg + "\"";
}
