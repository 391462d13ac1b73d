#pragma once

#include <array>
#include <deque>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

/// @name Declarations.
//@{
template <typename T> inline std::string DebugPrint(T const & t);

inline std::string DebugPrint(std::string const & t);
inline std::string DebugPrint(char const * t);
inline std::string DebugPrint(char t);

template <typename U, typename V> inline std::string DebugPrint(std::pair<U, V> const & p);
template <typename T> inline std::string DebugPrint(std::vector<T> const & v);
template <typename T> inline std::string DebugPrint(std::deque<T> const & d);
template <typename T, size_t N> inline std::string DebugPrint(std::array<T, N> const & v);
template <typename T, typename C> inline std::string DebugPrint(std::set<T, C> const & v);
template <typename K, typename V, typename C>
inline std::string DebugPrint(std::map<K, V, C> const & v);
template <typename T> inline std::string DebugPrint(std::optional<T> const & p);
//@}

inline std::string DebugPrint(std::string const & t) { return t; }

inline std::string DebugPrint(char const * t)
{
  if (t)
    return {t};
  return {"NULL string pointer"};
}

inline std::string DebugPrint(char t) { return std::string(1, t); }

inline std::string DebugPrint(signed char t) { return DebugPrint(static_cast<int>(t)); }

inline std::string DebugPrint(unsigned char t) { return DebugPrint(static_cast<unsigned int>(t)); }

inline std::string DebugPrint(bool t) { return t ? "true" : "false"; }

template <typename U, typename V> inline std::string DebugPrint(std::pair<U, V> const & p)
{
  std::ostringstream out;
  out << "(" << DebugPrint(p.first) << ", " << DebugPrint(p.second) << ")";
  return out.str();
}

namespace base
{
namespace internal
{
template <typename It> std::string DebugPrintSequence(It beg, It end)
{
  std::ostringstream out;
  out << "[" << std::distance(beg, end) << ":";
  for (; beg != end; ++beg)
    out << " " << DebugPrint(*beg);
  out << " ]";
  return out.str();
}
}  // namespace internal
}  // namespace base

template <typename T> inline std::string DebugPrint(std::vector<T> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T> inline std::string DebugPrint(std::deque<T> const & d)
{
  return ::base::internal::DebugPrintSequence(d.begin(), d.end());
}

template <typename T, size_t N> inline std::string DebugPrint(std::array<T, N> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T, typename C> inline std::string DebugPrint(std::set<T, C> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename K, typename V, typename C>
inline std::string DebugPrint(std::map<K, V, C> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T> inline std::string DebugPrint(std::optional<T> const & p)
{
  if (p)
  {
    std::ostringstream out;
    out << "optional(" << DebugPrint(*p) << ")";
    return out.str();
  }
  return "nullopt";
}

template <typename T> inline std::string DebugPrint(T const & t)
{
  std::ostringstream out;
  out << std::setprecision(20) << t;
  return out.str();
}

namespace base
{
inline std::string Message() { return std::string(); }

template <typename T> std::string Message(T const & t)
{
  using ::DebugPrint;
  return DebugPrint(t);
}

template <typename T, typename... Args> std::string Message(T const & t, Args const &... others)
{
  using ::DebugPrint;
  return DebugPrint(t) + " " + Message(others...);
}
}  // namespace base
