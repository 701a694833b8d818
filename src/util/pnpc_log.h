//
// logging and debug tracing
//
//   lprintf  : log-printf
//   lprintf2 : log-printf with CC to stderr
//     lputs  : log-puts
//      lout  : replaces cout
//
//  currently, log- functions just print on stdout, real logfile can be added later
//
//  lputs<Number> functions are equivalent to lputs(),
//  there are convenient "anchor points" for setting temporary breakpoints.
//
#pragma once
#ifndef __pnpc_UTIL_LOG_H_
#define __pnpc_UTIL_LOG_H_

#include <algorithm>
#include <cassert>
#include <cctype>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pnpc {

using CStr = const char*;

// log-trace value (debug print verbosity)
// can be set in main() by calling set_ltrace()
uint16_t ltrace() noexcept;
void set_ltrace(int t) noexcept;

void lprintf(CStr format, ...) __attribute__((format(printf, 1, 2)));

// lprintf2 : log-printf with CC to stderr
void lprintf2(CStr format, ...) __attribute__((format(printf, 1, 2)));

void lputs(CStr cs = 0) noexcept;
void lputs2(CStr cs = 0) noexcept;
void lputs(const std::string& s) noexcept;

void flush_out(bool nl = false) noexcept;

inline std::ostream& lout() noexcept { return std::cout; }

namespace str {

using std::string;

string sToLower(const string& s) noexcept;
string sToUpper(const string& s) noexcept;

// strips leading and trailing whitespace (isspace)
string sTrim(const string& s) noexcept;

inline bool starts_with(const string& s, CStr pref) noexcept {
  assert(pref);
  size_t len = ::strlen(pref);
  return s.length() >= len && s.compare(0, len, pref) == 0;
}

inline string concat(const string& a, const string& b, const string& c) noexcept {
  string z;
  z.reserve(a.length() + b.length() + c.length() + 1);
  z = a + b + c;
  return z;
}

}  // NS str

template <typename T>
inline void logVec(const std::vector<T>& vec, CStr pref) noexcept {
  auto& os = lout();
  if (pref) os << pref;
  if (vec.empty()) {
    os << " (empty)" << std::endl;
    return;
  }
  for (const T& v : vec) os << ' ' << v;
  os << std::endl;
}

}  // namespace pnpc

#endif
