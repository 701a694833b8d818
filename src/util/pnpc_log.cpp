#include "util/pnpc_log.h"

#include <stdarg.h>

namespace pnpc {

using namespace std;

static uint16_t s_logLevel = 0;
uint16_t ltrace() noexcept { return s_logLevel; }
void set_ltrace(int t) noexcept {
  if (t <= 0) {
    s_logLevel = 0;
    return;
  }
  if (t >= USHRT_MAX) {
    s_logLevel = USHRT_MAX;
    return;
  }
  s_logLevel = t;
}

#define LPUT if (cs && cs[0]) cout << cs;
#define LEND cout << endl; fflush(stdout);

void lputs(CStr cs) noexcept {
    LPUT
    LEND
}
void lputs2(CStr cs) noexcept {
    LPUT
    LEND
}

void lputs(const string& s) noexcept {
  if (s.empty())
    cout << endl;
  else
    lputs(s.c_str());
}

void flush_out(bool nl) noexcept {
  if (nl)
    cout << endl;
  cout.flush();
  fflush(stdout);
}

void lprintf(CStr format, ...) {
  char buf[8192];
  va_list args;
  va_start(args, format);
  vsnprintf(buf, 8190, format, args);
  buf[8191] = 0;
  va_end(args);

  size_t len = strlen(buf);
  if (!len) return;

  cout << buf;
  if ((len > 2 && buf[len - 1] == '\n') || len > 128) {
    cout.flush();
    fflush(stdout);
  }
}

void lprintf2(CStr format, ...) {
  char buf[8192];
  va_list args;
  va_start(args, format);
  vsnprintf(buf, 8190, format, args);
  buf[8191] = 0;
  va_end(args);

  size_t len = strlen(buf);
  if (!len) return;

  cout << buf;
  cout.flush();
  fflush(stdout);
  cerr << buf;
  cerr.flush();
}

namespace str {

string sToLower(const string& s) noexcept {
  if (s.empty()) return {};

  string result;
  result.reserve(s.length() + 1);
  for (char c : s) result.push_back(std::tolower((unsigned char)c));
  return result;
}

string sToUpper(const string& s) noexcept {
  if (s.empty()) return {};

  string result;
  result.reserve(s.length() + 1);
  for (char c : s) result.push_back(std::toupper((unsigned char)c));
  return result;
}

string sTrim(const string& s) noexcept {
  if (s.empty()) return {};
  size_t len = s.length();
  size_t b = 0, e = len;
  while (b < len && std::isspace((unsigned char)s[b])) b++;
  while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
  if (b == 0 && e == len) return s;
  return s.substr(b, e - b);
}

}  // NS str

}  // namespace pnpc
