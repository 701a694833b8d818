#pragma once
//  - namespace fio - File IO
// ======== 0. Fio (common base class)
// ======== 1. LineReader ============
// ======== 2. CSV helpers ============

#ifndef __pnpc_file_readers_Fio_H_h_
#define __pnpc_file_readers_Fio_H_h_

#include "util/pnpc_log.h"

namespace fio {

using pnpc::CStr;
using std::string;
using std::vector;

inline void p_free(void* p) noexcept {
  if (p) ::free(p);
}

class Fio {
public:
  string fnm_;

  size_t sz_ = 0;         // data buffer size
  size_t fsz_ = 0;        // file size
  size_t num_lines_ = 0;  // number of lines

  // lines_[0] is nullptr, lines_[i] is the i-th line of the file (1-based)
  vector<char*> lines_;

public:
  Fio() noexcept = default;

  Fio(CStr nm) noexcept { if (nm) fnm_ = nm; }
  Fio(const string& nm) noexcept { fnm_ = nm; }

  virtual ~Fio() {}

  const string& fileName() const noexcept { return fnm_; }

  uint16_t trace() const noexcept { return trace_; }
  void setTrace(int t) noexcept;

  size_t numLines() const noexcept { return num_lines_; }

  static bool fileAccessible(CStr) noexcept;

  static bool fileAccessible(const string& fn) noexcept {
    return fn.empty() ? false : fileAccessible(fn.c_str());
  }

  static bool regularFileExists(CStr) noexcept;

  static bool regularFileExists(const string& fn) noexcept {
    return fn.empty() ? false : regularFileExists(fn.c_str());
  }

  static bool isEmptyLine(CStr src) noexcept { return !src || !src[0]; }

protected:
  uint16_t trace_ = 0;
};  // Fio

inline bool file_exists_accessible(const string& fn) noexcept {
  return Fio::regularFileExists(fn) && Fio::fileAccessible(fn);
}


// ======== 1. LineReader ============
//
// reads the whole file into buf_, the descriptor is closed before read() returns.
// '\n' and "\r\n" terminators are cut, lines_ point into buf_.

class LineReader : public Fio
{
public:
  char* buf_ = nullptr;

public:
  LineReader() noexcept = default;

  LineReader(CStr nm) noexcept : Fio(nm) {}

  LineReader(const string& nm) noexcept : Fio(nm) {}

  virtual ~LineReader() { p_free(buf_); }

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // false on IO failure. a zero-size file reads OK with 0 lines.
  bool read() noexcept;

  // 1-based, nullptr if out of range
  const char* line(size_t i) const noexcept {
    if (i == 0 || i > num_lines_) return nullptr;
    return lines_[i];
  }

  void print(std::ostream& os) const noexcept;

private:
  bool readBuffer() noexcept;
  void makeLines() noexcept;
};  // LineReader


// ======== 2. CSV helpers ============

// splits one CSV line into fields, python-csv compatible:
// a field starting with '"' runs to the closing quote, "" is a literal quote.
// an empty line gives an empty row.
void split_csv(CStr src, vector<string>& dat) noexcept;

inline vector<string> split_csv(const string& src) noexcept {
  vector<string> dat;
  split_csv(src.c_str(), dat);
  return dat;
}

// true if a quoted field is still open at the end of 'line'.
// 'inQuote' is the state at the start of the line.
bool csv_quote_open(CStr line, bool inQuote) noexcept;

// one logical CSV record starting at physical line 'li' (1-based).
// while a quoted field is open the following lines are joined with '\n'.
// returns the number of physical lines consumed, 0 past the end.
size_t read_csv_record(const LineReader& lr, size_t li, string& rec) noexcept;

// quotes a field for CSV output if it contains ',', '"', '\r' or '\n'
string csv_quote(const string& field) noexcept;

}  // NS fio

#endif
