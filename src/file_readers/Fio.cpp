// File IO - namespace fio
#include "file_readers/Fio.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fio {

using namespace pnpc;
using namespace std;

void Fio::setTrace(int t) noexcept {
  if (t <= 0) {
    trace_ = 0;
    return;
  }
  if (t >= USHRT_MAX) {
    trace_ = USHRT_MAX;
    return;
  }
  trace_ = t;
}

bool Fio::fileAccessible(CStr fn) noexcept {
  if (!fn) return false;
  int status = ::access(fn, F_OK);
  if (status != 0) return false;
  status = ::access(fn, R_OK);
  if (status != 0) return false;
  return true;
}

bool Fio::regularFileExists(CStr fn) noexcept {
  if (!fn) return false;
  struct stat sb;
  if (::stat(fn, &sb)) return false;

  if (not S_ISREG(sb.st_mode)) return false;

  return true;
}



// ======== 1. LineReader ==============================================

bool LineReader::readBuffer() noexcept {
  assert(!fnm_.empty());
  uint16_t tr = trace();

  p_free(buf_);
  buf_ = nullptr;
  sz_ = fsz_ = 0;

  struct stat sb;
  if (::stat(fnm_.c_str(), &sb)) {
    if (tr >= 2) ::perror("stat");
    return false;
  }

  if (not S_ISREG(sb.st_mode)) {
    if (tr >= 2) lout() << "not a regular file: " << fnm_ << endl;
    return false;
  }

  fsz_ = sb.st_size;

  int fd = ::open(fnm_.c_str(), O_RDONLY);
  if (fd < 0) {
    if (tr >= 2) {
      ::perror("open");
      lout() << "can't open file: " << fnm_ << endl;
    }
    return false;
  }

  buf_ = (char*)::calloc(fsz_ + 4, 1);
  if (!buf_) {
    ::close(fd);
    return false;
  }

  char* buf = buf_;
  int64_t ret = 0, len = fsz_;
  while (len > 0) {
    ret = ::read(fd, buf, len);
    if (ret == 0) break;
    if (ret < 0) {
      if (errno == EINTR) continue;
      if (tr) {
        ::perror("read");
        lout() << "::read() failed: " << fnm_ << endl;
      }
      break;
    }
    len -= ret;
    buf += ret;
  }

  ::close(fd);

  if (ret < 0) {
    p_free(buf_);
    buf_ = nullptr;
    return false;
  }

  sz_ = fsz_ - len;
  buf_[sz_] = 0;
  return true;
}

void LineReader::makeLines() noexcept {
  lines_.clear();
  num_lines_ = 0;

  lines_.push_back(nullptr);
  if (!buf_ || !sz_) return;

  char* curLine = buf_;
  for (size_t i = 0; i < sz_; i++) {
    if (buf_[i] != '\n') continue;
    buf_[i] = 0;
    if (i > 0 && buf_[i - 1] == '\r' && buf_ + i - 1 >= curLine)
      buf_[i - 1] = 0;
    lines_.push_back(curLine);
    curLine = buf_ + i + 1;
  }

  // last line without terminator
  if (curLine < buf_ + sz_) {
    size_t len = ::strlen(curLine);
    if (len && curLine[len - 1] == '\r')
      curLine[len - 1] = 0;
    lines_.push_back(curLine);
  }

  num_lines_ = lines_.size() - 1;
}

bool LineReader::read() noexcept {
  bool ok = readBuffer();
  if (!ok) return false;

  makeLines();

  if (trace() >= 3) {
    lprintf("LReader::read() OK:  fsz_= %zu  num_lines_= %zu  %s\n", fsz_, num_lines_, fnm_.c_str());
  }
  return true;
}

void LineReader::print(std::ostream& os) const noexcept {
  for (size_t i = 1; i <= num_lines_; i++)
    os << i << ": " << lines_[i] << '\n';
  os.flush();
}


// ======== 2. CSV helpers ==============================================

void split_csv(CStr src, vector<string>& dat) noexcept {
  dat.clear();
  if (!src || !src[0]) return;

  string fld;
  const char* p = src;
  while (true) {
    fld.clear();
    if (*p == '"') {
      // quoted field
      p++;
      while (*p) {
        if (*p == '"') {
          if (p[1] == '"') {
            fld.push_back('"');
            p += 2;
            continue;
          }
          p++;
          break;
        }
        fld.push_back(*p);
        p++;
      }
      // text after the closing quote belongs to the field
      while (*p && *p != ',') {
        fld.push_back(*p);
        p++;
      }
    } else {
      while (*p && *p != ',') {
        fld.push_back(*p);
        p++;
      }
    }
    dat.push_back(fld);
    if (*p != ',') break;
    p++;
  }
}

bool csv_quote_open(CStr line, bool inQuote) noexcept {
  if (!line) return inQuote;

  // a quote opens a field only at the field start
  bool fieldStart = !inQuote;
  for (const char* p = line; *p; p++) {
    if (inQuote) {
      if (*p == '"') {
        if (p[1] == '"')
          p++;
        else
          inQuote = false;
      }
      continue;
    }
    if (*p == ',') {
      fieldStart = true;
      continue;
    }
    if (*p == '"' && fieldStart)
      inQuote = true;
    fieldStart = false;
  }
  return inQuote;
}

size_t read_csv_record(const LineReader& lr, size_t li, string& rec) noexcept {
  rec.clear();
  size_t n = 0;
  bool inQuote = false;
  while (li + n <= lr.numLines()) {
    const char* line = lr.line(li + n);
    if (n) rec.push_back('\n');
    if (line) rec += line;
    inQuote = csv_quote_open(line, inQuote);
    n++;
    if (!inQuote) break;
  }
  return n;
}

string csv_quote(const string& field) noexcept {
  if (field.find_first_of(",\"\r\n") == string::npos)
    return field;

  string z;
  z.reserve(field.length() + 4);
  z.push_back('"');
  for (char c : field) {
    if (c == '"') z.push_back('"');
    z.push_back(c);
  }
  z.push_back('"');
  return z;
}

}  // NS fio
