#include "util/err_code.h"

#include <map>

namespace pnpc {

using namespace std;

static string s_err_code;
static string s_err_file;

const string& err_code() noexcept { return s_err_code; }
const string& err_file() noexcept { return s_err_file; }

void clear_err_code() noexcept {
  s_err_code.clear();
  s_err_file.clear();
}

void set_err_code(CStr cs) noexcept {
  s_err_file.clear();
  if (!cs || !cs[0]) {
    s_err_code.clear();
    return;
  }
  s_err_code = cs;
}

void set_err_code(CStr cs, const string& fn) noexcept {
  set_err_code(cs);
  if (!s_err_code.empty())
    s_err_file = fn;
}

static std::map<string, string> s_err_map = {

  { "MISSING_IN_OUT_FILES",        "Missing input or output file arguments" },
  { "OPEN_FILE_FAILURE",           "Open file failure" },
  { "WRITE_FILE_FAILURE",          "Write file failure" },
  { "POS_FILE_READ_ERROR",         "Placement (POS) file read error" },
  { "BOM_FILE_READ_ERROR",         "BOM file read error" },
  { "FEEDER_FILE_READ_ERROR",      "Feeders file read error" },
  { "JOB_FILE_PARSE_ERROR",        "Job file parse error" },
  { "BOM_REQUIRED_FOR_POSITIONS",  "BOM CSV is required when using 'positions.csv' input" },
  { "MARK_NOT_FOUND",              "Mark fiducial not found in placement file" }

};

string err_lookup(const string& key) noexcept {
  assert(!key.empty());
  if (key.empty()) return "Internal error";

  auto fitr = s_err_map.find(key);
  if (fitr == s_err_map.end()) {
    return "Internal error";
  }
  return fitr->second;
}

}
