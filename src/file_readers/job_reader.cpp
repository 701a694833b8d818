#include "file_readers/job_reader.h"
#include "util/err_code.h"

#include <nlohmann/json.hpp>

namespace pnpc {

using namespace std;

struct JobMember {
  CStr name_;
  CStr key_;   // cmd_line param or flag
};

static const JobMember s_strMembers[] = {
  { "pos",      "--pos"      },
  { "bom",      "--bom"      },
  { "feeders",  "--feeders"  },
  { "output",   "--output"   },
  { "template", "--template" },
  { "mark1",    "--mark1"    },
  { "mark2",    "--mark2"    }
};

static const JobMember s_boolMembers[] = {
  { "skip_unassigned", "-skip_unassigned" },
  { "allow_no_bom",    "-allow_no_bom"    },
  { "list_fids",       "-fids"            }
};

static bool job_error(const string& fn, const string& msg) {
  set_err_code("JOB_FILE_PARSE_ERROR", fn);
  lout() << "[Error] job file " << fn << ": " << msg << endl;
  return false;
}

bool JobReader::read_job(const string& fn) {
  uint16_t tr = ltrace();
  auto& ls = lout();
  if (tr >= 2) ls << "JobReader::read_job( " << fn << " )" << endl;

  params_.clear();
  flags_.clear();
  trace_ = -1;

  std::ifstream ifs(fn);
  if (!ifs.is_open())
    return job_error(fn, "could not open the file");

  nlohmann::ordered_json rootObj;
  try {
    ifs >> rootObj;
  } catch (const nlohmann::json::exception& e) {
    return job_error(fn, e.what());
  }

  if (!rootObj.is_object())
    return job_error(fn, "expected a json object");

  for (const JobMember& m : s_strMembers) {
    if (!rootObj.contains(m.name_))
      continue;
    const auto& v = rootObj[m.name_];
    if (v.is_null())
      continue;
    if (!v.is_string())
      return job_error(fn, str::concat("expected string for '", m.name_, "'"));
    params_.emplace_back(m.key_, v.get<string>());
  }

  for (const JobMember& m : s_boolMembers) {
    if (!rootObj.contains(m.name_))
      continue;
    const auto& v = rootObj[m.name_];
    if (!v.is_boolean())
      return job_error(fn, str::concat("expected boolean for '", m.name_, "'"));
    if (v.get<bool>())
      flags_.emplace_back(m.key_);
  }

  if (rootObj.contains("trace")) {
    const auto& v = rootObj["trace"];
    if (!v.is_number_integer())
      return job_error(fn, "expected integer for 'trace'");
    trace_ = std::max(0, v.get<int>());
  }

  if (tr >= 3) {
    ls << "  job: " << params_.size() << " params, " << flags_.size() << " flags";
    if (traceSpecified()) ls << ", trace " << trace_;
    ls << endl;
  }
  return true;
}

void JobReader::apply(cmd_line& cl) const {
  for (const auto& p : params_) {
    if (!cl.has_param(p.first))
      cl.set_param_value(p.first, p.second);
  }
  for (const string& f : flags_)
    cl.set_flag(f);
}

}  // NS pnpc
