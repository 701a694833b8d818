#pragma once
#ifndef __pnpc_JOB_READER_H_
#define __pnpc_JOB_READER_H_

#include "util/cmd_line.h"

/*
Optional job file (--config), all members optional:

{
  "pos":      "production/positions.csv",
  "bom":      "production/bom.csv",
  "feeders":  "feeders.csv",
  "output":   "tvm802-machine.csv",
  "template": "feeders-unconfigged.csv",
  "mark1":    "FID3",
  "mark2":    "FID4",
  "skip_unassigned": true,
  "allow_no_bom":    false,
  "list_fids":       false,
  "trace":           3
}
*/

namespace pnpc {

using std::vector;

struct JobReader {
  // string members -> cmd_line params
  vector<std::pair<string, string>> params_;
  // boolean members that are true -> cmd_line flags
  vector<string> flags_;

  int trace_ = -1;  // -1 : not specified

  JobReader() = default;

  // false if the file can't be opened or parsed (err_code is set)
  bool read_job(const string& fn);

  // command line values take precedence over the job file
  void apply(cmd_line& cl) const;

  bool traceSpecified() const noexcept { return trace_ >= 0; }
};

}  // NS pnpc

#endif
