#pragma once
#ifndef __pnpc_PNP_DRIVER_H_
#define __pnpc_PNP_DRIVER_H_

#include "util/cmd_line.h"
#include "file_readers/pos_reader.h"
#include "file_readers/bom_reader.h"
#include "pnp/pnpc_main.h"

namespace pnpc {

// Command line adapter around the converter: validates options,
// applies the BOM policy, runs the selected actions, prints the summary.
class PnpDriver {

  cmd_line cl_;

  string pos_name_, bom_name_, feeders_name_;
  string output_name_, template_name_;
  string mark1_, mark2_;

  PosFormat pos_fmt_ = PosFormat::Unknown;

  BomReader bom_;
  bool have_bom_ = false;

public:
  enum Status {
    OK = 0,
    Failure = 1,
    UsageError = 2
  };

  static constexpr CStr DEF_OUTPUT_NAME = "tvm802-machine.csv";

  PnpDriver(const cmd_line& cl)
    : cl_(cl)
  {}

  Status run();

  uint num_warnings_ = 0;

  static void print_usage(std::ostream& os);

  // directory part of a path, "." if none
  static string dir_of(const string& path) noexcept;

private:
  Status read_options();
  bool read_bom();
  bool list_fiducials(const vector<string>& fids) const;
  bool check_marks(const vector<string>& fids) const;
  bool do_template();
  bool do_machine();

  Status report_error() const;
};

}  // namespace pnpc

#endif
