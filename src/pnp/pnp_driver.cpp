#include "pnp/pnp_driver.h"
#include "pnp/machine_writer.h"
#include "pnp/template_writer.h"

#include "file_readers/feeder_reader.h"
#include "file_readers/job_reader.h"
#include "util/err_code.h"

namespace pnpc {

using namespace std;

int pnpc_main(const cmd_line& cmd) {
  uint16_t tr = ltrace();
  if (tr >= 2) lputs("pnpc_main()");

  PnpDriver drv(cmd);

  return drv.run();
}

static CStr USAGE_MSG =
    "usage options: --pos POS_CSV [--bom BOM_CSV]\n"
    "               [--feeders FEEDERS_CSV [--output OUTPUT]]\n"
    "               [--template TEMPLATE_OUTPUT]\n"
    "               [--mark1 FID] [--mark2 FID] [-skip_unassigned]\n"
    "               [-allow_no_bom] [-fids] [--config JOB_JSON]";

void PnpDriver::print_usage(std::ostream& os) {
  os << USAGE_MSG << endl;
  os << "  --feeders   writes TVM802 machine data (default output: "
     << DEF_OUTPUT_NAME << " beside POS_CSV)" << endl;
  os << "  --template  writes a blank feeders CSV for POS_CSV" << endl;
  os << "  -fids       lists the fiducials of POS_CSV" << endl;
  os << "  a BOM is required for positions.csv-style input unless -allow_no_bom" << endl;
  os << "  env pnpc_trace=<N> sets the log verbosity" << endl;
}

string PnpDriver::dir_of(const string& path) noexcept {
  size_t slash = path.rfind('/');
  if (slash == string::npos)
    return ".";
  if (slash == 0)
    return "/";
  return path.substr(0, slash);
}

PnpDriver::Status PnpDriver::report_error() const {
  const string& code = err_code();
  if (code.empty()) {
    lprintf2("[Error] Internal error\n");
    return Failure;
  }
  string msg = err_lookup(code);
  if (err_file().empty())
    lprintf2("[Error] %s\n", msg.c_str());
  else
    lprintf2("[Error] %s: %s\n", msg.c_str(), err_file().c_str());

  if (code == "MISSING_IN_OUT_FILES" || code == "BOM_REQUIRED_FOR_POSITIONS" ||
      code == "MARK_NOT_FOUND")
    return UsageError;
  return Failure;
}

PnpDriver::Status PnpDriver::read_options() {
  uint16_t tr = ltrace();
  auto& ls = lout();

  pos_name_ = cl_.get_param("--pos");
  bom_name_ = cl_.get_param("--bom");
  feeders_name_ = cl_.get_param("--feeders");
  output_name_ = cl_.get_param("--output");
  template_name_ = cl_.get_param("--template");
  mark1_ = str::sTrim(cl_.get_param("--mark1"));
  mark2_ = str::sTrim(cl_.get_param("--mark2"));

  if (output_name_.empty() && !feeders_name_.empty())
    output_name_ = str::concat(dir_of(pos_name_), "/", DEF_OUTPUT_NAME);

  if (tr >= 2) {
    lputs("\n  PnpDriver::read_options()");
    ls << "          pos_name (--pos) : " << pos_name_ << endl;
    ls << "          bom_name (--bom) : " << bom_name_ << endl;
    ls << "  feeders_name (--feeders) : " << feeders_name_ << endl;
    ls << "    output_name (--output) : " << output_name_ << endl;
    ls << "template_name (--template) : " << template_name_ << endl;
    ls << "            mark1 (--mark1): " << mark1_ << endl;
    ls << "            mark2 (--mark2): " << mark2_ << endl;
  }

  bool has_action = !feeders_name_.empty() || !template_name_.empty() ||
                    cl_.is_flag_set("-fids");
  if (pos_name_.empty() || !has_action) {
    set_err_code("MISSING_IN_OUT_FILES");
    Status st = report_error();
    print_usage(cerr);
    return st;
  }

  return OK;
}

bool PnpDriver::read_bom() {
  have_bom_ = false;

  if (bom_name_.empty()) {
    if (pos_fmt_ == PosFormat::Positions && !cl_.is_flag_set("-allow_no_bom")) {
      set_err_code("BOM_REQUIRED_FOR_POSITIONS", pos_name_);
      return false;
    }
    if (pos_fmt_ == PosFormat::Positions) {
      lputs("WARNING: no BOM for positions.csv-style input, every part gets its own component key");
      num_warnings_++;
    }
    return true;
  }

  if (bom_.read_bom(bom_name_)) {
    have_bom_ = true;
    if (!bom_.hasDesignatorColumn()) {
      lprintf2("WARNING: BOM CSV has no Designator column: %s\n", bom_name_.c_str());
      num_warnings_++;
    }
    return true;
  }

  // BOM is optional for classic POS input
  if (pos_fmt_ != PosFormat::Positions) {
    lprintf2("WARNING: Failed to read BOM CSV (continuing without it): %s\n", bom_name_.c_str());
    num_warnings_++;
    clear_err_code();
    return true;
  }
  return false;
}

bool PnpDriver::list_fiducials(const vector<string>& fids) const {
  auto& ls = lout();
  ls << "fiducials (" << fids.size() << "):" << endl;
  for (const string& f : fids)
    ls << "  " << f << endl;
  return true;
}

bool PnpDriver::check_marks(const vector<string>& fids) const {
  for (const string* m : { &mark1_, &mark2_ }) {
    if (m->empty())
      continue;
    string mU = str::sToUpper(*m);
    bool found = false;
    for (const string& f : fids) {
      if (str::sToUpper(f) == mU) {
        found = true;
        break;
      }
    }
    if (!found) {
      set_err_code("MARK_NOT_FOUND", *m);
      return false;
    }
  }
  return true;
}

bool PnpDriver::do_template() {
  TemplateWriter tw(have_bom_ ? &bom_.get_map() : nullptr);
  if (!tw.write_file(pos_name_, template_name_))
    return false;

  lout() << "TVM802 feeders template written to: " << template_name_ << endl;
  return true;
}

bool PnpDriver::do_machine() {
  auto& ls = lout();

  FeederReader frd;
  if (!frd.read_feeders(feeders_name_))
    return false;

  MachineWriter mw(frd.get_map(), have_bom_ ? &bom_.get_map() : nullptr);
  mw.mark1_ = mark1_;
  mw.mark2_ = mark2_;
  mw.skipUnassigned_ = cl_.is_flag_set("-skip_unassigned");

  if (!mw.write_file(pos_name_, output_name_))
    return false;

  const MachineWriter::Stats& st = mw.stats();

  ls << "TVM802 machine data written to: " << output_name_ << '\n' << endl;
  ls << "Placements exported: " << st.rowsTotal_ << endl;
  ls << "With feeders/nozzles: " << st.rowsWithFeeder_ << endl;
  ls << "Mark1: " << (st.mark1_.found_ ? st.mark1_.ref_ : string("(none)"))
     << "  (" << st.mark1_.x_ << ", " << st.mark1_.y_ << ")" << endl;
  ls << "Mark2: " << (st.mark2_.found_ ? st.mark2_.ref_ : string("(none)"))
     << "  (" << st.mark2_.x_ << ", " << st.mark2_.y_ << ")" << endl;

  if (st.rowsWithFeeder_ == 0 && st.rowsTotal_ > 0) {
    ls << "\nWARNING: No feeders matched! Check that your feeders CSV\n"
          "uses the same component keys as the BOM." << endl;
    num_warnings_++;
  }
  return true;
}

PnpDriver::Status PnpDriver::run() {
  num_warnings_ = 0;
  clear_err_code();

  uint16_t tr = ltrace();

  if (cl_.is_flag_set("-h") || cl_.is_flag_set("--help")) {
    print_usage(lout());
    return OK;
  }

  string job_name = cl_.get_param("--config");
  if (!job_name.empty()) {
    JobReader job;
    if (!job.read_job(job_name))
      return report_error();
    job.apply(cl_);
    if (job.traceSpecified()) {
      set_ltrace(job.trace_);
      tr = ltrace();
    }
  }

  Status st = read_options();
  if (st != OK)
    return st;

  if (!fio::file_exists_accessible(pos_name_)) {
    set_err_code("POS_FILE_READ_ERROR", pos_name_);
    return report_error();
  }

  if (!read_pos_format(pos_name_, pos_fmt_))
    return report_error();
  if (tr >= 2) lprintf("  placement format: %s\n", pos_format_name(pos_fmt_));

  bool need_keys = !template_name_.empty() || !feeders_name_.empty();
  if (need_keys && !read_bom())
    return report_error();

  vector<string> fids;
  if (!collect_fiducials(pos_name_, fids))
    return report_error();

  if (cl_.is_flag_set("-fids"))
    list_fiducials(fids);

  if (!check_marks(fids))
    return report_error();

  if (!template_name_.empty() && !do_template())
    return report_error();

  if (!feeders_name_.empty() && !do_machine())
    return report_error();

  if (tr >= 3 && num_warnings_)
    lprintf("\n\t pnp_c: NOTE WARNINGs: %u\n", num_warnings_);
  return OK;
}

}  // namespace pnpc
