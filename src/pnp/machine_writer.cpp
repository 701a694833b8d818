#include "pnp/machine_writer.h"
#include "pnp/component_key.h"
#include "util/err_code.h"

namespace pnpc {

using namespace std;

static constexpr CStr CRLF = "\r\n";

static const char* s_columns[] = {
  "Designator", "NozzleNum", "StackNum", "Mid X", "Mid Y", "Rotation",
  "Height", "Speed", "Vision", "Check", "Explanation"
};

static constexpr size_t NUM_COLS = sizeof(s_columns) / sizeof(s_columns[0]);

void MachineWriter::write_header(std::ostream& os) {
  for (size_t i = 0; i < NUM_COLS; i++) {
    if (i) os << '\t';
    os << s_columns[i];
  }
  os << CRLF;

  // empty row after header
  for (size_t i = 1; i < NUM_COLS; i++)
    os << '\t';
  os << CRLF;
}

bool MachineWriter::is_mark1(const string& refU) const noexcept {
  if (!mark1_.empty())
    return refU == str::sToUpper(mark1_);
  return refU == "FID01" or refU == "FID1";
}

bool MachineWriter::is_mark2(const string& refU) const noexcept {
  if (!mark2_.empty())
    return refU == str::sToUpper(mark2_);
  return refU == "FID02" or refU == "FID2";
}

bool MachineWriter::emit(PosReader& rdr, std::ostream& os) {
  uint16_t tr = ltrace();
  auto& ls = lout();

  stats_ = Stats();

  write_header(os);

  static const FeederParams s_noFeeder;

  PlacementRecord rec;
  while (rdr.next(rec)) {
    const string refU = str::sToUpper(rec.ref_);

    if (!stats_.mark1_.found_ && is_mark1(refU)) {
      stats_.mark1_.capture(rec);
      stats_.numFiducials_++;
      if (tr >= 3) ls << "  mark1: " << rec.ref_ << "  (" << rec.x_ << ", " << rec.y_ << ")" << endl;
      continue;
    }
    if (!stats_.mark2_.found_ && is_mark2(refU)) {
      stats_.mark2_.capture(rec);
      stats_.numFiducials_++;
      if (tr >= 3) ls << "  mark2: " << rec.ref_ << "  (" << rec.x_ << ", " << rec.y_ << ")" << endl;
      continue;
    }
    if (is_fiducial(rec.ref_)) {
      stats_.numFiducials_++;
      continue;
    }

    string key = resolve_key(rec, bom_);
    stats_.keys_.insert(key);

    auto fitr = feeders_.find(key);
    const FeederParams& fp = (fitr == feeders_.end() ? s_noFeeder : fitr->second);

    if (skipUnassigned_ && fp.feeder_.empty()) {
      stats_.numUnassigned_++;
      if (tr >= 4) ls << "  (no feeder) skipping " << rec.ref_ << "  key: " << key << endl;
      continue;
    }

    stats_.rowsTotal_++;
    if (!fp.feeder_.empty() || !fp.nozzle_.empty())
      stats_.rowsWithFeeder_++;

    const string& nozzle = fp.nozzle_.empty() ? string(DEF_NOZZLE) : fp.nozzle_;
    const string& height = fp.height_.empty() ? string(DEF_HEIGHT) : fp.height_;
    const string& speed = fp.speed_.empty() ? string(DEF_SPEED) : fp.speed_;

    os << rec.ref_ << '\t' << nozzle << '\t' << fp.feeder_ << '\t'
       << rec.x_ << '\t' << rec.y_ << '\t' << rec.rot_ << '\t'
       << height << '\t' << speed << '\t'
       << "Accurate" << '\t' << "Vision" << '\t'
       << sanitize_explanation(key) << CRLF;

    if (tr >= 4) ls << "    " << rec.ref_ << "  key: " << key << "  feeder: " << fp.feeder_ << endl;
  }

  // trailing newline, matches the machine's own files
  os << '\n';
  os.flush();

  if (tr >= 2) {
    ls << "  MachineWriter:  rowsTotal= " << stats_.rowsTotal_
       << "  rowsWithFeeder= " << stats_.rowsWithFeeder_
       << "  fiducials= " << stats_.numFiducials_
       << "  unassigned= " << stats_.numUnassigned_
       << "  skipped_rows= " << rdr.numSkipped() << endl;
  }

  return !os.fail();
}

bool MachineWriter::write(const string& pos_fn, std::ostream& os) {
  if (ltrace() >= 2) lout() << "MachineWriter::write( " << pos_fn << " )" << endl;

  PosReader rdr(pos_fn, PosReader::Mode::Full);
  if (!rdr.open())
    return false;

  if (!emit(rdr, os)) {
    set_err_code("WRITE_FILE_FAILURE");
    return false;
  }
  return true;
}

bool MachineWriter::write_file(const string& pos_fn, const string& out_fn) {
  uint16_t tr = ltrace();
  auto& ls = lout();
  if (tr >= 2) {
    ls << "\nMachineWriter::write_file()  pos: " << pos_fn
       << "  output: " << out_fn << endl;
  }

  PosReader rdr(pos_fn, PosReader::Mode::Full);
  if (!rdr.open())
    return false;

  ofstream out_file;
  out_file.open(out_fn, std::ios::out | std::ios::binary | std::ios::trunc);
  if (out_file.fail()) {
    set_err_code("OPEN_FILE_FAILURE", out_fn);
    if (tr >= 1) ls << "\n[Error] MachineWriter FAILED to open " << out_fn << endl;
    return false;
  }

  bool ok = emit(rdr, out_file);
  out_file.close();
  if (!ok || out_file.fail()) {
    set_err_code("WRITE_FILE_FAILURE", out_fn);
    if (tr >= 1) ls << "\n[Error] MachineWriter FAILED to write " << out_fn << endl;
    return false;
  }

  if (tr >= 2) lputs2("done  MachineWriter::write_file()");
  return true;
}

}  // NS pnpc
