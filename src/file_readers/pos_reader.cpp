#include "file_readers/pos_reader.h"
#include "util/err_code.h"

namespace pnpc {

using namespace std;

CStr pos_format_name(PosFormat f) noexcept {
  switch (f) {
    case PosFormat::KicadPos:  return "kicad_pos";
    case PosFormat::Positions: return "positions";
    default: break;
  }
  return "unknown";
}

string strip_bom(const string& s) noexcept {
  // UTF-8 encoded U+FEFF
  if (str::starts_with(s, "\xEF\xBB\xBF"))
    return s.substr(3);
  // the same 3 bytes read as latin-1 and re-encoded to UTF-8
  if (str::starts_with(s, "\xC3\xAF\xC2\xBB\xC2\xBF"))
    return s.substr(6);
  return s;
}

string norm_header_cell(const string& cell) noexcept {
  string s = str::sTrim(cell);
  s = strip_bom(s);
  return str::sToLower(s);
}

PosFormat detect_pos_format(const vector<string>& header) noexcept {
  vector<string> H;
  H.reserve(header.size());
  for (const string& cell : header)
    H.push_back(norm_header_cell(cell));

  if (H.size() >= 3 and (H[0] == "ref" or H[0] == "reference") and
      H[1] == "val" and H[2] == "package")
    return PosFormat::KicadPos;

  if (H.size() >= 5 and (H[0] == "designator" or H[0] == "ref") and
      str::starts_with(H[1], "mid x") and str::starts_with(H[2], "mid y") and
      str::starts_with(H[3], "rotation"))
    return PosFormat::Positions;

  return PosFormat::Unknown;
}

size_t PosReader::minColumns() const noexcept {
  if (mode_ == Mode::Refs)
    return 1;
  if (fmt_ == PosFormat::Positions)
    return 5;
  return mode_ == Mode::Full ? 6 : 3;
}

bool PosReader::open() noexcept {
  uint16_t tr = ltrace();
  if (tr >= 2) lout() << "PosReader::open( " << lr_.fileName() << " )" << endl;

  header_.clear();
  has_header_ = false;
  fmt_ = PosFormat::Unknown;
  dataLine_ = 2;
  reIterate();

  lr_.setTrace(tr);
  if (!lr_.read()) {
    set_err_code("POS_FILE_READ_ERROR", lr_.fileName());
    return false;
  }

  if (lr_.numLines() == 0) {
    if (tr >= 3) lputs("  (empty placement file)");
    return true;
  }

  dataLine_ = 1 + fio::read_csv_record(lr_, 1, rec_);
  curLine_ = dataLine_;
  fio::split_csv(rec_.c_str(), header_);
  has_header_ = true;
  fmt_ = detect_pos_format(header_);

  if (tr >= 3) {
    lprintf("  pos format: %s  lines: %zu\n", pos_format_name(fmt_), lr_.numLines());
    if (tr >= 4) logVec(header(), "  header:");
    if (tr >= 5) lr_.print(lout());
  }
  return true;
}

bool PosReader::next(PlacementRecord& rec) noexcept {
  if (!has_header_)
    return false;

  uint16_t tr = ltrace();
  size_t minCols = minColumns();

  while (curLine_ <= lr_.numLines()) {
    size_t li = curLine_;
    curLine_ += fio::read_csv_record(lr_, li, rec_);
    if (fio::Fio::isEmptyLine(rec_.c_str()))
      continue;

    fio::split_csv(rec_.c_str(), row_);
    if (row_.size() < minCols) {
      num_skipped_++;
      if (tr >= 4) lprintf("  (pos) skipping line %zu: %zu columns < %zu\n", li, row_.size(), minCols);
      continue;
    }

    string ref = str::sTrim(row_[0]);
    if (ref.empty()) {
      num_skipped_++;
      if (tr >= 4) lprintf("  (pos) skipping line %zu: empty designator\n", li);
      continue;
    }

    rec = PlacementRecord();
    rec.ref_ = ref;
    rec.fmt_ = fmt_;
    rec.line_ = li;

    if (mode_ != Mode::Refs) {
      if (fmt_ == PosFormat::Positions) {
        rec.x_ = str::sTrim(row_[1]);
        rec.y_ = str::sTrim(row_[2]);
        rec.rot_ = str::sTrim(row_[3]);
      } else {
        rec.val_ = str::sTrim(row_[1]);
        rec.package_ = str::sTrim(row_[2]);
        if (mode_ == Mode::Full) {
          rec.x_ = str::sTrim(row_[3]);
          rec.y_ = str::sTrim(row_[4]);
          rec.rot_ = str::sTrim(row_[5]);
        }
      }
    }

    num_rows_++;
    return true;
  }

  return false;
}

bool collect_fiducials(const string& pos_fn, vector<string>& fids) noexcept {
  fids.clear();

  PosReader rdr(pos_fn, PosReader::Mode::Refs);
  if (!rdr.open())
    return false;

  PlacementRecord rec;
  while (rdr.next(rec)) {
    if (!is_fiducial(rec.ref_))
      continue;
    if (std::find(fids.begin(), fids.end(), rec.ref_) == fids.end())
      fids.push_back(rec.ref_);
  }

  if (ltrace() >= 3) logVec(fids, "  fiducials:");
  return true;
}

bool read_pos_format(const string& pos_fn, PosFormat& fmt) noexcept {
  fmt = PosFormat::Unknown;
  PosReader rdr(pos_fn, PosReader::Mode::Refs);
  if (!rdr.open())
    return false;
  fmt = rdr.format();
  return true;
}

}  // NS pnpc
