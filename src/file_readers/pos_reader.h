#pragma once
#ifndef __pnpc_POS_READER_H_
#define __pnpc_POS_READER_H_

#include "file_readers/Fio.h"

/*
Supported placement (POS) CSV schemas:

* KicadPos  : Ref,Val,Package,PosX,PosY,Rot,Side
* Positions : Designator,Mid X,Mid Y,Rotation,Layer   (positions.csv-style)
* Unknown   : any other header. Rows are read KicadPos-shaped,
              component keys fall back to the designator.
*/

namespace pnpc {

using std::string;
using std::vector;

enum class PosFormat : uint8_t {
  Unknown = 0,
  KicadPos = 1,
  Positions = 2
};

CStr pos_format_name(PosFormat f) noexcept;

// header cell normalization: trim, strip leading byte-order-mark, lowercase
string norm_header_cell(const string& cell) noexcept;

// strips a leading UTF-8 BOM (or its latin-1 mis-decoded form), no trimming
string strip_bom(const string& s) noexcept;

PosFormat detect_pos_format(const vector<string>& header) noexcept;

struct PlacementRecord {
  string ref_;
  string val_;
  string package_;
  string x_, y_, rot_;   // numeric text, kept verbatim
  PosFormat fmt_ = PosFormat::Unknown;
  uint line_ = 0;        // 1-based first line of the record

  PlacementRecord() noexcept = default;
};

inline bool is_fiducial(const string& ref) noexcept {
  return str::starts_with(str::sToUpper(ref), "FID");
}

// Streams PlacementRecords out of a placement CSV.
// The first record is the header. A quoted field may span lines.
class PosReader {
public:
  enum class Mode : uint8_t {
    Full = 0,   // ref, value, package, x, y, rotation
    Keys = 1,   // ref, value, package
    Refs = 2    // ref only
  };

  PosReader(const string& fn, Mode m = Mode::Full) noexcept
    : lr_(fn), mode_(m)
  {}

  // false on IO failure (err_code is set)
  bool open() noexcept;

  // false at end of file
  bool next(PlacementRecord& rec) noexcept;

  // restart from the first data row
  void reIterate() noexcept {
    curLine_ = dataLine_;
    num_rows_ = num_skipped_ = 0;
  }

  PosFormat format() const noexcept { return fmt_; }
  const vector<string>& header() const noexcept { return header_; }
  const string& fileName() const noexcept { return lr_.fileName(); }

  bool hasHeader() const noexcept { return has_header_; }

  uint numRows() const noexcept { return num_rows_; }
  uint numSkipped() const noexcept { return num_skipped_; }

  // minimum number of columns for the current format and mode
  size_t minColumns() const noexcept;

private:
  fio::LineReader lr_;
  Mode mode_ = Mode::Full;
  PosFormat fmt_ = PosFormat::Unknown;
  vector<string> header_;
  bool has_header_ = false;

  size_t dataLine_ = 2;  // first line after the header record
  size_t curLine_ = 2;
  uint num_rows_ = 0;
  uint num_skipped_ = 0;

  vector<string> row_;
  string rec_;
};

// distinct fiducial designators, in first-seen order.
// false on IO failure.
bool collect_fiducials(const string& pos_fn, vector<string>& fids) noexcept;

// detects the schema of a placement file by its header line.
// false on IO failure.
bool read_pos_format(const string& pos_fn, PosFormat& fmt) noexcept;

}  // NS pnpc

#endif
