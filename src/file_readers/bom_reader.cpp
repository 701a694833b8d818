#include "file_readers/bom_reader.h"
#include "file_readers/Fio.h"
#include "file_readers/pos_reader.h"
#include "util/err_code.h"

namespace pnpc {

using namespace std;

vector<string> BomReader::split_designators(const string& cell) noexcept {
  string compact;
  compact.reserve(cell.length());
  for (char c : cell) {
    if (!std::isspace((unsigned char)c))
      compact.push_back(c);
  }

  vector<string> refs;
  size_t b = 0;
  while (b <= compact.length()) {
    size_t e = compact.find(',', b);
    if (e == string::npos) e = compact.length();
    string tok = str::sTrim(compact.substr(b, e - b));
    if (!tok.empty())
      refs.push_back(tok);
    b = e + 1;
  }
  return refs;
}

static string cell_at(const vector<string>& row, int col) noexcept {
  if (col < 0 || size_t(col) >= row.size())
    return {};
  return str::sTrim(row[col]);
}

bool BomReader::read_bom(const string& fn) {
  uint16_t tr = ltrace();
  auto& ls = lout();
  if (tr >= 2) ls << "BomReader::read_bom( " << fn << " )" << endl;

  ref2key_.clear();
  num_rows_ = num_overwritten_ = 0;
  designator_col_ = footprint_col_ = value_col_ = -1;

  fio::LineReader lr(fn);
  lr.setTrace(tr);
  if (!lr.read()) {
    set_err_code("BOM_FILE_READ_ERROR", fn);
    ls << "[Error] BomReader: could not read " << fn << endl;
    return false;
  }

  if (lr.numLines() == 0) {
    if (tr >= 3) lputs("  (empty BOM file)");
    return true;
  }

  vector<string> row;
  string rec;
  size_t li = 1 + fio::read_csv_record(lr, 1, rec);
  fio::split_csv(rec.c_str(), row);
  for (size_t i = 0; i < row.size(); i++) {
    string h = str::sToLower(strip_bom(str::sTrim(row[i])));
    if (h == "designator" && designator_col_ < 0)
      designator_col_ = i;
    else if (h == "footprint" && footprint_col_ < 0)
      footprint_col_ = i;
    else if (h == "value" && value_col_ < 0)
      value_col_ = i;
  }

  if (tr >= 3) {
    lprintf("  BOM columns:  designator= %i  footprint= %i  value= %i\n",
            designator_col_, footprint_col_, value_col_);
  }
  if (!hasDesignatorColumn()) {
    if (tr >= 2) lputs("  BOM has no Designator column, no rows are usable");
    return true;
  }

  while (li <= lr.numLines()) {
    li += fio::read_csv_record(lr, li, rec);
    if (fio::Fio::isEmptyLine(rec.c_str()))
      continue;
    fio::split_csv(rec.c_str(), row);

    string designators = cell_at(row, designator_col_);
    if (designators.empty())
      continue;

    string footprint = cell_at(row, footprint_col_);
    string value = cell_at(row, value_col_);
    string key = str::sTrim(str::concat(footprint, " ", value));

    for (const string& ref : split_designators(designators)) {
      auto ins = ref2key_.emplace(ref, key);
      if (!ins.second) {
        ins.first->second = key;
        num_overwritten_++;
      }
      if (tr >= 4) ls << "    " << ref << " -> " << key << endl;
    }
    num_rows_++;
  }

  if (tr >= 2) {
    ls << "done  BomReader::read_bom().  rows= " << num_rows_
       << "  refs= " << ref2key_.size() << endl;
  }
  if (tr >= 3 && num_overwritten_) {
    lprintf("  NOTE: %u BOM designators were listed more than once (last row wins)\n",
            num_overwritten_);
  }
  return true;
}

}  // NS pnpc
