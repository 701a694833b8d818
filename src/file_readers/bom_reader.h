#pragma once
#ifndef __pnpc_BOM_READER_H_
#define __pnpc_BOM_READER_H_

#include <unordered_map>

#include "util/pnpc_log.h"

namespace pnpc {

using std::string;
using std::vector;

// reference designator -> component key "<footprint> <value>"
using BomMap = std::unordered_map<string, string>;

// BOM CSV with a header naming (case-insensitive) the columns
//   Designator  - one or more refs, comma-separated: "C1,C2, C3"
//   Footprint   - optional
//   Value       - optional
struct BomReader {
  BomMap ref2key_;

  uint num_rows_ = 0;
  uint num_overwritten_ = 0;

  int designator_col_ = -1;
  int footprint_col_ = -1;
  int value_col_ = -1;

  BomReader() = default;

  // false on IO failure (err_code is set). empty file gives empty map.
  bool read_bom(const string& fn);

  const BomMap& get_map() const noexcept { return ref2key_; }

  bool hasDesignatorColumn() const noexcept { return designator_col_ >= 0; }

  // "C1, C2,C3 " -> {C1, C2, C3}
  static vector<string> split_designators(const string& cell) noexcept;
};

}  // NS pnpc

#endif
