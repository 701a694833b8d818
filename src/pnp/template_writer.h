#pragma once
#ifndef __pnpc_TEMPLATE_WRITER_H_
#define __pnpc_TEMPLATE_WRITER_H_

#include "file_readers/pos_reader.h"
#include "file_readers/bom_reader.h"

namespace pnpc {

// Blank feeders CSV: one row per distinct component key, feeder column empty.
//
//   Component,Feeder,Nozzle,Speed,Height
//   0402 10k,,1/2,100,0.5
//
struct TemplateWriter {
  static constexpr CStr DEF_NOZZLE = "1/2";
  static constexpr CStr DEF_SPEED = "100";
  static constexpr CStr DEF_HEIGHT = "0.5";

  const BomMap* bom_ = nullptr;

  TemplateWriter(const BomMap* bom = nullptr) noexcept
    : bom_(bom)
  {}

  // sorted distinct non-empty keys of all non-fiducial components.
  // false on IO failure (err_code is set)
  bool collect_keys(const string& pos_fn, vector<string>& keys) const;

  bool write(const vector<string>& keys, std::ostream& os) const;

  bool write_file(const string& pos_fn, const string& out_fn) const;
};

}  // NS pnpc

#endif
