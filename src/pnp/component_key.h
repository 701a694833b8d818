#pragma once
#ifndef __pnpc_COMPONENT_KEY_H_
#define __pnpc_COMPONENT_KEY_H_

#include "file_readers/pos_reader.h"
#include "file_readers/bom_reader.h"

namespace pnpc {

// Component key: groups interchangeable parts for feeder assignment.
// Both output files (feeders template, machine data) key through here.
//
//   1. bom given and has 'ref'  ->  BOM key "<footprint> <value>"
//   2. Positions or Unknown     ->  ref
//   3. KicadPos                 ->  "<package> <value>" trimmed
//
string resolve_key(const string& ref, PosFormat fmt,
                   const string& package, const string& value,
                   const BomMap* bom) noexcept;

inline string resolve_key(const PlacementRecord& rec, const BomMap* bom) noexcept {
  return resolve_key(rec.ref_, rec.fmt_, rec.package_, rec.val_, bom);
}

// removes " ( ) and the full-width ＂ （ ）, then trims
string sanitize_explanation(const string& text) noexcept;

}  // NS pnpc

#endif
