#pragma once
#ifndef __pnpc_MACHINE_WRITER_H_
#define __pnpc_MACHINE_WRITER_H_

#include <set>

#include "file_readers/pos_reader.h"
#include "file_readers/bom_reader.h"
#include "file_readers/feeder_reader.h"

namespace pnpc {

// Writes TVM802 "Pick Place" machine data, tab-separated:
//
//  Designator NozzleNum StackNum Mid X Mid Y Rotation Height Speed Vision Check Explanation
//  <10 tabs>
//  R1         1         12       12.5  3.2   90       0      100   Accurate Vision 0402 10k
//  ...
//
// Fiducials are never placed. Two of them give the board mark coordinates.
class MachineWriter {
public:
  static constexpr CStr DEF_MARK_X = "0.00";
  static constexpr CStr DEF_MARK_Y = "0.00";

  static constexpr CStr DEF_NOZZLE = "1";
  static constexpr CStr DEF_HEIGHT = "0";
  static constexpr CStr DEF_SPEED = "100";

  struct Mark {
    string ref_;
    string x_ = DEF_MARK_X, y_ = DEF_MARK_Y;
    bool found_ = false;

    void capture(const PlacementRecord& rec) noexcept {
      ref_ = rec.ref_;
      x_ = rec.x_;
      y_ = rec.y_;
      found_ = true;
    }
  };

  struct Stats {
    uint rowsTotal_ = 0;       // emitted rows
    uint rowsWithFeeder_ = 0;  // emitted rows with feeder or nozzle in the feeders file
    uint numFiducials_ = 0;    // excluded fiducial rows, marks included
    uint numUnassigned_ = 0;   // dropped by skipUnassigned_
    Mark mark1_, mark2_;
    std::set<string> keys_;    // distinct component keys looked up
  };

  // explicit mark designators, empty means FID01/FID1 and FID02/FID2
  string mark1_, mark2_;

  // drop components whose key has no feeder slot
  bool skipUnassigned_ = false;

  MachineWriter(const FeederMap& feeders, const BomMap* bom) noexcept
    : feeders_(feeders), bom_(bom)
  {}

  // false on IO failure (err_code is set)
  bool write(const string& pos_fn, std::ostream& os);

  // creates/truncates out_fn. a failed write leaves the partial file.
  bool write_file(const string& pos_fn, const string& out_fn);

  const Stats& stats() const noexcept { return stats_; }

  static void write_header(std::ostream& os);

private:
  bool emit(PosReader& rdr, std::ostream& os);

  bool is_mark1(const string& refU) const noexcept;
  bool is_mark2(const string& refU) const noexcept;

  const FeederMap& feeders_;
  const BomMap* bom_ = nullptr;

  Stats stats_;
};

}  // NS pnpc

#endif
