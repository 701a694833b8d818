#include "util/cmd_line.h"
#include "util/pnpc_log.h"

#include "pnp/pnpc_main.h"

// Convert a KiCad placement (POS) CSV into TVM802 pick-and-place machine data.
// This requires : POS CSV file - KiCad .pos export or positions.csv-style file
//                 feeders CSV  - component key -> feeder, nozzle, speed, height
//                 BOM CSV      - optional, groups parts by footprint + value;
//                                required for positions.csv-style input
// It also writes a blank feeders CSV (--template) for a POS file.
//
// Usage options: --pos POS_CSV [--bom BOM_CSV]
//                [--feeders FEEDERS_CSV [--output OUTPUT]]
//                [--template TEMPLATE_OUTPUT]
//                [--mark1 FID] [--mark2 FID] [-skip_unassigned]
//                [-allow_no_bom] [-fids] [--config JOB_JSON]

int main(int argc, const char* argv[]) {
  using namespace pnpc;
  const char* trace = getenv("pnpc_trace");
  if (trace)
    set_ltrace(atoi(trace));
  else
    set_ltrace(3);

  cmd_line cmd(argc, argv);

  if (ltrace() >= 3) {
    lputs("\n    pnp_c");
    if (ltrace() >= 4)
      cmd.print_options();
  }

  if (cmd.num_warnings_ && ltrace() >= 2)
    lprintf("\n\t pnp_c: NOTE command line WARNINGs: %u\n", cmd.num_warnings_);

  int status = pnpc_main(cmd);

  if (ltrace() >= 4)
    lprintf("(pnp_c main status) %i\n", status);
  flush_out();
  return status;
}
