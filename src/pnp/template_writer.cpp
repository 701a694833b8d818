#include "pnp/template_writer.h"
#include "pnp/component_key.h"
#include "util/err_code.h"

#include <set>

namespace pnpc {

using namespace std;

bool TemplateWriter::collect_keys(const string& pos_fn, vector<string>& keys) const {
  keys.clear();
  uint16_t tr = ltrace();
  if (tr >= 2) lout() << "TemplateWriter::collect_keys( " << pos_fn << " )" << endl;

  PosReader rdr(pos_fn, PosReader::Mode::Keys);
  if (!rdr.open())
    return false;

  std::set<string> uniq;
  PlacementRecord rec;
  while (rdr.next(rec)) {
    if (is_fiducial(rec.ref_))
      continue;
    string key = resolve_key(rec, bom_);
    if (!key.empty())
      uniq.insert(key);
  }

  keys.assign(uniq.begin(), uniq.end());

  if (tr >= 3) {
    lprintf("  components: %zu  distinct keys: %zu  skipped rows: %u\n",
            size_t(rdr.numRows()), keys.size(), rdr.numSkipped());
  }
  return true;
}

bool TemplateWriter::write(const vector<string>& keys, std::ostream& os) const {
  os << "Component,Feeder,Nozzle,Speed,Height\r\n";
  for (const string& k : keys) {
    os << fio::csv_quote(k) << ",," << DEF_NOZZLE << ',' << DEF_SPEED << ','
       << DEF_HEIGHT << "\r\n";
  }
  os.flush();
  return !os.fail();
}

bool TemplateWriter::write_file(const string& pos_fn, const string& out_fn) const {
  uint16_t tr = ltrace();
  auto& ls = lout();
  if (tr >= 2) {
    ls << "\nTemplateWriter::write_file()  pos: " << pos_fn
       << "  output: " << out_fn << endl;
  }

  vector<string> keys;
  if (!collect_keys(pos_fn, keys))
    return false;

  ofstream out_file;
  out_file.open(out_fn, std::ios::out | std::ios::binary | std::ios::trunc);
  if (out_file.fail()) {
    set_err_code("OPEN_FILE_FAILURE", out_fn);
    if (tr >= 1) ls << "\n[Error] TemplateWriter FAILED to open " << out_fn << endl;
    return false;
  }

  bool ok = write(keys, out_file);
  out_file.close();
  if (!ok || out_file.fail()) {
    set_err_code("WRITE_FILE_FAILURE", out_fn);
    if (tr >= 1) ls << "\n[Error] TemplateWriter FAILED to write " << out_fn << endl;
    return false;
  }

  if (tr >= 2) lputs2("done  TemplateWriter::write_file()");
  return true;
}

}  // NS pnpc
