#include "file_readers/feeder_reader.h"
#include "file_readers/Fio.h"
#include "util/err_code.h"

namespace pnpc {

using namespace std;

bool FeederReader::read_feeders(const string& fn) {
  uint16_t tr = ltrace();
  auto& ls = lout();
  if (tr >= 2) ls << "FeederReader::read_feeders( " << fn << " )" << endl;

  feeders_.clear();
  num_rows_ = num_skipped_ = num_overwritten_ = 0;

  fio::LineReader lr(fn);
  lr.setTrace(tr);
  if (!lr.read()) {
    set_err_code("FEEDER_FILE_READ_ERROR", fn);
    ls << "[Error] FeederReader: could not read " << fn << endl;
    return false;
  }

  vector<string> row;
  string rec;

  // the first record is the header, never inspected
  size_t li = 1 + fio::read_csv_record(lr, 1, rec);
  while (li <= lr.numLines()) {
    size_t recLine = li;
    li += fio::read_csv_record(lr, li, rec);
    if (fio::Fio::isEmptyLine(rec.c_str()))
      continue;
    fio::split_csv(rec.c_str(), row);
    if (row.size() < 5) {
      num_skipped_++;
      if (tr >= 4) lprintf("  (feeders) skipping line %zu: %zu columns\n", recLine, row.size());
      continue;
    }

    string key = str::sTrim(row[0]);
    if (key.empty()) {
      num_skipped_++;
      continue;
    }

    FeederParams fp(str::sTrim(row[1]), str::sTrim(row[2]),
                    str::sTrim(row[3]), str::sTrim(row[4]));
    if (tr >= 4) {
      ls << "    " << key << " -> feeder:" << fp.feeder_ << " nozzle:" << fp.nozzle_
         << " speed:" << fp.speed_ << " height:" << fp.height_ << endl;
    }

    auto fitr = feeders_.find(key);
    if (fitr == feeders_.end()) {
      feeders_.emplace(key, fp);
    } else {
      fitr->second = fp;
      num_overwritten_++;
    }
    num_rows_++;
  }

  if (tr >= 2) {
    ls << "done  FeederReader::read_feeders().  rows= " << num_rows_
       << "  keys= " << feeders_.size() << "  skipped= " << num_skipped_ << endl;
  }
  if (tr >= 3 && num_overwritten_) {
    lprintf("  NOTE: %u feeder keys were listed more than once (last row wins)\n",
            num_overwritten_);
  }
  return true;
}

}  // NS pnpc
