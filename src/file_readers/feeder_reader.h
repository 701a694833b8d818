#pragma once
#ifndef __pnpc_FEEDER_READER_H_
#define __pnpc_FEEDER_READER_H_

#include <unordered_map>

#include "util/pnpc_log.h"

/*
Feeders CSV, positional columns, the first line is always skipped:

  Component,Feeder,Nozzle,Speed,Height
  0402 10k,12,1,100,0.5
*/

namespace pnpc {

using std::string;
using std::vector;

struct FeederParams {
  string feeder_;  // StackNum
  string nozzle_;
  string speed_;
  string height_;

  FeederParams() noexcept = default;

  FeederParams(const string& f, const string& n, const string& s, const string& h)
    : feeder_(f), nozzle_(n), speed_(s), height_(h)
  {}
};

// component key -> feeder parameters
using FeederMap = std::unordered_map<string, FeederParams>;

struct FeederReader {
  FeederMap feeders_;

  uint num_rows_ = 0;
  uint num_skipped_ = 0;
  uint num_overwritten_ = 0;

  FeederReader() = default;

  // false on IO failure (err_code is set)
  bool read_feeders(const string& fn);

  const FeederMap& get_map() const noexcept { return feeders_; }
};

}  // NS pnpc

#endif
