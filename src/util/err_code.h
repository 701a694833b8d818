#pragma once
#ifndef __pnpc_ERR_CODE_H_
#define __pnpc_ERR_CODE_H_

#include "util/pnpc_log.h"

namespace pnpc {

using std::string;

// the last error of a failed operation, a key of the err_map.
// empty string means 'no error'.
const string& err_code() noexcept;
void clear_err_code() noexcept;
void set_err_code(CStr cs) noexcept;

// the file the last error refers to, may be empty
const string& err_file() noexcept;
void set_err_code(CStr cs, const string& fn) noexcept;

// err_map lookup, human-readable text for an error key
string err_lookup(const string& key) noexcept;

}

#endif
