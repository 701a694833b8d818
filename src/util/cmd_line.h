#pragma once
#ifndef __pnpc_CMD_LINE_H_
#define __pnpc_CMD_LINE_H_

#include <unordered_map>
#include <unordered_set>

#include "util/pnpc_log.h"

namespace pnpc {

using std::string;
using std::unordered_map;
using std::unordered_set;

// --key value  : parameter
// -flag        : flag
struct cmd_line
{
    unordered_map<string, string>   params_;
    unordered_set<string>           flags_;
    uint                            num_warnings_ = 0;

    cmd_line() = default;
    cmd_line(int argc, const char** argv);

    bool is_flag_set(const string &fl) const noexcept { return flags_.count(fl); }
    bool has_param(const string& key) const noexcept { return params_.count(key); }

    string get_param(const string& key) const noexcept
    {
        auto fitr = params_.find(key);
        if (fitr == params_.end())
            return "";
        return fitr->second;
    }

    void set_flag(const string &fl);
    void set_param_value(const string &key, const string &val);
    void print_options() const;
};

}

#endif
