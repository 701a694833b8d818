#pragma once
#ifndef __pnpc_PNPC_MAIN_H_
#define __pnpc_PNPC_MAIN_H_

namespace pnpc {

struct cmd_line;

// 0 - success, 1 - processing failure, 2 - usage error
int pnpc_main(const cmd_line& cmd);

}

#endif
