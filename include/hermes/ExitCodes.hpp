/**
 * ExitCodes.hpp - Process exit codes consumed by shell integration
 */

#pragma once

namespace hermes {

// 10 is reserved for "requires attention" so the calling shell can tell a
// flagged command apart from a tool failure (1-9).
const int EXIT_SUCCESS_CODE = 0;
const int EXIT_ERROR = 1;
const int EXIT_CONFIG = 2;
const int EXIT_API = 3;
const int EXIT_USAGE = 4;
const int EXIT_ATTENTION = 10;

} // namespace hermes
