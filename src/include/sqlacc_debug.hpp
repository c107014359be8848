#pragma once

// Set to 1 to enable debug output, 0 to disable
#define SQLACC_DEBUG 0

#if SQLACC_DEBUG
#include "duckdb/common/printer.hpp"
#define SQLACC_DEBUG_PRINT(x) duckdb::Printer::Print(x)
#else
#define SQLACC_DEBUG_PRINT(x) ((void)0)
#endif
