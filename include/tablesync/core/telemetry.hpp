#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(TABLESYNC_ENABLE_TELEMETRY_L1)
    #define TS_TL1(expr) expr
#else
    #define TS_TL1(expr) ((void)0)
#endif
