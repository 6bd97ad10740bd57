#pragma once

/*fixed layout and runtime defaults; rc file settings override the runtime ones*/

#define QV_MIN_TERMINAL_ROWS 60
#define QV_MIN_TERMINAL_COLS 120

#define QV_BAR_HEIGHT         3
#define QV_LEFT_MIN_WIDTH     25
#define QV_LEFT_WIDTH_DIVISOR 4

/*per-region minimums as (rows, cols)*/
#define QV_TOP_MIN_ROWS    3
#define QV_TOP_MIN_COLS    30
#define QV_LEFT_MIN_ROWS   15
#define QV_LEFT_MIN_COLS   25
#define QV_MAIN_MIN_ROWS   15
#define QV_MAIN_MIN_COLS   50
#define QV_BOTTOM_MIN_ROWS 3
#define QV_BOTTOM_MIN_COLS 30

#ifndef QV_DEFAULT_FRAME_STYLE_NAME
#define QV_DEFAULT_FRAME_STYLE_NAME "single"
#endif

#ifndef QV_DEFAULT_STATS_INTERVAL_MS
#define QV_DEFAULT_STATS_INTERVAL_MS 1000
#endif

#define QV_WORKER_JOIN_TIMEOUT_MS 500
#define QV_RC_FILE_NAME ".quadviewrc"

#define QV_VERSION "0.3.0"
