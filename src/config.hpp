#pragma once

/*compile-time defaults; runtime overrides come from ~/.wroomrc*/

#ifndef WR_DEFAULT_TEXT_WIDTH
#define WR_DEFAULT_TEXT_WIDTH 72
#endif

#ifndef WR_DEFAULT_TAB_WIDTH
#define WR_DEFAULT_TAB_WIDTH 4
#endif

#define WR_RC_FILE_NAME  ".wroomrc"
#define WR_LOG_FILE_NAME ".wroom.log"
#define WR_LOG_MAX_SIZE  (1 << 20)
#define WR_LOG_MAX_FILES 2

#define WR_WRITE_CHUNK_SIZE (1 << 16)

#define WR_UNNAMED_NAME "* Unnamed *"
