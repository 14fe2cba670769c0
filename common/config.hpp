// config.hpp
#pragma once
#include <cstddef>

namespace Config {
    inline constexpr std::size_t COPY_BUFFER_SIZE = 1024 * 1024;  // 1 mb per read/write during file copy
    inline constexpr std::size_t HASH_BUFFER_SIZE = 64 * 1024;    // 64 kb reads while hashing
    inline constexpr const char* TEMP_TAG = ".treecopy-";         // copy lands in <dest>.treecopy-<hex>.tmp, then renamed
    inline constexpr const char* TEMP_SUFFIX = ".tmp";
    inline constexpr int TEMP_NAME_ATTEMPTS = 16;                 // fresh random names tried before giving up
    inline constexpr int PROGRESS_THROTTLE_MS = 200;              // cli redraw interval
    inline constexpr std::size_t MAX_PATH_LENGTH = 4096;          // PATH_MAX on linux
    inline constexpr char MANIFEST_COMMENT = ';';
    inline constexpr const char* MANIFEST_GENERATOR = "treecopy";
}
