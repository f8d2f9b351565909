#pragma once

#include <cstdio>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace clarion::utils {

/// True if the stream is attached to a terminal, so log output may be coloured.
inline bool is_fd_tty(FILE* fd) {
#ifdef _WIN32
    return _isatty(_fileno(fd));
#else
    return isatty(fileno(fd));
#endif
}

}  // namespace clarion::utils
