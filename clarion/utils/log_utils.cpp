#include "log_utils.h"

#include "tty_utils.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

#include <array>
#include <cstdio>
#include <string>

namespace clarion::utils {

namespace {

/**
 * \brief Returns the file path associated with a file descriptor, or an empty string
 *          if the descriptor does not correspond to a file.
 */
#ifndef _WIN32
std::string get_file_path(int fd) {
#ifdef __linux__
    std::array<char, 256> file_path;
    std::array<char, 256> procfd_path;
    std::snprintf(procfd_path.data(), procfd_path.size(), "/proc/self/fd/%d", fd);
    const ssize_t len = readlink(procfd_path.data(), file_path.data(), file_path.size() - 1);
    if (len != -1) {
        file_path[len] = '\0';
        return std::string(file_path.data());
    }
#else
    (void)fd;
#endif
    return "";
}
#endif  // _WIN32

// Variant calls can be written to stdout, so logging is only safe if stderr goes elsewhere.
bool is_safe_to_log() {
#ifdef _WIN32
    return true;
#else
    if (get_file_path(fileno(stdout)) == get_file_path(fileno(stderr))) {
        return utils::is_fd_tty(stderr);
    }
    return true;
#endif
}

}  // namespace

void InitLogging() {
    // Replace the default stdout logger with a (color, multi-threaded) stderr logger
    // (but first replace it with an arbitrarily-named logger to prevent a name clash).
    spdlog::set_default_logger(spdlog::stderr_color_mt("unused_name"));
    spdlog::set_default_logger(spdlog::stderr_color_mt(""));
    if (!is_safe_to_log()) {
        spdlog::set_level(spdlog::level::off);
    }
}

void SetVerboseLogging(VerboseLogLevel level) {
    if (!is_safe_to_log()) {
        return;
    }
    if (level >= VerboseLogLevel::trace) {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == VerboseLogLevel::debug) {
        spdlog::set_level(spdlog::level::debug);
    }
}

}  // namespace clarion::utils
