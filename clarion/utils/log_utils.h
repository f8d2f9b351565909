#pragma once
#include <spdlog/spdlog.h>

namespace clarion::utils {

// Initialises the default logger to point to stderr.
void InitLogging();

enum class VerboseLogLevel : int {
    none = 0,
    debug = 1,
    trace = 2,
};

void SetVerboseLogging(VerboseLogLevel level);

}  // namespace clarion::utils
