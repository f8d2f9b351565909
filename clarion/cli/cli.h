#pragma once

namespace clarion {

int call_variants(int argc, char* argv[]);

}  // namespace clarion
