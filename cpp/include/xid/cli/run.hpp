#pragma once

#include <cstdio>

#include "xid/cli/options.hpp"
#include "xid/platform/host.hpp"

namespace xid::cli {
    inline constexpr int kExitOk = 0;
    inline constexpr int kExitBadInput = 1;
    inline constexpr int kExitUsage = 2;

    // Runs the xid tool. args excludes the program name. Results go to out,
    // diagnostics ("error: ...", "info: ...") to err. Returns the exit status.
    int run(const CliArgs& args, const xid::platform::HostEnv& env, std::FILE* out, std::FILE* err);

} // namespace xid::cli
