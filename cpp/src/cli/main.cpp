#include <cstdio>

#include "xid/cli/options.hpp"
#include "xid/cli/run.hpp"
#include "xid/platform/host.hpp"

int main(int argc, char** argv) {
    const xid::cli::CliArgs args{argv + 1, argc > 0 ? static_cast<xid::cli::u32>(argc - 1) : 0u};
    return xid::cli::run(args, xid::platform::system_host_env(), stdout, stderr);
}
