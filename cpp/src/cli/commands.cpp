#include "xid/cli/commands.hpp"

#include <cstring>

namespace xid::cli {
    namespace {
        [[nodiscard]] const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }
    } // namespace

    xid::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const xid::core::Status bad = xid::core::make_status(xid::core::StatusDomain::Cli, xid::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return bad;
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return bad;
        }
        if (spec_count > 0 && specs == nullptr) {
            return bad;
        }

        // Options belong before the command; a leading '-' here is a usage error.
        const char* name = args.argv[0];
        if (name[0] == '-') {
            return bad;
        }

        const CommandSpec* match = find_command(specs, spec_count, name);
        if (match == nullptr) {
            return bad;
        }

        out->id = match->id;
        out->args = CliArgs{args.argv + 1, args.argc - 1};
        *consumed = 1;
        return xid::core::ok_status();
    }
} // namespace xid::cli
