#include "xid/cli/run.hpp"

#include <array>
#include <chrono>
#include <cstring>
#include <ctime>

#include "xid/cli/commands.hpp"
#include "xid/codec/base32.hpp"
#include "xid/core/errors.hpp"
#include "xid/core/xid.hpp"
#include "xid/gen/generator.hpp"

namespace xid::cli {
    namespace {
        // Upper bound for `new -n`; one counter window.
        constexpr i64 kMaxCount = static_cast<i64>(xid::kCounterMask) + 1;

        struct RunConfig {
            std::FILE* out{nullptr};
            std::FILE* err{nullptr};
            bool quiet{false};
        };

        // ========================================================================
        // Error Handling
        // ========================================================================

        void print_error(const RunConfig& cfg, const char* msg) {
            std::fprintf(cfg.err, "error: %s\n", msg);
        }

        void print_status_error(const RunConfig& cfg, const char* context, xid::core::Status s) {
            std::fprintf(cfg.err, "error: %s failed (code=%u, domain=%u)\n",
                context,
                static_cast<unsigned>(s.code),
                static_cast<unsigned>(s.domain));
        }

        void print_status_error_detailed(const RunConfig& cfg, const char* context, xid::core::Status s) {
            std::fprintf(cfg.err,
                "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                context,
                xid::core::status_code_name(s.code),
                static_cast<unsigned>(s.code),
                xid::core::status_domain_name(s.domain),
                static_cast<unsigned>(s.domain),
                s.aux);
        }

        void print_parse_error(const RunConfig& cfg, const char* text, xid::core::Status s) {
            if (s.code == xid::core::StatusCode::InvalidFormat && s.aux < xid::kEncodedLen &&
                std::strlen(text) == xid::kEncodedLen) {
                std::fprintf(cfg.err, "error: %s: invalid character '%c' at position %u\n", text, text[s.aux], s.aux);
                return;
            }
            if (s.code == xid::core::StatusCode::InvalidFormat) {
                std::fprintf(cfg.err, "error: %s: expected %u characters, got %u\n", text, xid::kEncodedLen, s.aux);
                return;
            }
            print_status_error_detailed(cfg, text, s);
        }

        // ========================================================================
        // Formatting
        // ========================================================================

        void format_utc(std::chrono::sys_seconds t, char* buf, size_t cap) {
            const std::time_t tt = static_cast<std::time_t>(t.time_since_epoch().count());
            std::tm tm{};
            if (gmtime_r(&tt, &tm) == nullptr || std::strftime(buf, cap, "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
                std::snprintf(buf, cap, "@%lld", static_cast<long long>(tt));
            }
        }

        void print_hex(std::FILE* f, const xid::u8* b, size_t n) {
            for (size_t i = 0; i < n; ++i) {
                std::fprintf(f, "%02x", static_cast<unsigned>(b[i]));
            }
        }

        // ========================================================================
        // Command Handlers
        // ========================================================================

        void handle_help(const RunConfig& cfg) {
            std::FILE* f = cfg.out;
            std::fprintf(f, "Usage: xid [-q|--quiet] <command> [args]\n");
            std::fprintf(f, "\n");
            std::fprintf(f, "Commands:\n");
            std::fprintf(f, "  new [-n|--count N] [-b|--bytes]  Generate N identifiers (default 1)\n");
            std::fprintf(f, "                                   --bytes prints the 12 raw bytes as hex\n");
            std::fprintf(f, "  inspect <id>...                  Decode and print the fields of each id\n");
            std::fprintf(f, "  check <id>...                    Exit 0 if every id is well formed, 1 otherwise\n");
            std::fprintf(f, "  help                             Show this help\n");
            std::fprintf(f, "\n");
            std::fprintf(f, "Id format: 20 characters from [0-9a-v] (e.g., 9m4e2mr0ui3e8a215n4g)\n");
        }

        int handle_new(const RunConfig& cfg, const xid::platform::HostEnv& env, const CliArgs& args) {
            static constexpr std::array<OptionSpec, 2> kSpecs = {{
                {OptionId::Count, OptionType::I64, "count", 'n'},
                {OptionId::Bytes, OptionType::Flag, "bytes", 'b'},
            }};

            ParsedOption buf[8]{};
            ParsedOptions opts{buf, 0, 8};
            u32 consumed = 0;
            xid::core::Status s = parse_options(args, kSpecs.data(), kSpecs.size(), &opts, &consumed);
            if (!xid::core::is_ok(s)) {
                print_error(cfg, "new: invalid option (see 'xid help')");
                return kExitUsage;
            }
            if (consumed != args.argc) {
                std::fprintf(cfg.err, "error: new: unexpected argument %s\n", args.argv[consumed]);
                return kExitUsage;
            }

            i64 count = 1;
            if (const ParsedOption* o = find_option(opts, OptionId::Count)) {
                count = o->value.i64v;
            }
            if (count < 1 || count > kMaxCount) {
                std::fprintf(cfg.err, "error: new: count must be between 1 and %lld\n", static_cast<long long>(kMaxCount));
                return kExitUsage;
            }
            const bool raw = find_option(opts, OptionId::Bytes) != nullptr;

            xid::gen::GeneratorState state{};
            s = xid::gen::derive_generator_state(env, &state);
            if (!xid::core::is_ok(s)) {
                print_status_error_detailed(cfg, "generator initialization", s);
                return kExitBadInput;
            }
            xid::gen::Generator gen(state, env);

            if (!cfg.quiet) {
                std::fprintf(cfg.err, "info: machine=%02x%02x%02x pid=%u\n",
                    static_cast<unsigned>(state.machine[0]),
                    static_cast<unsigned>(state.machine[1]),
                    static_cast<unsigned>(state.machine[2]),
                    static_cast<unsigned>(state.process));
            }

            char text[xid::kEncodedLen + 1]{};
            for (i64 i = 0; i < count; ++i) {
                const xid::Xid x = gen.next();
                if (raw) {
                    const xid::Xid::Raw b = x.to_bytes();
                    print_hex(cfg.out, b.data(), b.size());
                    std::fprintf(cfg.out, "\n");
                    continue;
                }
                xid::codec::encode(x, text);
                std::fprintf(cfg.out, "%s\n", text);
            }
            return kExitOk;
        }

        int handle_inspect(const RunConfig& cfg, const CliArgs& args) {
            if (args.argc < 1) {
                print_error(cfg, "inspect: missing id");
                return kExitUsage;
            }

            int rc = kExitOk;
            u32 printed = 0;
            for (u32 i = 0; i < args.argc; ++i) {
                const char* text = args.argv[i];
                xid::Xid x;
                const xid::core::Status s = xid::codec::parse(text, &x);
                if (!xid::core::is_ok(s)) {
                    print_parse_error(cfg, text, s);
                    rc = kExitBadInput;
                    continue;
                }

                char canonical[xid::kEncodedLen + 1]{};
                xid::codec::encode(x, canonical);
                char when[64]{};
                format_utc(x.timestamp(), when, sizeof(when));
                const xid::MachineFingerprint m = x.machine_fingerprint();

                std::FILE* f = cfg.out;
                if (printed++ > 0) {
                    std::fprintf(f, "\n");
                }
                std::fprintf(f, "id:      %s\n", canonical);
                // non-canonical spellings decode to the id above
                if (std::strcmp(canonical, text) != 0) {
                    std::fprintf(f, "input:   %s\n", text);
                }
                std::fprintf(f, "bytes:   ");
                print_hex(f, x.raw().data(), x.raw().size());
                std::fprintf(f, "\n");
                std::fprintf(f, "time:    %s\n", when);
                std::fprintf(f, "unix:    %u\n", static_cast<unsigned>(x.unix_seconds()));
                std::fprintf(f, "machine: ");
                print_hex(f, m.data(), m.size());
                std::fprintf(f, "\n");
                std::fprintf(f, "pid:     %u\n", static_cast<unsigned>(x.process_fingerprint()));
                std::fprintf(f, "counter: %u\n", static_cast<unsigned>(x.counter()));
            }
            return rc;
        }

        int handle_check(const RunConfig& cfg, const CliArgs& args) {
            if (args.argc < 1) {
                print_error(cfg, "check: missing id");
                return kExitUsage;
            }

            int rc = kExitOk;
            for (u32 i = 0; i < args.argc; ++i) {
                const char* text = args.argv[i];
                if (xid::codec::is_valid_encoded(text)) {
                    continue;
                }
                rc = kExitBadInput;
                if (!cfg.quiet) {
                    std::fprintf(cfg.err, "error: check: %s is not a valid id\n", text);
                }
            }
            return rc;
        }
    } // namespace

    int run(const CliArgs& args, const xid::platform::HostEnv& env, std::FILE* out, std::FILE* err) {
        static constexpr std::array<OptionSpec, 2> kGlobalSpecs = {{
            {OptionId::Quiet, OptionType::Flag, "quiet", 'q'},
            {OptionId::Help, OptionType::Flag, "help", 'h'},
        }};
        static constexpr std::array<CommandSpec, 4> kCommands = {{
            {CommandId::Help, "help"},
            {CommandId::New, "new"},
            {CommandId::Inspect, "inspect"},
            {CommandId::Check, "check"},
        }};

        RunConfig cfg{};
        cfg.out = out;
        cfg.err = err;

        ParsedOption buf[8]{};
        ParsedOptions opts{buf, 0, 8};
        u32 consumed = 0;
        xid::core::Status s = parse_options(args, kGlobalSpecs.data(), kGlobalSpecs.size(), &opts, &consumed);
        if (!xid::core::is_ok(s)) {
            print_status_error(cfg, "option parsing", s);
            return kExitUsage;
        }

        cfg.quiet = find_option(opts, OptionId::Quiet) != nullptr;
        if (find_option(opts, OptionId::Help) != nullptr) {
            handle_help(cfg);
            return kExitOk;
        }

        const CliArgs rest{args.argv + consumed, args.argc - consumed};
        if (rest.argc == 0) {
            handle_help(cfg);
            return kExitUsage;
        }

        CommandInvocation inv{};
        s = parse_command(rest, kCommands.data(), kCommands.size(), &inv, &consumed);
        if (!xid::core::is_ok(s)) {
            std::fprintf(cfg.err, "error: unknown command %s (see 'xid help')\n", rest.argv[0]);
            return kExitUsage;
        }

        switch (inv.id) {
            case CommandId::Help:
                handle_help(cfg);
                return kExitOk;
            case CommandId::New:
                return handle_new(cfg, env, inv.args);
            case CommandId::Inspect:
                return handle_inspect(cfg, inv.args);
            case CommandId::Check:
                return handle_check(cfg, inv.args);
            case CommandId::None:
                break;
        }
        return kExitUsage;
    }
} // namespace xid::cli
