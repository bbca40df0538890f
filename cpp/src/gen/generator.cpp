#include "xid/gen/generator.hpp"

#include <new>
#include <string>

#include "xid/gen/fingerprint.hpp"

namespace xid::gen {
    namespace {
        // Used when the CSPRNG is unavailable: the counter starts at zero and the
        // machine fingerprint is left zero if the host name cannot be hashed.
        [[nodiscard]] GeneratorState fallback_state(const xid::platform::HostEnv& env) noexcept {
            GeneratorState st{};
            st.process = process_fingerprint(env.process_id());

            MachineFingerprint m{};
            try {
                const std::string name = xid::platform::resolve_host_name(env);
                if (xid::core::is_ok(machine_fingerprint_from_name(name, &m))) {
                    st.machine = m;
                }
            } catch (const std::bad_alloc&) {
                st.machine = MachineFingerprint{};
            }
            return st;
        }
    } // namespace

    xid::core::Status derive_generator_state(const xid::platform::HostEnv& env, GeneratorState* out) {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::NullInput);
        }

        GeneratorState st{};
        xid::core::Status s = derive_machine_fingerprint(env, &st.machine);
        if (!xid::core::is_ok(s)) {
            return s;
        }
        st.process = process_fingerprint(env.process_id());
        s = random_below(kCounterSeedBound, &st.counter_seed);
        if (!xid::core::is_ok(s)) {
            return s;
        }

        *out = st;
        return xid::core::ok_status();
    }

    Generator::Generator(const GeneratorState& state, const xid::platform::HostEnv& clock) noexcept
        : clock_(clock),
          machine_(state.machine),
          process_(state.process),
          counter_(state.counter_seed & kCounterMask) {}

    Xid Generator::next() noexcept {
        return next_at(unix_seconds_u32(clock_.now()));
    }

    Xid Generator::next_at(u32 unix_seconds) noexcept {
        const u32 c = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
        return Xid::compose(unix_seconds, machine_, process_, c & kCounterMask);
    }

    u32 unix_seconds_u32(std::chrono::system_clock::time_point tp) noexcept {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        return static_cast<u32>(secs);
    }

    Generator& default_generator() noexcept {
        static Generator g([] {
            const xid::platform::HostEnv& env = xid::platform::system_host_env();
            GeneratorState st{};
            try {
                if (xid::core::is_ok(derive_generator_state(env, &st))) {
                    return st;
                }
            } catch (const std::bad_alloc&) {
                // fall through to the degraded state
            }
            return fallback_state(env);
        }());
        return g;
    }
} // namespace xid::gen

namespace xid {
    Xid generate() noexcept {
        return xid::gen::default_generator().next();
    }
} // namespace xid
