#include <string>

#include <benchmark/benchmark.h>

#include "xid/codec/base32.hpp"

static void BM_Encode(benchmark::State& state){
    const xid::Xid x = xid::Xid::compose(1300816219u, {0x60, 0xf4, 0x86}, 0xe428, 4271561u);
    char buf[xid::kEncodedLen];
    for (auto _ : state){
        xid::codec::encode(x, buf);
        benchmark::DoNotOptimize(buf);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * xid::kRawLen);
}

BENCHMARK(BM_Encode);

static void BM_ToString(benchmark::State& state){
    const xid::Xid x = xid::Xid::compose(1300816219u, {0x60, 0xf4, 0x86}, 0xe428, 4271561u);
    for (auto _ : state){
        std::string s = x.to_string();
        benchmark::DoNotOptimize(s);
    }
}

BENCHMARK(BM_ToString);

static void BM_Parse(benchmark::State& state){
    for (auto _ : state){
        xid::Xid x;
        xid::core::Status s = xid::codec::parse("9m4e2mr0ui3e8a215n4g", &x);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(x);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * xid::kEncodedLen);
}

BENCHMARK(BM_Parse);

static void BM_ParseRejectsLastChar(benchmark::State& state){
    for (auto _ : state){
        xid::Xid x;
        bool ok = xid::codec::try_parse("9m4e2mr0ui3e8a215n4Z", &x);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(x);
    }
}

BENCHMARK(BM_ParseRejectsLastChar);

static void BM_Hash(benchmark::State& state){
    const xid::Xid x = xid::Xid::compose(1300816219u, {0x60, 0xf4, 0x86}, 0xe428, 4271561u);
    for (auto _ : state){
        xid::u32 h = x.hash();
        benchmark::DoNotOptimize(h);
    }
}

BENCHMARK(BM_Hash);

static void BM_Compare(benchmark::State& state){
    const xid::Xid a = xid::Xid::compose(1300816219u, {0x60, 0xf4, 0x86}, 0xe428, 4271561u);
    const xid::Xid b = xid::Xid::compose(1300816219u, {0x60, 0xf4, 0x86}, 0xe428, 4271562u);
    for (auto _ : state){
        int c = xid::compare(a, b);
        benchmark::DoNotOptimize(c);
    }
}

BENCHMARK(BM_Compare);
