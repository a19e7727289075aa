#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>

#include "sloup/storage/hashing.hpp"

static void BM_Md5Compute(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::vector<sloup::storage::u8> buf(n);
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<sloup::storage::u8>(i & 0xffu);
    }

    for (auto _ : state){
        sloup::storage::Md5Digest out{};
        sloup::core::Status s = sloup::storage::md5_compute({buf.data(), n}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_Md5Compute)->Arg(0)->Arg(64)->Arg(4096)->Arg(1 << 20);

// Segment-sized input fed in copy-chunk pieces, the way a worker hashes.
static void BM_Md5Chunked(benchmark::State& state){
    const size_t chunk = static_cast<size_t>(state.range(0));
    const size_t total = 8u << 20;
    std::vector<sloup::storage::u8> buf(chunk, 0x5a);

    for (auto _ : state){
        sloup::storage::Md5Hasher h;
        sloup::core::Status s = h.init();
        for (size_t done = 0; done < total && sloup::core::is_ok(s); done += chunk){
            s = h.update({buf.data(), chunk});
        }
        sloup::storage::Md5Digest out{};
        s = h.finalize(&out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}

BENCHMARK(BM_Md5Chunked)->Arg(64 << 10)->Arg(1 << 20);
