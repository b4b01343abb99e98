/**
 * @file bench_transfer_encoding.cpp
 * @brief Benchmarks for content hashing, multipart encoding and payload encoding
 */

#include <benchmark/benchmark.h>

#include <kcenon/package_client/core/content_hasher.h>
#include <kcenon/package_client/core/encoding.h>
#include <kcenon/package_client/core/multipart_encoder.h>

#include <array>
#include <cstddef>
#include <random>
#include <span>
#include <sstream>
#include <string>

namespace kcenon::package_client::benchmark {

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
}  // namespace sizes

namespace {

auto make_random_data(std::size_t size, uint32_t seed) -> std::string {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);

    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>(dist(gen));
    }
    return data;
}

auto staging_fields() -> form_fields {
    return {
        {"key", "uploads/owner/pkg/1.0/pkg-1.0.tar.bz2"},
        {"acl", "private"},
        {"success_action_status", "201"},
        {"policy", std::string(512, 'p')},
        {"signature", std::string(28, 's')},
    };
}

}  // namespace

/**
 * @brief MD5 of a stream with various read chunk sizes
 */
static void BM_ContentHasher_Stream(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto data = make_random_data(data_size, 42);
    content_hasher hasher(chunk_size);

    for (auto _ : state) {
        std::istringstream stream(data);
        auto result = hasher.hash(stream);
        if (!result) {
            state.SkipWithError("Failed to hash stream");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief MD5 of an in-memory buffer
 */
static void BM_ContentHasher_Buffer(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = make_random_data(data_size, 7);
    auto bytes = std::as_bytes(std::span<const char>(data.data(), data.size()));

    for (auto _ : state) {
        auto result = content_hasher::hash(bytes);
        if (!result) {
            state.SkipWithError("Failed to hash buffer");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Drain a multipart body the way a transport pulls it
 */
static void BM_MultipartEncoder_Drain(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = make_random_data(data_size, 99);
    auto fields = staging_fields();

    std::array<std::byte, 64 * sizes::KB> buffer{};
    uint64_t total = 0;

    for (auto _ : state) {
        std::istringstream stream(data);
        auto encoded = multipart_encoder::encode(
            fields, {file_part{"file", "pkg-1.0.tar.bz2", &stream, data_size}});
        if (!encoded) {
            state.SkipWithError("Failed to encode form");
            return;
        }

        auto& body = *encoded.value().body;
        total = encoded.value().content_length;
        for (;;) {
            auto n = body.read(buffer);
            if (!n) {
                state.SkipWithError("Failed to read body");
                return;
            }
            if (n.value() == 0) {
                break;
            }
            ::benchmark::DoNotOptimize(buffer.data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Base64 of request payloads
 */
static void BM_Base64_Encode(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = make_random_data(data_size, 3);

    for (auto _ : state) {
        auto encoded = encoding::base64_encode(data);
        ::benchmark::DoNotOptimize(encoded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_Base64_Decode(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto encoded = encoding::base64_encode(make_random_data(data_size, 5));

    for (auto _ : state) {
        auto decoded = encoding::base64_decode(encoded);
        ::benchmark::DoNotOptimize(decoded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(encoded.size()) *
                           static_cast<int64_t>(state.iterations()));
}

// Content hasher benchmarks
BENCHMARK(BM_ContentHasher_Stream)
    ->Args({static_cast<int64_t>(1 * sizes::MB), static_cast<int64_t>(4 * sizes::KB)})
    ->Args({static_cast<int64_t>(1 * sizes::MB), static_cast<int64_t>(256 * sizes::KB)})
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(256 * sizes::KB)})
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(4 * sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ContentHasher_Buffer)
    ->Arg(static_cast<int64_t>(1 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

// Multipart benchmarks
BENCHMARK(BM_MultipartEncoder_Drain)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(16 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

// Payload encoding benchmarks
BENCHMARK(BM_Base64_Encode)
    ->Arg(static_cast<int64_t>(256))
    ->Arg(static_cast<int64_t>(4 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Base64_Decode)
    ->Arg(static_cast<int64_t>(256))
    ->Arg(static_cast<int64_t>(4 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::package_client::benchmark
