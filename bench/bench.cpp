/**
 * @file bench.cpp
 * @brief Performance benchmarks for nlzss decompression.
 *
 * Measures decompression throughput on synthetic LZSS10 and LZSS11
 * streams for regression testing during development. Use for relative
 * comparisons only.
 *
 * Usage:
 *   ./build/nlzss_bench              # Run with default 100 iterations
 *   ./build/nlzss_bench 1000         # Run with custom iteration count
 */

#include <nlzss/nlzss.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace nlzss;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::uint32_t OUTPUT_SIZE = 1U << 20; // 1 MiB per stream

/**
 * @brief Lay out a stream of @p literal_run literals followed by one
 *        back-reference of @p ref_length, repeated until OUTPUT_SIZE.
 *
 * Literals follow a fixed pseudo-random sequence so the references copy
 * non-trivial data.
 */
static std::vector<std::uint8_t> make_stream(Variant variant, std::size_t literal_run,
                                             std::uint32_t ref_length, std::uint32_t distance) {
    std::vector<std::uint8_t> stream = {static_cast<std::uint8_t>(variant), 0, 0, 0};
    for (int i = 0; i < 4; ++i) {
        stream.push_back(static_cast<std::uint8_t>(OUTPUT_SIZE >> (8 * i)));
    }

    std::uint32_t seed = 0x12345678U;
    std::size_t produced = 0;
    std::size_t flag_pos = 0;
    std::size_t bits = FLAG_BITS;
    std::size_t since_ref = 0;

    while (produced < OUTPUT_SIZE) {
        if (bits == FLAG_BITS) {
            flag_pos = stream.size();
            stream.push_back(0);
            bits = 0;
        }

        const bool use_ref = since_ref >= literal_run && produced >= distance;
        if (use_ref) {
            stream[flag_pos] = static_cast<std::uint8_t>(stream[flag_pos] | (0x80U >> bits));
            const std::uint32_t d = distance - DISTANCE_BIAS;
            if (variant == Variant::Lzss10) {
                const std::uint32_t v = ((ref_length - LZSS10_LENGTH_BIAS) << 12) | d;
                stream.push_back(static_cast<std::uint8_t>(v >> 8));
                stream.push_back(static_cast<std::uint8_t>(v));
            } else {
                const std::uint32_t l = ref_length - LZSS11_EXTENDED_BIAS;
                stream.push_back(static_cast<std::uint8_t>(l >> 4));
                stream.push_back(static_cast<std::uint8_t>(((l & 0x0FU) << 4) | (d >> 8)));
                stream.push_back(static_cast<std::uint8_t>(d));
            }
            produced += ref_length;
            since_ref = 0;
        } else {
            seed = seed * 1103515245U + 12345U;
            stream.push_back(static_cast<std::uint8_t>(seed >> 24));
            ++produced;
            ++since_ref;
        }
        ++bits;
    }

    return stream;
}

static void bench_decompress(const char* name, const std::vector<std::uint8_t>& stream,
                             int iterations) {
    std::vector<std::uint8_t> output;

    // Warmup run
    Error status = decompress(stream.data(), stream.size(), output);
    if (status != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(status));
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (decompress(stream.data(), stream.size(), output) != Error::Ok) {
            std::printf("%-20s FAIL (iteration %d)\n", name, i);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    double per_iter_ms = elapsed_ms / iterations;
    double mb_per_s = (static_cast<double>(output.size()) / (1024.0 * 1024.0)) /
                      (per_iter_ms / 1000.0);
    double ratio = static_cast<double>(output.size()) / static_cast<double>(stream.size());

    std::printf("%-20s %8.3f ms/iter  %8.1f MB/s  (ratio %.2fx)\n", name, per_iter_ms,
                mb_per_s, ratio);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iteration count must be positive\n");
            return 1;
        }
    }

    std::printf("nlzss %s decompression benchmark\n", version());
    std::printf("Iterations: %d, output: %u bytes per stream\n\n", iterations, OUTPUT_SIZE);

    bench_decompress("lzss10-literals", make_stream(Variant::Lzss10, OUTPUT_SIZE, 3, 1),
                     iterations);
    bench_decompress("lzss10-mixed", make_stream(Variant::Lzss10, 4, 18, 64), iterations);
    bench_decompress("lzss10-runs", make_stream(Variant::Lzss10, 1, 18, 1), iterations);
    bench_decompress("lzss11-mixed", make_stream(Variant::Lzss11, 4, 64, 256), iterations);
    bench_decompress("lzss11-runs", make_stream(Variant::Lzss11, 1, 272, 1), iterations);

    return 0;
}
