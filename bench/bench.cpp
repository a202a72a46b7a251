/**
 * @file bench.cpp
 * @brief Decode throughput benchmark.
 *
 * Decodes LERC blobs repeatedly for regression testing during development.
 *
 * Usage:
 *   ./build/lercdec_bench                      # fixture directory, 100 iterations
 *   ./build/lercdec_bench 500                  # custom iteration count
 *   ./build/lercdec_bench 500 a.lerc2 b.lerc2  # explicit files
 */

#include <lercdec/lercdec.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace lercdec;

static constexpr int DEFAULT_ITERATIONS = 100;

static const char* const FIXTURES[] = {
    "u8_gradient_128x128", "u8_smooth_256x256",   "i16_pattern_80x80",
    "f32_lossless_64x64",  "f32_lossy_100x100",   "f64_lossy_80x80",
    "u8_mask_64x64",       "u8_rgb_64x64",        "u8_large_512x512",
    "f32_terrain_400x400", "ref_bluemarble_256x256x3_u8", "ref_california_400x400_f32",
};

static bool load_file(const std::string& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        return false;
    }

    return true;
}

static void bench_decode(const std::string& name, const std::string& path, int iterations) {
    std::vector<std::uint8_t> blob;

    if (!load_file(path, blob)) {
        std::printf("%-28s SKIP (file not found)\n", name.c_str());
        return;
    }

    DecodedData result;
    Error status = decode(blob.data(), blob.size(), result);
    if (status != Error::Ok) {
        std::printf("%-28s FAIL (%s)\n", name.c_str(), error_string(status));
        return;
    }

    const LercInfo& info = result.info;
    const double megapixels = static_cast<double>(info.n_rows) *
                              static_cast<double>(info.n_cols) *
                              static_cast<double>(info.n_bands) / 1.0e6;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        status = decode(blob.data(), blob.size(), result);
        if (status != Error::Ok) {
            std::printf("%-28s FAIL (%s)\n", name.c_str(), error_string(status));
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double mpix_per_s = megapixels / (per_iter_us / 1.0e6);

    std::printf("%-28s %10.2f µs/iter  %8.1f MPix/s  (%dx%dx%d, %d band%s, v%d)\n",
                name.c_str(), per_iter_us, mpix_per_s, info.n_cols, info.n_rows, info.n_depth,
                info.n_bands, info.n_bands == 1 ? "" : "s", info.version);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("LERC Decode Benchmarks (lercdec %d.%d.%d)\n", VERSION_MAJOR, VERSION_MINOR,
                VERSION_PATCH);
    std::printf("=========================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-28s %16s  %14s  %s\n", "Blob", "Time", "Throughput", "Layout");
    std::printf("%-28s %16s  %14s  %s\n", "----", "----", "----------", "------");

    if (argc >= 3) {
        for (int i = 2; i < argc; ++i) {
            bench_decode(argv[i], argv[i], iterations);
        }
        return 0;
    }

    const char* env_dir = std::getenv("LERC_TEST_DATA_DIR");
    const std::string base_path = std::string(env_dir != nullptr ? env_dir : "../test_data") + "/";

    for (const char* name : FIXTURES) {
        bench_decode(name, base_path + name + ".lerc2", iterations);
    }

    std::printf("\nNote: results depend on host and build type.\n");
    std::printf("Use them for relative comparisons only.\n");

    return 0;
}
