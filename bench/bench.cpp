/**
 * @file bench.cpp
 * @brief Performance benchmarks for PESEL parsing and generation.
 *
 * Measures throughput for regression testing during development.
 *
 * Usage:
 *   ./build/bench              # Run with default 100000 iterations
 *   ./build/bench 1000000      # Run with custom iteration count
 */

#include <pesel/peselcodec.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace pesel;

static constexpr int DEFAULT_ITERATIONS = 100000;

// Sink to keep the optimizer from discarding the measured calls
static volatile int g_sink = 0;

static void report(const char* name, double total_us, int iterations) {
    double per_op_ns = total_us * 1000.0 / static_cast<double>(iterations);
    double ops_per_sec = static_cast<double>(iterations) * 1.0e6 / total_us;
    std::printf("%-20s %8.1f ns/op  %12.0f ops/s\n", name, per_op_ns, ops_per_sec);
}

static void bench_parse(const char* name, const std::vector<std::string>& inputs,
                        int iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        auto result = parse(inputs[static_cast<std::size_t>(i) % inputs.size()]);
        g_sink = g_sink + static_cast<int>(result.error());
    }

    auto end = std::chrono::high_resolution_clock::now();
    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations);
}

static void bench_generate(int iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        int year = MIN_YEAR + i % (MAX_YEAR - MIN_YEAR + 1);
        int month = 1 + i % 12;
        int day = 1 + i % 28;
        auto result = generate(year, month, day, (i & 1) ? Sex::Male : Sex::Female, i % 1000);
        g_sink = g_sink + result->check_digit();
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("generate", std::chrono::duration<double, std::micro>(end - start).count(),
           iterations);
}

static void bench_generate_random(int iterations) {
    std::mt19937 rng(12345U);

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        auto result = generate_random(1980, 5, 26, Sex::Female, rng);
        g_sink = g_sink + result->check_digit();
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("generate_random", std::chrono::duration<double, std::micro>(end - start).count(),
           iterations);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("PESEL Benchmarks (C++ Implementation)\n");
    std::printf("=====================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::vector<std::string> valid;
    for (int year = MIN_YEAR; year <= MAX_YEAR; year += 7) {
        valid.push_back(generate(year, 1 + year % 12, 1 + year % 28, Sex::Male)->to_string());
    }

    std::vector<std::string> invalid = {
        "44051401459", // checksum
        "4405140145a", // non-digit
        "44953201458", // month
        "4405140145",  // length
    };

    std::printf("Parsing:\n");
    bench_parse("parse (valid)", valid, iterations);
    bench_parse("parse (invalid)", invalid, iterations);

    std::printf("\nGeneration:\n");
    bench_generate(iterations);
    bench_generate_random(iterations);

    return 0;
}
