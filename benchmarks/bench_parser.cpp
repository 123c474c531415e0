// =============================================================================
// AeroTrace Performance Benchmarks
// =============================================================================
// Parsing, analysis and output throughput for engine monitor logs
// using Google Benchmark.
//
// Run with: ./aerotrace_benchmarks --benchmark_format=console
// =============================================================================

#include <benchmark/benchmark.h>
#include "aerotrace/parser.h"
#include "aerotrace/csv_reader.h"
#include "aerotrace/exceedance_detector.h"
#include "aerotrace/standard_writer.h"
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace aerotrace;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

// CGR-30P export with `rows` one-second samples of a 6-cylinder engine
std::string createLog(int rows, bool celsius = false) {
    std::ostringstream log;
    log << "CGR-30P\n"
        << "Aircraft ID: N123BM\n"
        << "Serial Number: 30P-BENCH\n"
        << "DATE,TIME,RPM,MAP";
    for (int c = 1; c <= 6; c++) log << ",EGT" << c;
    for (int c = 1; c <= 6; c++) log << ",CHT" << c << (celsius ? " (C)" : "");
    log << ",OIL P,OIL T,FUEL P,VOLTS,AMPS\n";

    for (int i = 0; i < rows; i++) {
        int t = 8 * 3600 + i;
        log << "06/01/2024," << t / 3600 << ":" << (t / 60) % 60 << ":" << t % 60
            << "," << 2400 + i % 20 << ",24." << i % 10;
        for (int c = 1; c <= 6; c++) log << "," << 1280 + c * 7 + i % 11;
        for (int c = 1; c <= 6; c++) log << "," << (celsius ? 170 : 340) + c * 3 + i % 5;
        log << ",62,185,24.5,14.1,12\n";
    }
    return log.str();
}

// Random text for rejection benchmarks
std::string createRandomText(size_t size, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);

    std::string text(size, '\0');
    for (auto& c : text) {
        c = static_cast<char>(dist(rng));
    }
    return text;
}

}  // namespace

// =============================================================================
// Field Reader Benchmarks
// =============================================================================

static void BM_SplitCsvLine(benchmark::State& state) {
    const std::string line =
        "06/01/2024,08:00:00,2410,24.8,1300,1310,1305,1298,1320,1301,"
        "350,352,348,361,355,349,62,185,24.5,14.1,12";

    for (auto _ : state) {
        auto fields = utils::splitCsvLine(line);
        benchmark::DoNotOptimize(fields);
    }

    state.SetBytesProcessed(state.iterations() * line.size());
}
BENCHMARK(BM_SplitCsvLine);

static void BM_ParseNumber(benchmark::State& state) {
    double value = 0.0;
    for (auto _ : state) {
        bool ok = utils::parseNumber("1312.5", value);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_ParseNumber);

// =============================================================================
// Parser Benchmarks
// =============================================================================

static void BM_Detect(benchmark::State& state) {
    EMSParser parser;
    auto log = createLog(10);

    for (auto _ : state) {
        auto type = parser.detect(log);
        benchmark::DoNotOptimize(type);
    }
}
BENCHMARK(BM_Detect);

static void BM_ParseLog(benchmark::State& state) {
    const int rows = static_cast<int>(state.range(0));
    EMSParser parser;
    auto log = createLog(rows);

    for (auto _ : state) {
        auto result = parser.parse(log);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * rows);
    state.SetBytesProcessed(state.iterations() * log.size());
}
BENCHMARK(BM_ParseLog)->Arg(60)->Arg(600)->Arg(3600);

static void BM_ParseLog_Celsius(benchmark::State& state) {
    EMSParser parser;
    auto log = createLog(600, true);

    for (auto _ : state) {
        auto result = parser.parse(log);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * 600);
}
BENCHMARK(BM_ParseLog_Celsius);

static void BM_ParseLog_Streaming(benchmark::State& state) {
    ParserConfig config;
    config.keep_records = false;

    EMSParser parser(config);
    size_t seen = 0;
    parser.setOnRecord([&seen](const EngineRecord&) { seen++; });

    auto log = createLog(600);

    for (auto _ : state) {
        auto result = parser.parse(log);
        benchmark::DoNotOptimize(result);
    }
    benchmark::DoNotOptimize(seen);

    state.SetItemsProcessed(state.iterations() * 600);
}
BENCHMARK(BM_ParseLog_Streaming);

// =============================================================================
// Rejection Benchmarks
// =============================================================================

static void BM_RejectEmpty(benchmark::State& state) {
    EMSParser parser;
    const std::string empty;

    for (auto _ : state) {
        auto result = parser.parse(empty);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RejectEmpty);

static void BM_RejectRandom(benchmark::State& state) {
    EMSParser parser;
    auto random = createRandomText(4096);

    for (auto _ : state) {
        auto result = parser.parse(random);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RejectRandom);

// =============================================================================
// Analysis and Output Benchmarks
// =============================================================================

static void BM_AnalyzeAll(benchmark::State& state) {
    EMSParser parser;
    auto result = parser.parse(createLog(3600));

    for (auto _ : state) {
        analysis::ExceedanceDetector detector;
        auto found = detector.analyzeAll(result.records);
        benchmark::DoNotOptimize(found);
    }

    state.SetItemsProcessed(state.iterations() * result.records.size());
}
BENCHMARK(BM_AnalyzeAll);

static void BM_WriteStandard(benchmark::State& state) {
    EMSParser parser;
    auto result = parser.parse(createLog(3600));
    output::StandardWriter writer;

    for (auto _ : state) {
        std::ostringstream out;
        writer.write(result.records, out);
        auto text = out.str();
        benchmark::DoNotOptimize(text);
    }

    state.SetItemsProcessed(state.iterations() * result.records.size());
}
BENCHMARK(BM_WriteStandard);

// =============================================================================
// Main
// =============================================================================

BENCHMARK_MAIN();
