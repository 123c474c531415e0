// =============================================================================
// AeroTrace Fuzz Target - libFuzzer entry point
// =============================================================================
// Build with: cmake -DAEROTRACE_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//
// Run with: ./aerotrace_fuzz fuzz/corpus -max_len=4096 -timeout=5
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>

#include "aerotrace/aerotrace.h"
#include "aerotrace/csv_reader.h"

using namespace aerotrace;

// Global instances (initialized once)
static EMSParser* g_parser = nullptr;
static EMSParser* g_strict_parser = nullptr;
static analysis::ExceedanceDetector* g_detector = nullptr;

extern "C" int LLVMFuzzerInitialize(int* argc, char*** argv) {
    (void)argc;
    (void)argv;

    g_parser = new EMSParser();

    ParserConfig strict;
    strict.ems_type = EmsType::CGR_30P;
    strict.strict = true;
    g_strict_parser = new EMSParser(strict);

    g_detector = new analysis::ExceedanceDetector();

    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0 || size > 65536) {
        return 0;
    }

    std::string text(reinterpret_cast<const char*>(data), size);

    // Full parse with auto-detection
    {
        auto result = g_parser->parse(text);
        g_detector->analyzeAll(result.records);
        g_parser->clear();
        g_detector->clear();
    }

    // Forced type, strict mode
    {
        auto result = g_strict_parser->parse(text);
        (void)result;
        g_strict_parser->clear();
    }

    // Field helpers on the raw input
    {
        auto fields = utils::splitCsvLine(text);
        for (const auto& f : fields) {
            double value = 0.0;
            (void)utils::parseNumber(f, value);
            (void)utils::parseTimeOfDay(f, value);
            (void)utils::normalizeColumnName(f);
            (void)utils::columnUnit(f);
        }
    }

    return 0;
}
