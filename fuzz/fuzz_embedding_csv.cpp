/**
 * @file  fuzz_embedding_csv.cpp
 * @brief libFuzzer target for the embedding CSV reader and sampler.
 *
 * Build:
 *   cmake -DCHIT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_embedding_csv
 *
 * Safety invariants verified on every input:
 *   1. No crash for arbitrary text: embedded NULs, huge exponents, CRLF.
 *   2. Every parsed row is non-empty.
 *   3. The sampler accounts for every row: selected ≤ usable,
 *      usable + dropped = supplied.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "chit/embedding_loader.hpp"
#include "chit/sampler.hpp"

using namespace chit;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);
    const auto parsed = io::EmbeddingLoader::parse_csv_string(std::string(text));

    for (const auto& row : parsed.vectors) {
        assert(!row.empty());
    }

    const sampling::EmbeddingSampler sampler;
    for (const auto mode : {AnalysisMode::Heuristic, AnalysisMode::Exact}) {
        const auto s = sampler.sample(parsed.vectors, mode);
        assert(s.source_count == parsed.vectors.size());
        assert(s.usable_count + s.dropped_count == s.source_count);
        assert(s.size() <= s.usable_count);
        assert(s.size() <= sampler.limits().cap_for(mode));
    }
    return 0;
}
