/**
 * @file  fuzz_packet_json.cpp
 * @brief libFuzzer target for request-body parsing and packet normalisation.
 *
 * Build:
 *   cmake -DCHIT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_packet_json
 *
 * Safety invariants verified on every input:
 *   1. parse_json / packet_from_json never throw for arbitrary bytes.
 *   2. An accepted packet is normalised: k ∈ [-5, 5], ε ∈ [0, 1],
 *      surface derived from k, segments fixed.
 *   3. Encoding an accepted packet and decoding it again yields the same
 *      packet (normalisation is idempotent).
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "chit/json_codec.hpp"

using namespace chit;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);

    const auto root = io::parse_json(text);
    if (!root) return 0;

    const auto packet = io::packet_from_json(*root);
    if (!packet) return 0;

    // ── Invariant 2: normalised ───────────────────────────────────────────────
    assert(std::isfinite(packet->curvature_k));
    assert(packet->curvature_k >= -5.0 && packet->curvature_k <= 5.0);
    assert(packet->epsilon >= 0.0 && packet->epsilon <= 1.0);
    assert(packet->surface_fn ==
           render::ChitConfigGenerator::surface_for(
               render::ChitConfigGenerator::classification_for(packet->curvature_k)));

    // ── Invariant 3: stable under re-encoding ─────────────────────────────────
    const auto again = io::packet_from_json(io::to_json(*packet));
    assert(again.has_value());
    assert(again->curvature_k == packet->curvature_k);
    assert(again->surface_fn == packet->surface_fn);

    (void)render::decode_packet(*packet);
    return 0;
}
