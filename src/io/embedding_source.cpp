/// @file src/io/embedding_source.cpp
/// @brief In-memory, CSV-directory and demo embedding providers.

#include "chit/embedding_source.hpp"

#include "chit/constants.hpp"
#include "chit/embedding_loader.hpp"
#include "chit/logging.hpp"

#include <random>
#include <system_error>

namespace chit::io {

// ─── InMemoryEmbeddingSource ──────────────────────────────────────────────────

void InMemoryEmbeddingSource::put(EmbeddingSet set) {
    std::lock_guard lock(mutex_);
    auto id = set.document_id;
    sets_.insert_or_assign(std::move(id), std::move(set));
}

bool InMemoryEmbeddingSource::erase(const std::string& document_id) {
    std::lock_guard lock(mutex_);
    return sets_.erase(document_id) > 0;
}

std::optional<EmbeddingSet> InMemoryEmbeddingSource::fetch(const std::string& document_id) {
    std::lock_guard lock(mutex_);
    auto it = sets_.find(document_id);
    if (it == sets_.end()) return std::nullopt;
    return it->second;
}

// ─── CsvDirectoryEmbeddingSource ──────────────────────────────────────────────

CsvDirectoryEmbeddingSource::CsvDirectoryEmbeddingSource(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<EmbeddingSet> CsvDirectoryEmbeddingSource::fetch(const std::string& document_id) {
    // document_id is validated by the query API before it reaches here.
    const std::filesystem::path file = root_ / (document_id + ".csv");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    auto loaded = EmbeddingLoader::load_csv(file.string());
    if (!loaded) {
        log::logger()->warn("could not open embeddings file {}", file.string());
        return std::nullopt;
    }
    if (loaded->skipped_rows > 0) {
        log::logger()->debug("{}: skipped {} malformed rows", file.string(), loaded->skipped_rows);
    }
    return EmbeddingSet{document_id, std::move(loaded->vectors)};
}

// ─── DemoEmbeddingSource ──────────────────────────────────────────────────────

DemoEmbeddingSource::DemoEmbeddingSource(EmbeddingSource& inner)
    : inner_(inner)
    , demo_(make_demo_embeddings()) {}

std::optional<EmbeddingSet> DemoEmbeddingSource::fetch(const std::string& document_id) {
    if (document_id == constants::DEMO_DOCUMENT_ID) {
        return demo_;
    }
    return inner_.fetch(document_id);
}

// ─── make_demo_embeddings ─────────────────────────────────────────────────────

namespace {

/// Uniform in [-half_width, half_width) from one raw engine draw. The
/// standard fixes mt19937's output sequence but not the distributions', so
/// this keeps the demo identical across standard libraries.
double symmetric_noise(std::mt19937& rng, double half_width) {
    const double unit = static_cast<double>(rng()) / 4294967296.0;  // [0, 1)
    return half_width * (2.0 * unit - 1.0);
}

} // anonymous namespace

EmbeddingSet make_demo_embeddings(std::size_t dimension, std::uint32_t seed) {
    std::mt19937 rng(seed);

    EmbeddingSet set;
    set.document_id = std::string(constants::DEMO_DOCUMENT_ID);
    set.vectors.reserve(15);

    // Root cluster.
    for (int i = 0; i < 8; ++i) {
        RawVector v(dimension);
        for (auto& x : v) x = symmetric_noise(rng, 0.01);
        set.vectors.push_back(std::move(v));
    }

    // Branches.
    set.vectors.emplace_back(dimension, 15.0);
    set.vectors.emplace_back(dimension, -12.0);
    RawVector split(dimension, -10.0);
    for (std::size_t d = 0; d < dimension / 2; ++d) split[d] = 10.0;
    set.vectors.push_back(std::move(split));

    // Intermediate levels.
    for (int i = 0; i < 4; ++i) {
        RawVector v(dimension);
        for (auto& x : v) x = symmetric_noise(rng, 5.0);
        set.vectors.push_back(std::move(v));
    }
    return set;
}

} // namespace chit::io
