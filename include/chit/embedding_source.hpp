#pragma once

/// @file include/chit/embedding_source.hpp
/// @brief Providers of per-document embeddings.
///
/// The geometry service does not own embeddings: the ingestion pipeline /
/// vector store does. `EmbeddingSource` is the seam to it. Two concrete
/// providers ship with the service; a third decorates either one with the
/// built-in `demo` document.

#include "chit/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chit::io {

class EmbeddingSource {
public:
    virtual ~EmbeddingSource() = default;

    /// Embeddings for `document_id`, or nullopt if the document is unknown.
    [[nodiscard]] virtual std::optional<EmbeddingSet>
    fetch(const std::string& document_id) = 0;
};

// ─── InMemoryEmbeddingSource ──────────────────────────────────────────────────

/// Thread-safe map of document id → embeddings.
class InMemoryEmbeddingSource final : public EmbeddingSource {
public:
    /// Insert or replace `set` under `set.document_id`.
    void put(EmbeddingSet set);

    bool erase(const std::string& document_id);

    [[nodiscard]] std::optional<EmbeddingSet>
    fetch(const std::string& document_id) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, EmbeddingSet> sets_;
};

// ─── CsvDirectoryEmbeddingSource ──────────────────────────────────────────────

/// Reads `<root>/<document_id>.csv` on every fetch.
class CsvDirectoryEmbeddingSource final : public EmbeddingSource {
public:
    explicit CsvDirectoryEmbeddingSource(std::filesystem::path root);

    [[nodiscard]] std::optional<EmbeddingSet>
    fetch(const std::string& document_id) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

// ─── DemoEmbeddingSource ──────────────────────────────────────────────────────

/// Serves the synthetic `demo` document and forwards every other id to
/// `inner`.
class DemoEmbeddingSource final : public EmbeddingSource {
public:
    explicit DemoEmbeddingSource(EmbeddingSource& inner);

    [[nodiscard]] std::optional<EmbeddingSet>
    fetch(const std::string& document_id) override;

private:
    EmbeddingSource& inner_;
    EmbeddingSet     demo_;
};

/// Synthetic tree-like cloud: 8 points in a tight cluster at the origin
/// (uniform ±0.01), three far branches (+15·1, −12·1, ±10 split halves) and
/// four intermediate points (uniform ±5). Noise comes straight from
/// std::mt19937 output, so a seed gives the same cloud on every platform.
[[nodiscard]] EmbeddingSet make_demo_embeddings(std::size_t dimension = 64,
                                                std::uint32_t seed = 42);

} // namespace chit::io
