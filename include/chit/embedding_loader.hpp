#pragma once

/// @file include/chit/embedding_loader.hpp
/// @brief CSV loader for embedding matrices.
///
/// # Module: EmbeddingLoader
///
/// ## Responsibility
/// Parse CSV files holding one embedding per row into `RawVector`s.
/// Rows with non-numeric tokens are skipped and counted; the loader never
/// crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// # optional comment lines
/// d0,d1,d2,d3          <- optional header, skipped if not numeric
/// 0.12,-0.40,1.03,0.00
/// 0.11,-0.38,0.97,0.02
/// ```
/// `nan` / `inf` tokens are numeric: such rows are kept so the sampler can
/// count them as dropped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only if the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Row order is preserved

#include "chit/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chit::io {

struct LoadResult {
    std::vector<RawVector> vectors;
    std::size_t            skipped_rows = 0;  ///< non-numeric rows (header excluded)
};

class EmbeddingLoader {
public:
    /// Load embeddings from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty result if the file has no numeric rows
    [[nodiscard]] static std::optional<LoadResult>
    load_csv(const std::string& filepath) noexcept;

    /// Parse embeddings from CSV text (same format as `load_csv`).
    [[nodiscard]] static LoadResult
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse one data row. Returns `nullopt` for blank, comment or
    /// non-numeric rows.
    [[nodiscard]] static std::optional<RawVector>
    parse_row(std::string_view line) noexcept;
};

} // namespace chit::io
