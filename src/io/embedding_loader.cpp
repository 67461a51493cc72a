/// @file src/io/embedding_loader.cpp
/// @brief CSV EmbeddingLoader.

#include "chit/embedding_loader.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace chit::io {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ─── EmbeddingLoader::parse_row ───────────────────────────────────────────────

std::optional<RawVector> EmbeddingLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    RawVector row;
    std::size_t start = 0;
    while (start <= line.size()) {
        const auto comma = line.find(',', start);
        const auto end   = comma == std::string_view::npos ? line.size() : comma;
        std::string_view token = trim(line.substr(start, end - start));
        if (token.empty()) {
            return std::nullopt;  // empty token
        }
        if (token.front() == '+') token.remove_prefix(1);

        double val = 0.0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), val);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            return std::nullopt;  // not a number, or trailing garbage
        }
        row.push_back(val);

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return row;
}

// ─── EmbeddingLoader::parse_csv_string ────────────────────────────────────────

LoadResult EmbeddingLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadResult result;
    std::istringstream stream(csv_content);
    std::string line;
    bool first_content_line = true;

    while (std::getline(stream, line)) {
        const std::string_view view = trim(line);
        if (view.empty() || view.front() == '#') {
            continue;
        }

        auto row = parse_row(view);
        if (first_content_line) {
            first_content_line = false;
            if (!row) continue;  // header
        }

        if (row) {
            result.vectors.push_back(std::move(*row));
        } else {
            ++result.skipped_rows;
        }
    }
    return result;
}

// ─── EmbeddingLoader::load_csv ────────────────────────────────────────────────

std::optional<LoadResult> EmbeddingLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace chit::io
