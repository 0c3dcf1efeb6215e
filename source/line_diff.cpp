// line_diff.cpp - LCS line differ

#include <semdiff/line_diff.h>

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <cstdint>

namespace semdiff {

namespace {

/// Collects the edit script, holding back one changed block at a time so
/// its deletions can be emitted before its insertions.
class BlockWriter {
public:
    explicit BlockWriter(DiffResult& out) : out_(out) {}

    void unchanged(const std::string& text) {
        flush();
        out_.push_back(DiffLine{DiffLineType::Unchanged, text});
    }

    void deleted(const std::string& text) { deleted_.push_back(&text); }
    void inserted(const std::string& text) { inserted_.push_back(&text); }

    void flush() {
        for (const auto* line : deleted_) {
            out_.push_back(DiffLine{DiffLineType::Deleted, *line});
        }
        for (const auto* line : inserted_) {
            out_.push_back(DiffLine{DiffLineType::Inserted, *line});
        }
        deleted_.clear();
        inserted_.clear();
    }

private:
    DiffResult& out_;
    std::vector<const std::string*> deleted_;
    std::vector<const std::string*> inserted_;
};

std::vector<std::string> comparison_keys(const std::vector<std::string>& lines, bool ignore_whitespace)
{
    if (!ignore_whitespace) return lines;

    std::vector<std::string> keys;
    keys.reserve(lines.size());
    for (const auto& line : lines) {
        keys.push_back(boost::algorithm::trim_copy(line));
    }
    return keys;
}

} // anonymous namespace

std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    if (text.empty()) return lines;

    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        // No phantom line after a terminating newline
        if (end == text.size() && line.empty() && start == text.size()) break;

        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

DiffResult diff_lines(std::string_view expected_text,
                      std::string_view actual_text,
                      const LineDiffOptions& options)
{
    const auto old_lines = split_lines(expected_text);
    const auto new_lines = split_lines(actual_text);
    const auto old_keys = comparison_keys(old_lines, options.ignore_whitespace);
    const auto new_keys = comparison_keys(new_lines, options.ignore_whitespace);

    DiffResult result;
    result.reserve(std::max(old_lines.size(), new_lines.size()));
    BlockWriter writer(result);

    // Common prefix and suffix never take part in the LCS table
    std::size_t prefix = 0;
    while (prefix < old_keys.size() && prefix < new_keys.size() &&
           old_keys[prefix] == new_keys[prefix]) {
        ++prefix;
    }

    std::size_t suffix = 0;
    while (suffix < old_keys.size() - prefix && suffix < new_keys.size() - prefix &&
           old_keys[old_keys.size() - 1 - suffix] == new_keys[new_keys.size() - 1 - suffix]) {
        ++suffix;
    }

    for (std::size_t i = 0; i < prefix; ++i) {
        writer.unchanged(new_lines[i]);
    }

    const std::size_t n = old_keys.size() - prefix - suffix;
    const std::size_t m = new_keys.size() - prefix - suffix;

    // lcs[i][j] = LCS length of old[i..n) and new[j..m), row-major (m + 1) wide
    std::vector<std::uint32_t> lcs((n + 1) * (m + 1), 0);
    auto cell = [&](std::size_t i, std::size_t j) -> std::uint32_t& { return lcs[i * (m + 1) + j]; };

    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            if (old_keys[prefix + i] == new_keys[prefix + j]) {
                cell(i, j) = cell(i + 1, j + 1) + 1;
            } else {
                cell(i, j) = std::max(cell(i + 1, j), cell(i, j + 1));
            }
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n && j < m) {
        if (old_keys[prefix + i] == new_keys[prefix + j]) {
            writer.unchanged(new_lines[prefix + j]);
            ++i;
            ++j;
        } else if (cell(i + 1, j) >= cell(i, j + 1)) {
            writer.deleted(old_lines[prefix + i]);
            ++i;
        } else {
            writer.inserted(new_lines[prefix + j]);
            ++j;
        }
    }
    for (; i < n; ++i) writer.deleted(old_lines[prefix + i]);
    for (; j < m; ++j) writer.inserted(new_lines[prefix + j]);

    for (std::size_t k = new_lines.size() - suffix; k < new_lines.size(); ++k) {
        writer.unchanged(new_lines[k]);
    }
    writer.flush();

    return result;
}

bool has_changes(const DiffResult& lines) noexcept
{
    return std::any_of(lines.begin(), lines.end(), [](const DiffLine& line) {
        return line.type != DiffLineType::Unchanged;
    });
}

std::string format_diff(const DiffResult& lines)
{
    if (!has_changes(lines)) return {};

    std::string out;
    for (const auto& line : lines) {
        switch (line.type) {
            case DiffLineType::Inserted:  out += '+'; break;
            case DiffLineType::Deleted:   out += '-'; break;
            case DiffLineType::Unchanged: out += ' '; break;
        }
        out += line.text;
        out += '\n';
    }
    return out;
}

} // namespace semdiff
