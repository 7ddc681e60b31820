//! # Formatter Core
//!
//! This file implements the output side of the HCL formatter.
//!
//! ## Functions
//!
//! | Method          | Description                                   |
//! |-----------------|-----------------------------------------------|
//! | `format()`      | Classify, align and emit a complete document  |
//! | `align()`       | Pad keys of consecutive assignment runs       |
//! | `emit_line()`   | Write indented line with newline              |
//! | `indent_str()`  | Get indentation string for a depth            |

#include "format/hcl_formatter.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace wheels::format {

HclFormatter::HclFormatter(FormatOptions options) : options_(options) {}

void HclFormatter::emit_line(size_t depth, const std::string& text) {
    if (!text.empty()) {
        output_ << indent_str(depth);
    }
    output_ << text << "\n";
}

auto HclFormatter::indent_str(size_t depth) const -> std::string {
    return std::string(depth * options_.indent_width, ' ');
}

void HclFormatter::align(std::vector<Line>& lines) const {
    size_t i = 0;
    while (i < lines.size()) {
        if (!lines[i].alignable) {
            ++i;
            continue;
        }

        // A run is a maximal sequence of alignable lines at the same depth
        size_t end = i;
        size_t width = 0;
        while (end < lines.size() && lines[end].alignable && lines[end].depth == lines[i].depth) {
            width = std::max(width, lines[end].key.size());
            ++end;
        }

        for (size_t j = i; j < end; ++j) {
            auto& line = lines[j];
            std::string key = line.key;
            if (options_.align_assignments) {
                key.append(width - key.size(), ' ');
            }
            line.text = key + " = " + line.value;
        }
        i = end;
    }
}

auto HclFormatter::format(const std::string& source) -> Result<std::string> {
    output_.str("");
    output_.clear();
    reset();

    auto classified = classify(source);
    if (is_err(classified)) {
        return unwrap_err(classified);
    }
    auto& lines = unwrap(classified);

    align(lines);

    // Blank lines: collapse runs, drop leading and trailing ones
    bool pending_blank = false;
    bool emitted_any = false;
    for (const auto& line : lines) {
        if (line.blank) {
            pending_blank = emitted_any;
            continue;
        }
        if (pending_blank) {
            emit_line(0, "");
            pending_blank = false;
        }
        if (line.verbatim) {
            output_ << line.text << "\n";
        } else {
            emit_line(line.depth, line.text);
        }
        emitted_any = true;
    }

    WHEELS_LOG_TRACE("format", "Formatted " << lines.size() << " lines");
    return output_.str();
}

auto format_hcl(const std::string& source) -> Result<std::string> {
    HclFormatter formatter;
    return formatter.format(source);
}

} // namespace wheels::format
