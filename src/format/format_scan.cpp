//! # Formatter Line Scanner
//!
//! Splits the input into lines and classifies each one: nesting depth,
//! leading closers, the top-level assignment `=` and heredoc openers.
//!
//! The scanner keeps a bracket stack across lines. Inside a line it tracks a
//! small mode stack so that braces inside `"${...}"` interpolations, including
//! quoted strings nested in them, never count as structure.
//!
//! `bracket_depths()` exposes the per-line nesting without formatting, so
//! callers that locate blocks in a file agree with the formatter on where
//! comments, heredocs and strings begin and end.

#include "format/hcl_formatter.hpp"

#include <algorithm>
#include <cctype>

namespace wheels::format {

namespace {

auto trim(const std::string& s) -> std::string {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

auto split_lines(const std::string& source) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= source.size()) {
        size_t nl = source.find('\n', pos);
        if (nl == std::string::npos) {
            lines.push_back(source.substr(pos));
            break;
        }
        lines.push_back(source.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto line_error(const std::string& what, size_t line_no) -> Error {
    return Error(what + " at line " + std::to_string(line_no));
}

enum class Mode { Code, String, Interp };

} // namespace

auto HclFormatter::scan(const std::string& text, size_t line_no) -> Result<Scan> {
    Scan result;

    std::vector<Mode> modes{Mode::Code};
    std::vector<int> interp_braces;
    bool seen_token = false;
    size_t opened_here = 0;

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        char c = text[i];
        char next = i + 1 < n ? text[i + 1] : '\0';

        if (in_block_comment_) {
            if (c == '*' && next == '/') {
                in_block_comment_ = false;
                i += 2;
                continue;
            }
            ++i;
            continue;
        }

        Mode mode = modes.back();

        if (mode == Mode::String) {
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == '"') {
                modes.pop_back();
            } else if (c == '$' && next == '{') {
                modes.push_back(Mode::Interp);
                interp_braces.push_back(0);
                i += 2;
                continue;
            }
            ++i;
            continue;
        }

        if (mode == Mode::Interp) {
            if (c == '"') {
                modes.push_back(Mode::String);
            } else if (c == '{') {
                ++interp_braces.back();
            } else if (c == '}') {
                if (interp_braces.back() == 0) {
                    modes.pop_back();
                    interp_braces.pop_back();
                } else {
                    --interp_braces.back();
                }
            }
            ++i;
            continue;
        }

        // Code
        if (c == '#' || (c == '/' && next == '/')) {
            break;
        }
        if (c == '/' && next == '*') {
            in_block_comment_ = true;
            i += 2;
            continue;
        }
        if (c == '"') {
            seen_token = true;
            modes.push_back(Mode::String);
            ++i;
            continue;
        }
        if (c == '<' && next == '<') {
            size_t j = i + 2;
            if (j < n && text[j] == '-') {
                ++j;
            }
            size_t start = j;
            while (j < n && is_ident_char(text[j])) {
                ++j;
            }
            if (j > start && trim(text.substr(j)).empty()) {
                result.heredoc_marker = text.substr(start, j - start);
                break;
            }
        }
        if (c == '{' || c == '[') {
            stack_.push_back({c, line_no});
            ++opened_here;
            seen_token = true;
            ++i;
            continue;
        }
        if (c == '}' || c == ']') {
            char expected = c == '}' ? '{' : '[';
            if (stack_.empty() || stack_.back().bracket != expected) {
                return line_error(std::string("unexpected '") + c + "'", line_no);
            }
            stack_.pop_back();
            if (!seen_token) {
                ++result.leading_closers;
            }
            ++i;
            continue;
        }
        if (c == '=') {
            char prev = i > 0 ? text[i - 1] : '\0';
            bool is_operator = prev == '=' || prev == '!' || prev == '<' || prev == '>' ||
                               next == '=' || next == '>';
            if (!is_operator && !result.assign_pos && opened_here == 0 && i > 0) {
                result.assign_pos = i;
            }
        }
        if (!std::isspace(static_cast<unsigned char>(c)) && c != ',') {
            seen_token = true;
        }
        ++i;
    }

    if (modes.size() > 1) {
        return line_error("unterminated string", line_no);
    }

    return result;
}

void HclFormatter::reset() {
    stack_.clear();
    in_block_comment_ = false;
    heredoc_.clear();
    heredoc_line_ = 0;
    comment_line_ = 0;
}

auto HclFormatter::walk(const std::string& source) -> Result<std::vector<Line>> {
    std::vector<Line> lines;

    auto raw_lines = split_lines(source);
    for (size_t idx = 0; idx < raw_lines.size(); ++idx) {
        const size_t line_no = idx + 1;
        const std::string& raw = raw_lines[idx];
        std::string text = trim(raw);

        Line line;
        line.open_before = stack_.size();
        line.open_after = stack_.size();

        if (!heredoc_.empty()) {
            line.verbatim = true;
            line.text = raw;
            if (!line.text.empty() && line.text.back() == '\r') {
                line.text.pop_back();
            }
            if (text == heredoc_) {
                heredoc_.clear();
            }
            lines.push_back(std::move(line));
            continue;
        }

        if (text.empty()) {
            line.blank = !in_block_comment_;
            line.in_comment = in_block_comment_;
            line.depth = stack_.size();
            lines.push_back(std::move(line));
            continue;
        }

        const bool was_in_comment = in_block_comment_;
        const size_t depth_before = stack_.size();

        auto scanned = scan(text, line_no);
        if (is_err(scanned)) {
            return unwrap_err(scanned);
        }
        const auto& info = unwrap(scanned);

        if (!was_in_comment && in_block_comment_) {
            comment_line_ = line_no;
        }

        line.text = text;
        line.in_comment = was_in_comment;
        line.open_after = stack_.size();
        line.depth = depth_before - std::min(info.leading_closers, depth_before);

        if (!info.heredoc_marker.empty()) {
            heredoc_ = info.heredoc_marker;
            heredoc_line_ = line_no;
        }

        if (info.assign_pos) {
            const size_t pos = *info.assign_pos;
            line.key = trim(text.substr(0, pos));
            line.value = trim(text.substr(pos + 1));
            if (!line.key.empty()) {
                line.text = line.key + " = " + line.value;
                line.alignable = stack_.size() == depth_before && info.leading_closers == 0 &&
                                 info.heredoc_marker.empty() && !was_in_comment;
            }
        }

        lines.push_back(std::move(line));
    }

    return lines;
}

auto HclFormatter::classify(const std::string& source) -> Result<std::vector<Line>> {
    auto walked = walk(source);
    if (is_err(walked)) {
        return walked;
    }

    if (!heredoc_.empty()) {
        return line_error("unterminated heredoc", heredoc_line_);
    }
    if (in_block_comment_) {
        return line_error("unterminated comment", comment_line_);
    }
    if (!stack_.empty()) {
        const auto& open = stack_.back();
        return line_error(std::string("unclosed '") + open.bracket + "' opened", open.line);
    }

    return walked;
}

auto HclFormatter::bracket_depths(const std::string& source) -> Result<std::vector<LineDepth>> {
    reset();

    auto walked = walk(source);
    if (is_err(walked)) {
        return unwrap_err(walked);
    }

    std::vector<LineDepth> depths;
    depths.reserve(unwrap(walked).size());
    for (const auto& line : unwrap(walked)) {
        depths.push_back(LineDepth{line.open_before, line.open_after,
                                   !line.verbatim && !line.in_comment});
    }
    return depths;
}

} // namespace wheels::format
