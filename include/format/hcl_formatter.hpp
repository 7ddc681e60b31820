//! # HCL Structural Formatter
//!
//! Canonical layout for generated Terraform configuration text. The formatter
//! is structural only: it tracks brackets, strings, comments and heredocs, and
//! never interprets expressions.
//!
//! ## Rules
//!
//! | Rule          | Behavior                                             |
//! |---------------|------------------------------------------------------|
//! | Indentation   | `indent_width` spaces per `{` / `[` nesting level    |
//! | Assignments   | first top-level `=` normalized to ` = `              |
//! | Alignment     | consecutive single-line assignments align on `=`     |
//! | Blank lines   | runs collapsed to one, trimmed at both ends          |
//! | Heredocs      | `<<EOF` bodies copied verbatim                       |
//!
//! Unbalanced brackets and unterminated strings are reported as errors with
//! the 1-based line number.

#pragma once

#include "common.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace wheels::format {

/// Formatting options.
struct FormatOptions {
    size_t indent_width = 2;
    bool align_assignments = true;
};

/// Bracket nesting around one source line.
struct LineDepth {
    size_t before = 0; ///< brackets open before the line
    size_t after = 0;  ///< brackets open after the line
    bool code = true;  ///< false for heredoc bodies and lines inside `/* */`
};

/// A formatter function: text in, canonical text or error out.
/// Generators take one of these so tests can substitute a failing formatter.
using FormatFn = std::function<Result<std::string>(const std::string&)>;

/// Structural formatter for HCL text.
class HclFormatter {
public:
    explicit HclFormatter(FormatOptions options = {});

    /// Formats `source`. The result ends with a single newline unless empty.
    auto format(const std::string& source) -> Result<std::string>;

    /// Bracket depth of every line of `source`, under the same lexical rules
    /// as `format()`. Brackets, heredocs and comments still open at the end
    /// of input are not errors here; mismatched closers and unterminated
    /// strings are.
    auto bracket_depths(const std::string& source) -> Result<std::vector<LineDepth>>;

private:
    /// One classified input line.
    struct Line {
        std::string text;
        size_t depth = 0;
        bool blank = false;
        bool verbatim = false;
        bool alignable = false;
        bool in_comment = false;
        size_t open_before = 0;
        size_t open_after = 0;
        std::string key;
        std::string value;
    };

    /// What the scanner found on a line of code.
    struct Scan {
        size_t leading_closers = 0;
        std::optional<size_t> assign_pos;
        std::string heredoc_marker;
    };

    /// Open bracket and the line that opened it.
    struct Open {
        char bracket;
        size_t line;
    };

    void reset();
    auto walk(const std::string& source) -> Result<std::vector<Line>>;
    auto classify(const std::string& source) -> Result<std::vector<Line>>;
    auto scan(const std::string& text, size_t line_no) -> Result<Scan>;
    void align(std::vector<Line>& lines) const;

    void emit_line(size_t depth, const std::string& text);
    auto indent_str(size_t depth) const -> std::string;

    FormatOptions options_;
    std::vector<Open> stack_;
    bool in_block_comment_ = false;
    std::string heredoc_;
    size_t heredoc_line_ = 0;
    size_t comment_line_ = 0;
    std::ostringstream output_;
};

/// Formats `source` with default options.
auto format_hcl(const std::string& source) -> Result<std::string>;

} // namespace wheels::format
