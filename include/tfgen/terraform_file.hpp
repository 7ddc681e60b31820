//! # Terraform File Generation
//!
//! A `TerraformFileConfig` describes one generated file: the flags a plugin
//! command accepts, which of them render as list or map blocks, and the three
//! line sections the file is assembled from.
//!
//! ## Layout
//!
//! ```text
//! pre_lines      fixed header, e.g. `module "dcos" {`
//! body_lines     previous or default body, merged with supplied flags
//! post_lines     fixed footer, e.g. `}`
//! ```
//!
//! ## Example
//!
//! ```cpp
//! TerraformFileConfig cfg("add-aws-cluster");
//! cfg.flags.define("cluster_name", "dcos-example", "Name of the cluster");
//! cfg.flags.define("admin_ips", "", "CIDR allowed to reach the admin endpoints");
//! cfg.list_flags.insert("admin_ips");
//! cfg.pre_lines = {"module \"dcos\" {"};
//! cfg.body_lines = {"cluster_name = \"dcos-example\""};
//! cfg.post_lines = {"}"};
//!
//! if (auto parsed = cfg.flags.parse(args); is_err(parsed)) { ... }
//! auto content = cfg.generate();
//! ```

#pragma once

#include "common.hpp"
#include "format/hcl_formatter.hpp"
#include "tfgen/flag_set.hpp"

#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace wheels::tfgen {

/// Usage text wrap width in help output.
constexpr size_t HELP_WRAP_WIDTH = 60;

/// Width of the `-name=` label column in help output.
constexpr size_t HELP_LABEL_WIDTH = 20;

/// One generation unit.
struct TerraformFileConfig {
    explicit TerraformFileConfig(std::string name) : flags(std::move(name)) {}

    FlagSet flags;
    std::set<std::string> list_flags;
    std::set<std::string> map_flags;

    std::vector<std::string> pre_lines;
    std::vector<std::string> body_lines;
    std::vector<std::string> post_lines;

    [[nodiscard]] auto is_list(const std::string& name) const -> bool {
        return list_flags.count(name) > 0;
    }

    [[nodiscard]] auto is_map(const std::string& name) const -> bool {
        return map_flags.count(name) > 0;
    }

    /// Prints every declared flag with its wrapped usage text.
    void print_option_help(std::ostream& out) const;

    /// Merges the supplied flags into the body and formats the whole file.
    auto generate(const format::FormatFn& formatter = format::format_hcl) const
        -> Result<std::string>;
};

/// An existing file split around one top-level block.
struct BlockSections {
    std::vector<std::string> pre;  ///< up to and including the header line
    std::vector<std::string> body; ///< lines inside the block
    std::vector<std::string> post; ///< the closing brace and everything after
};

/// Splits `content` around the first block whose header line starts with
/// `header` (after trimming). The block ends at the line holding the brace
/// that closes it. Strings, comments and heredocs are skipped with the
/// formatter's own lexical rules (`HclFormatter::bracket_depths`).
auto split_block(std::string_view content, std::string_view header) -> Result<BlockSections>;

/// Splits `text` into lines of at most `width` characters on word
/// boundaries. A single word longer than `width` gets a line of its own.
auto wrap_long_lines(std::string_view text, size_t width) -> std::vector<std::string>;

/// Prints one flag's help entry.
void print_flag(std::ostream& out, const Flag& flag);

} // namespace wheels::tfgen
