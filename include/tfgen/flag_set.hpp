//! # Flag Set
//!
//! Declared command-line flags for one plugin command, parsed with the same
//! conventions terraform itself uses:
//!
//! | Form            | Meaning                                   |
//! |-----------------|-------------------------------------------|
//! | `-name=value`   | value in the same token                   |
//! | `-name value`   | value in the next token                   |
//! | `--name=value`  | double dash is accepted                   |
//! | `-flag`         | boolean flags only                        |
//! | `--`            | ends flag parsing                         |
//!
//! Parsing stops at the first token that is not a flag; it and everything
//! after it are positional arguments.
//!
//! Every explicitly supplied occurrence is recorded in supply order, so a
//! flag given twice is visited twice. Defaults are never visited.

#pragma once

#include "common.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wheels::tfgen {

/// A declared flag.
struct Flag {
    std::string name;
    std::string usage;
    std::string default_value;
    bool is_bool = false;
};

/// One explicitly supplied flag occurrence.
struct FlagOccurrence {
    std::string name;
    std::string value;
};

/// A set of declared flags and the occurrences parsed from arguments.
class FlagSet {
public:
    explicit FlagSet(std::string name);

    /// Declares a string flag.
    void define(std::string name, std::string default_value, std::string usage);

    /// Declares a boolean flag (default false).
    void define_bool(std::string name, std::string usage);

    /// Parses `args`. Returns an error naming the offending flag.
    auto parse(const std::vector<std::string>& args) -> Result<bool>;

    /// Records an occurrence programmatically. Errors if `name` is undeclared.
    auto set(const std::string& name, const std::string& value) -> Result<bool>;

    /// Returns the declared flag, or nullptr.
    [[nodiscard]] auto lookup(std::string_view name) const -> const Flag*;

    /// Last supplied value, or the default when the flag was not supplied.
    [[nodiscard]] auto value(std::string_view name) const -> std::string;

    /// True if the flag was supplied at least once.
    [[nodiscard]] auto is_set(std::string_view name) const -> bool;

    /// Supplied occurrences in supply order.
    [[nodiscard]] auto occurrences() const -> const std::vector<FlagOccurrence>& {
        return occurrences_;
    }

    /// Calls `fn` for every declared flag in name order.
    void visit_all(const std::function<void(const Flag&)>& fn) const;

    /// Positional arguments left after the flags.
    [[nodiscard]] auto args() const -> const std::vector<std::string>& {
        return args_;
    }

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

private:
    std::string name_;
    std::map<std::string, Flag, std::less<>> flags_;
    std::vector<FlagOccurrence> occurrences_;
    std::vector<std::string> args_;
};

} // namespace wheels::tfgen
