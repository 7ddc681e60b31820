//! # Flag Merger
//!
//! Merges explicitly supplied flag occurrences into an existing body of
//! configuration lines.
//!
//! ## Merge Rules
//!
//! ```text
//! for each flag, at its first occurrence (in supply order):
//!     remove the first body line containing the flag name
//! for each occurrence:
//!     scalar -> remember value (last one wins)
//!     list   -> accumulate value
//!     map    -> accumulate key=value (split on first '=')
//! then:
//!     scalars       name = "value"          in order of first occurrence
//!     list blocks   ""  name = [    "v",   ]   in flag-name order
//!     map blocks    ""  name = {    k = "v"  } in flag-name order
//! ```
//!
//! Line matching is plain substring containment. A flag name that occurs in
//! an unrelated line (inside a string, a comment, or a longer key such as
//! `num_masters_max`) can match that line instead of the intended one.
//! Only the first match is removed per flag.

#pragma once

#include "common.hpp"
#include "tfgen/flag_set.hpp"

#include <set>
#include <string>
#include <vector>

namespace wheels::tfgen {

class FlagMerger {
public:
    FlagMerger(const std::set<std::string>& list_flags, const std::set<std::string>& map_flags);

    /// Returns `body` with `supplied` merged in, or an error for a map value
    /// without `key=value` form. An empty key (`=v`) is rejected.
    auto merge(std::vector<std::string> body, const std::vector<FlagOccurrence>& supplied) const
        -> Result<std::vector<std::string>>;

private:
    const std::set<std::string>& list_flags_;
    const std::set<std::string>& map_flags_;
};

} // namespace wheels::tfgen
