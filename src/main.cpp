//! # tfwheels Entry Point
//!
//! Delegates to the CLI driver (`cli/driver.hpp`), which parses the command
//! line, handles the `wheels-*` meta-commands and runs the dispatcher.
//!
//! ## Usage
//!
//! ```bash
//! tfwheels add-aws-cluster      # scaffold a DC/OS cluster project
//! tfwheels plan                 # forwarded to terraform with plugin hooks
//! tfwheels wheels-version       # print the tool version
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return wheels_main(argc, argv);
}
