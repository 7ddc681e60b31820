//! # Driver Interface
//!
//! `wheels_main()` handles the `wheels-*` meta-commands, configures logging,
//! opens the sandbox in the current directory and runs the dispatcher.

#pragma once

// Main driver entry point
int wheels_main(int argc, char* argv[]);
