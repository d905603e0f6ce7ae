//! # just-ext Entry Point
//!
//! Installs, lists, removes and runs extensions of the `just` command runner.
//!
//! ```bash
//! just-ext install https://github.com/owner/fmt
//! just-ext list
//! just-ext run fmt --check
//! just-ext uninstall fmt
//! ```
//!
//! All work happens in the CLI driver (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return just_ext_main(argc, argv);
}
