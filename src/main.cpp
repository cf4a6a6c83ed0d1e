//! # gadgetgen Entry Point
//!
//! ```bash
//! gadgetgen spend.gg                  # fragments to stdout
//! gadgetgen spend.gg -o spend.rs.inc  # fragments to a file
//! gadgetgen --strict spend.gg         # check operand declarations
//! gadgetgen --list-kinds              # show the gadget catalog
//! ```
//!
//! All work happens in `cli/driver.cpp`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return gadgetgen::cli::gadgetgen_main(argc, argv);
}
