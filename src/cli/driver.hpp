//! # CLI Driver Interface
//!
//! | Function               | Description                               |
//! |------------------------|-------------------------------------------|
//! | `gadgetgen_main()`     | Entry point used by `main()`              |
//! | `parse_cli_options()`  | argv to `CliOptions`                      |
//! | `run_generate()`       | Listing file to rendered fragments        |
//! | `print_kinds()`        | Prints the kind catalog                   |

#pragma once

#include "gadgetgen/common.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace gadgetgen::cli {

struct CliOptions {
    std::string listing_path;
    std::string output_path; ///< Empty = stdout
    std::vector<std::string> inputs;
    bool strict = false;
    bool keep_going = false;
    bool list_kinds = false;
    bool help = false;
    bool version = false;
};

/// Parses command-line arguments. Logging options are skipped here; they
/// are handled by `log::parse_log_options`.
auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string>;

/// Reads the listing, renders every record and writes the fragments.
///
/// Diagnostics go to `err`. Returns the process exit code.
auto run_generate(const CliOptions& options, std::ostream& out, std::ostream& err) -> int;

void print_kinds(std::ostream& out);
void print_usage(std::ostream& out);
void print_version(std::ostream& out);

int gadgetgen_main(int argc, char* argv[]);

} // namespace gadgetgen::cli
