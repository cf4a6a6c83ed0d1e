//! # CLI Driver
//!
//! ```text
//! gadgetgen_main()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   ├─ --list-kinds    → print_kinds()
//!   └─ <listing>       → run_generate()
//!                          ├─ Source::from_file()
//!                          ├─ parse_listing()
//!                          └─ Emitter::emit_all()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                       |
//! |------|-----------------------------------------------|
//! | 0    | Success                                       |
//! | 1    | Usage, listing, render or output file error   |

#include "driver.hpp"

#include "gadgetgen/gadget/emitter.hpp"
#include "gadgetgen/gadget/kind.hpp"
#include "gadgetgen/listing/reader.hpp"
#include "gadgetgen/listing/source.hpp"
#include "gadgetgen/log/log.hpp"

#include <fstream>
#include <iostream>

namespace gadgetgen::cli {

using gadget::GadgetError;

namespace {

void report(std::ostream& err, std::string_view file, const GadgetError& error) {
    err << file;
    if (error.line > 0) {
        err << ":" << error.line;
    }
    err << ": error[" << error.code << "]: " << error.message << "\n";
}

} // namespace

auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string> {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--list-kinds") {
            options.list_kinds = true;
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--keep-going") {
            options.keep_going = true;
        } else if (arg.starts_with("--input=")) {
            options.inputs.emplace_back(arg.substr(8));
        } else if (arg.starts_with("--output=")) {
            options.output_path = std::string(arg.substr(9));
        } else if (arg == "-o") {
            if (i + 1 >= argc) {
                return std::string("missing file name after -o");
            }
            options.output_path = argv[++i];
        } else if (arg.starts_with("-") && arg != "-") {
            return "unknown option: " + std::string(arg);
        } else if (options.listing_path.empty()) {
            options.listing_path = std::string(arg);
        } else {
            return "unexpected argument: " + std::string(arg);
        }
    }

    return options;
}

void print_usage(std::ostream& out) {
    out << "gadgetgen " << VERSION << " - render circuit gadget listings to Rust fragments\n\n"
        << "Usage: gadgetgen [options] <listing>\n\n"
        << "Options:\n"
        << "  -o, --output=<file>  Write fragments to <file> instead of stdout\n"
        << "  --strict             Reject operands that were never declared\n"
        << "  --input=<name>       Declare an external input (repeatable)\n"
        << "  --keep-going         Skip failing records instead of stopping\n"
        << "  --list-kinds         Print the gadget catalog and exit\n"
        << "  -h, --help           Show this help\n"
        << "  -V, --version        Show version\n\n"
        << "Logging:\n"
        << "  --log-level=<level>  trace, debug, info, warn, error, off\n"
        << "  --log-filter=<spec>  e.g. emit=debug,*=warn\n"
        << "  --log-file=<path>    Also write log records to <path>\n"
        << "  --log-format=<fmt>   text or json\n"
        << "  -v, -vv, -vvv        Info, debug, trace\n"
        << "  -q, --quiet          Errors only\n";
}

void print_version(std::ostream& out) {
    out << "gadgetgen " << VERSION << "\n";
}

void print_kinds(std::ostream& out) {
    for (const auto& info : gadget::CATALOG) {
        out << info.name << " (" << info.display_name << "): ";
        for (size_t i = 0; i < info.arity; ++i) {
            out << (i > 0 ? ", " : "") << info.roles[i];
        }
        out << (info.has_output ? " -> output" : "") << "\n";
    }
}

auto run_generate(const CliOptions& options, std::ostream& out, std::ostream& err) -> int {
    auto loaded = listing::Source::from_file(options.listing_path);
    if (is_err(loaded)) {
        report(err, options.listing_path, GadgetError::io(unwrap_err(loaded)));
        return 1;
    }
    const auto& source = unwrap(loaded);
    GADGETGEN_LOG_INFO("cli", "Reading " << source.filename() << " (" << source.line_count()
                                         << " lines)");

    auto parsed = listing::parse_listing(source);
    if (is_err(parsed)) {
        for (const auto& error : unwrap_err(parsed)) {
            report(err, source.filename(), error);
        }
        return 1;
    }
    const auto& program = unwrap(parsed);

    gadget::EmitOptions emit_options;
    emit_options.strict = options.strict;
    emit_options.keep_going = options.keep_going;
    gadget::Emitter emitter(emit_options);

    for (const auto& input : program.inputs) {
        emitter.declare_input(input);
    }
    for (const auto& name : options.inputs) {
        auto id = gadget::Identifier::parse(name);
        if (is_err(id)) {
            report(err, "--input", unwrap_err(id));
            return 1;
        }
        emitter.declare_input(unwrap(id));
    }

    emitter.emit_all(program.records);
    for (const auto& error : emitter.errors()) {
        report(err, source.filename(), error);
    }
    // A stopped run leaves no partial output behind.
    if (emitter.stopped()) {
        return 1;
    }

    if (options.output_path.empty()) {
        out << emitter.output();
        out.flush();
    } else {
        std::ofstream file(options.output_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            report(err, options.output_path,
                   GadgetError::io("cannot open output file: " + options.output_path));
            return 1;
        }
        file << emitter.output();
        if (!file.flush()) {
            report(err, options.output_path,
                   GadgetError::io("failed writing output file: " + options.output_path));
            return 1;
        }
        GADGETGEN_LOG_INFO("cli", "Wrote " << emitter.emitted_count() << " fragment(s) to "
                                           << options.output_path);
    }

    return emitter.ok() ? 0 : 1;
}

int gadgetgen_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_cli_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n\n";
        print_usage(std::cerr);
        return 1;
    }
    const auto& options = unwrap(parsed);

    if (options.help) {
        print_usage(std::cout);
        return 0;
    }
    if (options.version) {
        print_version(std::cout);
        return 0;
    }
    if (options.list_kinds) {
        print_kinds(std::cout);
        return 0;
    }
    if (options.listing_path.empty()) {
        print_usage(std::cerr);
        return 1;
    }

    int code = run_generate(options, std::cout, std::cerr);
    log::Logger::instance().flush();
    return code;
}

} // namespace gadgetgen::cli
