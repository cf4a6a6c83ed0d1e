//! # Fragment Emitter
//!
//! Renders a sequence of records in order and concatenates the fragments
//! into one output buffer, one fragment per line group. The emitter is the
//! only place that knows about error policy: by default the first failing
//! record stops emission; with `keep_going` the record is skipped and the
//! error kept for reporting.
//!
//! ## Example
//!
//! ```cpp
//! EmitOptions opts;
//! opts.strict = true;
//! Emitter emitter(opts);
//! emitter.declare_input(unwrap(Identifier::parse("maybe_pk")));
//! emitter.emit_all(records);
//! if (!emitter.ok()) { ... }
//! std::cout << emitter.output();
//! ```

#ifndef GADGETGEN_GADGET_EMITTER_HPP
#define GADGETGEN_GADGET_EMITTER_HPP

#include "gadgetgen/common.hpp"
#include "gadgetgen/gadget/error.hpp"
#include "gadgetgen/gadget/identifier.hpp"
#include "gadgetgen/gadget/record.hpp"
#include "gadgetgen/gadget/symbols.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gadgetgen::gadget {

/// Emitter configuration.
struct EmitOptions {
    /// Check every operand against the symbol table before rendering.
    bool strict = false;

    /// Skip failing records instead of stopping at the first one.
    bool keep_going = false;

    /// Text appended after each fragment.
    std::string separator = "\n";
};

class Emitter {
public:
    explicit Emitter(EmitOptions options = {});

    /// Registers an external input for strict mode.
    void declare_input(const Identifier& name);

    /// Renders and appends one record.
    ///
    /// Returns `true` when the record was appended. Once the emitter has
    /// stopped (an error without `keep_going`) further records are ignored
    /// and `false` is returned.
    auto emit(const OperationRecord& record) -> bool;

    /// Emits every record in order; returns the number appended.
    auto emit_all(const std::vector<OperationRecord>& records) -> std::size_t;

    [[nodiscard]] auto output() const -> const std::string& {
        return buffer_;
    }

    [[nodiscard]] auto errors() const -> const std::vector<GadgetError>& {
        return errors_;
    }

    [[nodiscard]] auto ok() const -> bool {
        return errors_.empty();
    }

    [[nodiscard]] auto stopped() const -> bool {
        return stopped_;
    }

    [[nodiscard]] auto emitted_count() const -> std::size_t {
        return emitted_;
    }

private:
    EmitOptions options_;
    SymbolTable symbols_;
    std::string buffer_;
    std::vector<GadgetError> errors_;
    std::size_t emitted_ = 0;
    bool stopped_ = false;

    void fail(GadgetError error);
};

} // namespace gadgetgen::gadget

#endif // GADGETGEN_GADGET_EMITTER_HPP
