//! # Symbol Table
//!
//! Optional cross-record check used by strict mode. Tracks every name that
//! is known to exist in the generated code (external inputs plus the outputs
//! of earlier records) and rejects a record whose operand names something
//! that was never declared.
//!
//! Without strict mode the registry does no linkage checking at all and the
//! caller owns binding correctness.

#ifndef GADGETGEN_GADGET_SYMBOLS_HPP
#define GADGETGEN_GADGET_SYMBOLS_HPP

#include "gadgetgen/common.hpp"
#include "gadgetgen/gadget/error.hpp"
#include "gadgetgen/gadget/identifier.hpp"
#include "gadgetgen/gadget/record.hpp"

#include <cstddef>
#include <unordered_map>

namespace gadgetgen::gadget {

class SymbolTable {
public:
    /// How a name came to be declared.
    enum class Origin {
        Input,  ///< Supplied from outside the generated block.
        Output, ///< Bound by an earlier record.
    };

    /// Registers an external input.
    void declare_input(const Identifier& name);

    /// Returns true if `name` has been declared either way.
    [[nodiscard]] auto is_declared(const Identifier& name) const -> bool;

    /// Verifies every operand of `record` is declared.
    ///
    /// Returns `true` or the first undeclared operand as G006.
    [[nodiscard]] auto check(const OperationRecord& record) const -> Result<bool, GadgetError>;

    /// Records the output of `record`, if it has one.
    ///
    /// Rebinding an existing name is allowed; the generated `let` shadows it.
    void bind(const OperationRecord& record);

    [[nodiscard]] auto size() const -> std::size_t {
        return symbols_.size();
    }

private:
    std::unordered_map<Identifier, Origin> symbols_;
};

} // namespace gadgetgen::gadget

#endif // GADGETGEN_GADGET_SYMBOLS_HPP
