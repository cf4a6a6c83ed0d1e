//! # Operation Records
//!
//! An `OperationRecord` is the unit the registry consumes: one gadget
//! invocation with its diagnostic label, kind, optional output and ordered
//! operands. Records are ephemeral values; nothing keeps them after their
//! text is appended.
//!
//! `make_record()` is the construction step that rejects records whose
//! operand count or output presence disagrees with the catalog, so renderers
//! only ever see well-formed input.

#ifndef GADGETGEN_GADGET_RECORD_HPP
#define GADGETGEN_GADGET_RECORD_HPP

#include "gadgetgen/common.hpp"
#include "gadgetgen/gadget/error.hpp"
#include "gadgetgen/gadget/identifier.hpp"
#include "gadgetgen/gadget/kind.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gadgetgen::gadget {

/// One gadget invocation.
struct OperationRecord {
    std::string label;                           ///< Diagnostic namespace, embedded as a literal.
    OperationKind kind = OperationKind::Witness; ///< Which renderer handles the record.
    std::optional<Identifier> output;            ///< Bound result, for kinds that produce one.
    std::vector<Identifier> operands;            ///< Inputs, in the kind's role order.
    uint32_t line = 0;                           ///< Listing line (0 if built in code).
};

/// Checks a record's shape against the catalog.
///
/// Returns `true` on success, a G001 error for a kind outside the catalog,
/// or a G002/G003 error.
[[nodiscard]] auto validate_shape(const OperationRecord& record) -> Result<bool, GadgetError>;

/// Builds a record from already-validated parts, checking arity and output.
[[nodiscard]] auto make_record(std::string label, OperationKind kind,
                               std::optional<Identifier> output, std::vector<Identifier> operands,
                               uint32_t line = 0) -> Result<OperationRecord, GadgetError>;

/// Builds a record from raw text: resolves the kind name and parses every
/// identifier before checking the shape.
[[nodiscard]] auto make_record(std::string label, std::string_view kind_name,
                               std::optional<std::string_view> output,
                               const std::vector<std::string_view>& operands, uint32_t line = 0)
    -> Result<OperationRecord, GadgetError>;

} // namespace gadgetgen::gadget

#endif // GADGETGEN_GADGET_RECORD_HPP
