//! # Gadget Error Types
//!
//! Errors reported while resolving, building, checking or rendering operation
//! records. Every failure is a value, never an exception: callers receive a
//! `Result<T, GadgetError>` and decide whether to abort the run or skip the
//! offending record.
//!
//! ## Error Codes
//!
//! | Code | Category          | Meaning                                   |
//! |------|-------------------|-------------------------------------------|
//! | G001 | UnresolvableKind  | Kind name not present in the catalog      |
//! | G002 | MalformedRecord   | Operand count does not match the kind     |
//! | G003 | MalformedRecord   | Output present/absent contrary to kind    |
//! | G004 | MalformedRecord   | Label cannot be written as a literal      |
//! | G005 | InvalidIdentifier | Text is not a usable target identifier    |
//! | G006 | UndeclaredOperand | Strict mode: operand was never declared   |
//! | G007 | ListingSyntax     | Listing line cannot be parsed             |
//! | G008 | Io                | Input or output file access failed        |

#ifndef GADGETGEN_GADGET_ERROR_HPP
#define GADGETGEN_GADGET_ERROR_HPP

#include "gadgetgen/gadget/kind.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gadgetgen::gadget {

namespace ErrorCodes {
constexpr const char* UNRESOLVABLE_KIND = "G001";
constexpr const char* ARITY_MISMATCH = "G002";
constexpr const char* OUTPUT_MISMATCH = "G003";
constexpr const char* UNESCAPABLE_LABEL = "G004";
constexpr const char* INVALID_IDENTIFIER = "G005";
constexpr const char* UNDECLARED_OPERAND = "G006";
constexpr const char* LISTING_SYNTAX = "G007";
constexpr const char* IO = "G008";
} // namespace ErrorCodes

/// Broad error category.
///
/// `UnresolvableKind` and `MalformedRecord` are the two failures a renderer
/// contract knows about; the rest come from the layers around it.
enum class ErrorKind {
    UnresolvableKind,
    MalformedRecord,
    InvalidIdentifier,
    UndeclaredOperand,
    ListingSyntax,
    Io,
};

/// Returns a short name for an error category (e.g. "malformed record").
auto error_kind_name(ErrorKind kind) -> const char*;

/// An error produced by the gadget layer.
///
/// # Fields
///
/// - `kind`: error category
/// - `code`: stable code (`G001`...), see `ErrorCodes`
/// - `message`: human-readable description
/// - `op`: the operation kind involved, when it was resolved
/// - `expected` / `actual`: operand counts for arity errors
/// - `line`: 1-based listing line, 0 when unknown
struct GadgetError {
    ErrorKind kind = ErrorKind::MalformedRecord;
    std::string code;
    std::string message;
    std::optional<OperationKind> op;
    std::size_t expected = 0;
    std::size_t actual = 0;
    uint32_t line = 0;

    /// The requested kind name is not in the catalog.
    static auto unresolvable_kind(std::string_view name, uint32_t line = 0) -> GadgetError;

    /// The record carries the wrong number of operands for its kind.
    static auto arity_mismatch(OperationKind op, std::size_t expected, std::size_t actual,
                               uint32_t line = 0) -> GadgetError;

    /// The record has an output where the kind produces none, or lacks one.
    static auto output_mismatch(OperationKind op, bool has_output, uint32_t line = 0)
        -> GadgetError;

    /// The label cannot be represented as a target string literal.
    static auto unescapable_label(std::string reason, uint32_t line = 0) -> GadgetError;

    static auto unescapable_label(OperationKind op, std::string reason, uint32_t line = 0)
        -> GadgetError;

    /// The text is not a valid target-language identifier.
    static auto invalid_identifier(std::string_view text, std::string reason, uint32_t line = 0)
        -> GadgetError;

    /// Strict mode found an operand that no earlier record produced.
    static auto undeclared_operand(OperationKind op, std::string_view name, uint32_t line = 0)
        -> GadgetError;

    static auto listing_syntax(std::string message, uint32_t line) -> GadgetError;

    static auto io(std::string message) -> GadgetError;

    /// Formats the error for display.
    ///
    /// - With line: `"line X: error[G00N]: message"`
    /// - Without:   `"error[G00N]: message"`
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace gadgetgen::gadget

#endif // GADGETGEN_GADGET_ERROR_HPP
