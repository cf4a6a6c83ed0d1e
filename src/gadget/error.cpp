#include "gadgetgen/gadget/error.hpp"

#include <utility>

namespace gadgetgen::gadget {

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::UnresolvableKind:
        return "unresolvable kind";
    case ErrorKind::MalformedRecord:
        return "malformed record";
    case ErrorKind::InvalidIdentifier:
        return "invalid identifier";
    case ErrorKind::UndeclaredOperand:
        return "undeclared operand";
    case ErrorKind::ListingSyntax:
        return "listing syntax";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

auto GadgetError::unresolvable_kind(std::string_view name, uint32_t line) -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::UnresolvableKind;
    e.code = ErrorCodes::UNRESOLVABLE_KIND;
    e.message = "unknown gadget kind '" + std::string(name) + "'";
    e.line = line;
    return e;
}

auto GadgetError::arity_mismatch(OperationKind op, std::size_t expected, std::size_t actual,
                                 uint32_t line) -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::MalformedRecord;
    e.code = ErrorCodes::ARITY_MISMATCH;
    e.message = std::string(kind_name(op)) + " takes " + std::to_string(expected) + " operand" +
                (expected == 1 ? "" : "s") + ", got " + std::to_string(actual);
    e.op = op;
    e.expected = expected;
    e.actual = actual;
    e.line = line;
    return e;
}

auto GadgetError::output_mismatch(OperationKind op, bool has_output, uint32_t line)
    -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::MalformedRecord;
    e.code = ErrorCodes::OUTPUT_MISMATCH;
    e.message = has_output ? std::string(kind_name(op)) + " does not produce an output"
                           : std::string(kind_name(op)) + " requires an output name";
    e.op = op;
    e.line = line;
    return e;
}

auto GadgetError::unescapable_label(std::string reason, uint32_t line) -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::MalformedRecord;
    e.code = ErrorCodes::UNESCAPABLE_LABEL;
    e.message = "label cannot be quoted: " + reason;
    e.line = line;
    return e;
}

auto GadgetError::unescapable_label(OperationKind op, std::string reason, uint32_t line)
    -> GadgetError {
    auto e = unescapable_label(std::move(reason), line);
    e.op = op;
    return e;
}

auto GadgetError::invalid_identifier(std::string_view text, std::string reason, uint32_t line)
    -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::InvalidIdentifier;
    e.code = ErrorCodes::INVALID_IDENTIFIER;
    e.message = "invalid identifier '" + std::string(text) + "': " + reason;
    e.line = line;
    return e;
}

auto GadgetError::undeclared_operand(OperationKind op, std::string_view name, uint32_t line)
    -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::UndeclaredOperand;
    e.code = ErrorCodes::UNDECLARED_OPERAND;
    e.message = "operand '" + std::string(name) + "' of " + std::string(kind_name(op)) +
                " was never declared";
    e.op = op;
    e.line = line;
    return e;
}

auto GadgetError::listing_syntax(std::string message, uint32_t line) -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::ListingSyntax;
    e.code = ErrorCodes::LISTING_SYNTAX;
    e.message = std::move(message);
    e.line = line;
    return e;
}

auto GadgetError::io(std::string message) -> GadgetError {
    GadgetError e;
    e.kind = ErrorKind::Io;
    e.code = ErrorCodes::IO;
    e.message = std::move(message);
    return e;
}

auto GadgetError::to_string() const -> std::string {
    std::string text = "error[" + code + "]: " + message;
    if (line > 0) {
        return "line " + std::to_string(line) + ": " + text;
    }
    return text;
}

} // namespace gadgetgen::gadget
