#include "gadgetgen/gadget/identifier.hpp"

#include <algorithm>
#include <array>

namespace gadgetgen::gadget {

namespace {

// Strict, reserved and weak-but-unusable keywords of Rust 2021.
constexpr std::array<std::string_view, 51> RUST_KEYWORDS = {
    "as",       "async",   "await",  "break",   "const",  "continue", "crate",  "dyn",
    "else",     "enum",    "extern", "false",   "fn",     "for",      "if",     "impl",
    "in",       "let",     "loop",   "match",   "mod",    "move",     "mut",    "pub",
    "ref",      "return",  "self",   "Self",    "static", "struct",   "super",  "trait",
    "true",     "type",    "unsafe", "use",     "where",  "while",    "abstract", "become",
    "box",      "do",      "final",  "macro",   "override", "priv",   "typeof", "unsized",
    "virtual",  "yield",   "try",
};

auto is_ident_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_ident_continue(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

/// Returns an empty string if `text` is acceptable, else the reason.
auto rejection_reason(std::string_view text) -> std::string {
    if (text.empty())
        return "identifier is empty";
    if (!is_ident_start(text.front()))
        return "must start with a letter or '_'";
    if (!std::all_of(text.begin(), text.end(), is_ident_continue))
        return "only ASCII letters, digits and '_' are allowed";
    if (text == "_")
        return "'_' cannot name a value";
    if (Identifier::is_keyword(text))
        return "reserved keyword";
    return {};
}

} // namespace

auto Identifier::is_keyword(std::string_view text) -> bool {
    return std::find(RUST_KEYWORDS.begin(), RUST_KEYWORDS.end(), text) != RUST_KEYWORDS.end();
}

auto Identifier::is_valid(std::string_view text) -> bool {
    return rejection_reason(text).empty();
}

auto Identifier::parse(std::string_view text, uint32_t line) -> Result<Identifier, GadgetError> {
    auto reason = rejection_reason(text);
    if (!reason.empty()) {
        return GadgetError::invalid_identifier(text, std::move(reason), line);
    }
    return Identifier(std::string(text));
}

} // namespace gadgetgen::gadget
