//! # Target Identifiers
//!
//! `Identifier` is the only way an operand or output name reaches a renderer.
//! It is validated once, at construction, against the identifier rules of the
//! generated Rust code, so a malformed name is caught while records are built
//! instead of surfacing later as broken generated source.
//!
//! ## Rules
//!
//! - ASCII only: `[A-Za-z_][A-Za-z0-9_]*`
//! - not a lone `_`
//! - not a Rust strict or reserved keyword (`let`, `fn`, `self`, `async`, ...)
//!
//! ## Example
//!
//! ```cpp
//! auto id = Identifier::parse("r_bits");
//! if (is_ok(id)) {
//!     std::cout << unwrap(id).str();
//! }
//! ```

#ifndef GADGETGEN_GADGET_IDENTIFIER_HPP
#define GADGETGEN_GADGET_IDENTIFIER_HPP

#include "gadgetgen/common.hpp"
#include "gadgetgen/gadget/error.hpp"

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace gadgetgen::gadget {

/// A validated identifier in the generated source language.
class Identifier {
public:
    /// Validates `text` and wraps it.
    ///
    /// `line` is attached to the error for diagnostics.
    [[nodiscard]] static auto parse(std::string_view text, uint32_t line = 0)
        -> Result<Identifier, GadgetError>;

    /// Returns true if `text` would be accepted by `parse()`.
    [[nodiscard]] static auto is_valid(std::string_view text) -> bool;

    /// Returns true if `text` is a Rust keyword.
    [[nodiscard]] static auto is_keyword(std::string_view text) -> bool;

    [[nodiscard]] auto str() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto view() const -> std::string_view {
        return name_;
    }

    [[nodiscard]] auto operator==(const Identifier& other) const -> bool = default;

private:
    explicit Identifier(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

inline auto operator<<(std::ostream& os, const Identifier& id) -> std::ostream& {
    return os << id.str();
}

} // namespace gadgetgen::gadget

namespace std {
template <> struct hash<gadgetgen::gadget::Identifier> {
    auto operator()(const gadgetgen::gadget::Identifier& id) const noexcept -> size_t {
        return hash<string>{}(id.str());
    }
};
} // namespace std

#endif // GADGETGEN_GADGET_IDENTIFIER_HPP
