//! # Gadget Kind Catalog
//!
//! The closed set of gadget kinds the registry can render, together with the
//! static dispatch table that maps kind names to kinds.
//!
//! ## Catalog
//!
//! | Kind                | Name                     | Operands          | Output |
//! |---------------------|--------------------------|-------------------|--------|
//! | Witness             | `witness`                | point             | yes    |
//! | AssertNotSmallOrder | `assert_not_small_order` | point             | no     |
//! | FieldToBits         | `fr_as_binary_le`        | field_element     | yes    |
//! | FixedBaseScalarMul  | `ec_mul_const`           | scalar, base      | yes    |
//! | PointAdd            | `ec_add`                 | a, b              | yes    |
//! | ExposeInput         | `emit_ec`                | point             | no     |
//!
//! Each kind is also reachable by its CamelCase display name (`PointAdd`)
//! and by the snake-case form of it (`point_add`).

#ifndef GADGETGEN_GADGET_KIND_HPP
#define GADGETGEN_GADGET_KIND_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace gadgetgen::gadget {

/// Every operation the registry knows how to render.
enum class OperationKind : unsigned char {
    Witness,
    AssertNotSmallOrder,
    FieldToBits,
    FixedBaseScalarMul,
    PointAdd,
    ExposeInput,
};

/// Number of entries in `OperationKind`.
constexpr std::size_t KIND_COUNT = 6;

/// Maximum operand count of any kind.
constexpr std::size_t MAX_OPERANDS = 2;

/// Static description of one gadget kind.
struct KindInfo {
    OperationKind kind;
    std::string_view name;         ///< Canonical listing name, e.g. "ec_add".
    std::string_view display_name; ///< CamelCase name, e.g. "PointAdd".
    std::string_view alias;        ///< snake_case of the display name.
    std::array<std::string_view, MAX_OPERANDS> roles;
    std::size_t arity;
    bool has_output;
};

/// The dispatch table, indexed by `OperationKind`.
inline constexpr std::array<KindInfo, KIND_COUNT> CATALOG = {{
    {OperationKind::Witness, "witness", "Witness", "witness", {"point", ""}, 1, true},
    {OperationKind::AssertNotSmallOrder,
     "assert_not_small_order",
     "AssertNotSmallOrder",
     "assert_not_small_order",
     {"point", ""},
     1,
     false},
    {OperationKind::FieldToBits,
     "fr_as_binary_le",
     "FieldToBits",
     "field_to_bits",
     {"field_element", ""},
     1,
     true},
    {OperationKind::FixedBaseScalarMul,
     "ec_mul_const",
     "FixedBaseScalarMul",
     "fixed_base_scalar_mul",
     {"scalar", "base"},
     2,
     true},
    {OperationKind::PointAdd, "ec_add", "PointAdd", "point_add", {"a", "b"}, 2, true},
    {OperationKind::ExposeInput, "emit_ec", "ExposeInput", "expose_input", {"point", ""}, 1,
     false},
}};

namespace detail {
constexpr auto catalog_is_ordered() -> bool {
    for (std::size_t i = 0; i < CATALOG.size(); ++i) {
        if (static_cast<std::size_t>(CATALOG[i].kind) != i)
            return false;
        if (CATALOG[i].arity == 0 || CATALOG[i].arity > MAX_OPERANDS)
            return false;
    }
    return true;
}
} // namespace detail

static_assert(detail::catalog_is_ordered(),
              "CATALOG must hold exactly one entry per OperationKind, in enum order");

/// Returns the catalog entry for a kind.
[[nodiscard]] constexpr auto kind_info(OperationKind kind) -> const KindInfo& {
    return CATALOG[static_cast<std::size_t>(kind)];
}

/// Returns the canonical listing name of a kind.
[[nodiscard]] constexpr auto kind_name(OperationKind kind) -> std::string_view {
    return kind_info(kind).name;
}

/// Returns the number of operands a kind takes.
[[nodiscard]] constexpr auto arity(OperationKind kind) -> std::size_t {
    return kind_info(kind).arity;
}

/// Returns true when the kind binds a new output variable.
[[nodiscard]] constexpr auto has_output(OperationKind kind) -> bool {
    return kind_info(kind).has_output;
}

/// Resolves a kind name without producing an error value.
///
/// Accepts the canonical name, the display name and its snake-case alias.
/// Matching is case-sensitive.
[[nodiscard]] constexpr auto find_kind(std::string_view name) -> std::optional<OperationKind> {
    for (const auto& info : CATALOG) {
        if (name == info.name || name == info.display_name || name == info.alias)
            return info.kind;
    }
    return std::nullopt;
}

} // namespace gadgetgen::gadget

#endif // GADGETGEN_GADGET_KIND_HPP
