//! # Gadget Template Registry
//!
//! One render function per gadget kind. Each function substitutes the label,
//! the output and the operand identifiers into a fixed multi-line template of
//! Rust code written against the sapling-crypto gadget API and returns the
//! text. Nothing else happens: no state, no I/O, no caching. Identical inputs
//! always give byte-identical output, and any number of threads may call in.
//!
//! ## Templates
//!
//! ```text
//! witness                 let O = ecc::EdwardsPoint::witness(
//!                             cs.namespace(|| "L"),
//!                             point.map(jubjub::ExtendedPoint::from))?;
//! assert_not_small_order  point.assert_not_small_order(cs.namespace(|| "L"))?;
//! fr_as_binary_le         let O = boolean::field_into_boolean_vec_le(
//!                             cs.namespace(|| "L"), fr)?;
//! ec_mul_const            let O = ecc::fixed_base_multiplication(
//!                             cs.namespace(|| "L"),
//!                             &base,
//!                             &scalar,
//!                         )?;
//! ec_add                  let O = a.add(cs.namespace(|| "L"), &b)?;
//! emit_ec                 point.inputize(cs.namespace(|| "L"))?;
//! ```
//!
//! Fragments have no trailing newline.

#ifndef GADGETGEN_GADGET_REGISTRY_HPP
#define GADGETGEN_GADGET_REGISTRY_HPP

#include "gadgetgen/common.hpp"
#include "gadgetgen/gadget/error.hpp"
#include "gadgetgen/gadget/identifier.hpp"
#include "gadgetgen/gadget/kind.hpp"
#include "gadgetgen/gadget/record.hpp"

#include <string>
#include <string_view>

namespace gadgetgen::gadget {

// ============================================================================
// Dispatch
// ============================================================================

/// Resolves a kind name against the catalog.
///
/// Unknown names fail with an unresolvable-kind error (G001) and never match
/// a renderer.
[[nodiscard]] auto lookup_kind(std::string_view name, uint32_t line = 0)
    -> Result<OperationKind, GadgetError>;

// ============================================================================
// Label Literals
// ============================================================================

/// Returns true if `label` is valid UTF-8 and so can be written as a literal.
[[nodiscard]] auto is_escapable(std::string_view label) -> bool;

/// Escapes `label` for the inside of a Rust string literal (no quotes).
///
/// Precondition: `is_escapable(label)`.
[[nodiscard]] auto escape_label(std::string_view label) -> std::string;

/// Returns `label` as a complete quoted literal, or G004 if it is not UTF-8.
[[nodiscard]] auto quote_label(std::string_view label) -> Result<std::string, GadgetError>;

// ============================================================================
// Per-kind Renderers
// ============================================================================
//
// `label` is the already-escaped literal body (see `escape_label`).

auto render_witness(std::string_view label, const Identifier& out, const Identifier& point)
    -> std::string;

auto render_assert_not_small_order(std::string_view label, const Identifier& point)
    -> std::string;

auto render_field_to_bits(std::string_view label, const Identifier& out,
                          const Identifier& field_element) -> std::string;

auto render_fixed_base_scalar_mul(std::string_view label, const Identifier& out,
                                  const Identifier& scalar, const Identifier& base)
    -> std::string;

auto render_point_add(std::string_view label, const Identifier& out, const Identifier& a,
                      const Identifier& b) -> std::string;

auto render_expose_input(std::string_view label, const Identifier& point) -> std::string;

// ============================================================================
// Record Rendering
// ============================================================================

/// Renders one record.
///
/// Re-checks the record's shape (G002/G003) and label (G004) and then
/// dispatches on `record.kind` to the matching renderer.
[[nodiscard]] auto render(const OperationRecord& record) -> Result<std::string, GadgetError>;

} // namespace gadgetgen::gadget

#endif // GADGETGEN_GADGET_REGISTRY_HPP
