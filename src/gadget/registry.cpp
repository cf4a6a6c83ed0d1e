//! # Gadget Template Registry
//!
//! Template interpolation for every gadget kind plus the closed dispatch
//! from `OperationKind` to renderer.

#include "gadgetgen/gadget/registry.hpp"

#include "gadgetgen/log/log.hpp"

#include <cstdint>
#include <cstdio>

namespace gadgetgen::gadget {

// ============================================================================
// Dispatch
// ============================================================================

auto lookup_kind(std::string_view name, uint32_t line) -> Result<OperationKind, GadgetError> {
    if (auto kind = find_kind(name)) {
        return *kind;
    }
    GADGETGEN_LOG_DEBUG("registry", "No catalog entry for kind '" << name << "'");
    return GadgetError::unresolvable_kind(name, line);
}

// ============================================================================
// Label Literals
// ============================================================================

namespace {

/// Length of the UTF-8 sequence starting at `s[i]`, or 0 if it is invalid.
auto utf8_sequence_length(std::string_view s, size_t i) -> size_t {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    auto is_cont = [&](size_t k) { return k < s.size() && (byte(k) & 0xC0) == 0x80; };

    unsigned char lead = byte(i);
    if (lead < 0x80)
        return 1;

    size_t len = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    for (size_t k = 1; k < len; ++k) {
        if (!is_cont(i + k))
            return 0;
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }

    // Overlong forms, UTF-16 surrogates and values past U+10FFFF
    static constexpr uint32_t MIN_FOR_LEN[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < MIN_FOR_LEN[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
        return 0;

    return len;
}

} // namespace

auto is_escapable(std::string_view label) -> bool {
    size_t i = 0;
    while (i < label.size()) {
        size_t len = utf8_sequence_length(label, i);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

auto escape_label(std::string_view label) -> std::string {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        auto uc = static_cast<unsigned char>(c);
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\0':
            out += "\\0";
            break;
        default:
            if (uc < 0x20 || uc == 0x7F) {
                char buf[12];
                std::snprintf(buf, sizeof(buf), "\\u{%x}", static_cast<unsigned>(uc));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

auto quote_label(std::string_view label) -> Result<std::string, GadgetError> {
    if (!is_escapable(label)) {
        return GadgetError::unescapable_label("not valid UTF-8");
    }
    return "\"" + escape_label(label) + "\"";
}

// ============================================================================
// Per-kind Renderers
// ============================================================================

namespace {

auto ns(std::string_view label) -> std::string {
    return "cs.namespace(|| \"" + std::string(label) + "\")";
}

} // namespace

auto render_witness(std::string_view label, const Identifier& out, const Identifier& point)
    -> std::string {
    return "let " + out.str() + " = ecc::EdwardsPoint::witness(\n    " + ns(label) + ",\n    " +
           point.str() + ".map(jubjub::ExtendedPoint::from))?;";
}

auto render_assert_not_small_order(std::string_view label, const Identifier& point)
    -> std::string {
    return point.str() + ".assert_not_small_order(" + ns(label) + ")?;";
}

auto render_field_to_bits(std::string_view label, const Identifier& out,
                          const Identifier& field_element) -> std::string {
    return "let " + out.str() + " = boolean::field_into_boolean_vec_le(\n    " + ns(label) +
           ", " + field_element.str() + ")?;";
}

auto render_fixed_base_scalar_mul(std::string_view label, const Identifier& out,
                                  const Identifier& scalar, const Identifier& base)
    -> std::string {
    return "let " + out.str() + " = ecc::fixed_base_multiplication(\n    " + ns(label) +
           ",\n    &" + base.str() + ",\n    &" + scalar.str() + ",\n)?;";
}

auto render_point_add(std::string_view label, const Identifier& out, const Identifier& a,
                      const Identifier& b) -> std::string {
    return "let " + out.str() + " = " + a.str() + ".add(" + ns(label) + ", &" + b.str() + ")?;";
}

auto render_expose_input(std::string_view label, const Identifier& point) -> std::string {
    return point.str() + ".inputize(" + ns(label) + ")?;";
}

// ============================================================================
// Record Rendering
// ============================================================================

auto render(const OperationRecord& record) -> Result<std::string, GadgetError> {
    auto shape = validate_shape(record);
    if (is_err(shape)) {
        return unwrap_err(shape);
    }

    if (!is_escapable(record.label)) {
        return GadgetError::unescapable_label(record.kind, "not valid UTF-8", record.line);
    }
    const std::string label = escape_label(record.label);
    const auto& ops = record.operands;

    // Shape was checked above, so `output` is engaged exactly for the
    // producing kinds and `ops` has the catalog arity.
    switch (record.kind) {
    case OperationKind::Witness:
        return render_witness(label, *record.output, ops[0]);
    case OperationKind::AssertNotSmallOrder:
        return render_assert_not_small_order(label, ops[0]);
    case OperationKind::FieldToBits:
        return render_field_to_bits(label, *record.output, ops[0]);
    case OperationKind::FixedBaseScalarMul:
        return render_fixed_base_scalar_mul(label, *record.output, ops[0], ops[1]);
    case OperationKind::PointAdd:
        return render_point_add(label, *record.output, ops[0], ops[1]);
    case OperationKind::ExposeInput:
        return render_expose_input(label, ops[0]);
    }
    return GadgetError::unresolvable_kind(
        "#" + std::to_string(static_cast<unsigned>(record.kind)), record.line);
}

} // namespace gadgetgen::gadget
