#include "gadgetgen/gadget/record.hpp"

#include "gadgetgen/gadget/registry.hpp"
#include "gadgetgen/log/log.hpp"

#include <cstddef>
#include <string>

namespace gadgetgen::gadget {

auto validate_shape(const OperationRecord& record) -> Result<bool, GadgetError> {
    if (static_cast<std::size_t>(record.kind) >= KIND_COUNT) {
        return GadgetError::unresolvable_kind(
            "#" + std::to_string(static_cast<unsigned>(record.kind)), record.line);
    }

    const auto& info = kind_info(record.kind);

    if (record.operands.size() != info.arity) {
        return GadgetError::arity_mismatch(record.kind, info.arity, record.operands.size(),
                                           record.line);
    }
    if (record.output.has_value() != info.has_output) {
        return GadgetError::output_mismatch(record.kind, record.output.has_value(), record.line);
    }
    return true;
}

auto make_record(std::string label, OperationKind kind, std::optional<Identifier> output,
                 std::vector<Identifier> operands, uint32_t line)
    -> Result<OperationRecord, GadgetError> {
    OperationRecord record{std::move(label), kind, std::move(output), std::move(operands), line};

    auto shape = validate_shape(record);
    if (is_err(shape)) {
        return unwrap_err(shape);
    }
    return record;
}

auto make_record(std::string label, std::string_view kind_name,
                 std::optional<std::string_view> output,
                 const std::vector<std::string_view>& operands, uint32_t line)
    -> Result<OperationRecord, GadgetError> {
    auto kind = lookup_kind(kind_name, line);
    if (is_err(kind)) {
        return unwrap_err(kind);
    }

    std::optional<Identifier> out_id;
    if (output) {
        auto parsed = Identifier::parse(*output, line);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        out_id = std::move(unwrap(parsed));
    }

    std::vector<Identifier> operand_ids;
    operand_ids.reserve(operands.size());
    for (auto text : operands) {
        auto parsed = Identifier::parse(text, line);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        operand_ids.push_back(std::move(unwrap(parsed)));
    }

    GADGETGEN_LOG_TRACE("registry", "Built " << kind_name << " record with "
                                             << operand_ids.size() << " operand(s)");
    return make_record(std::move(label), unwrap(kind), std::move(out_id), std::move(operand_ids),
                       line);
}

} // namespace gadgetgen::gadget
