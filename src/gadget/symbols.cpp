#include "gadgetgen/gadget/symbols.hpp"

#include "gadgetgen/log/log.hpp"

namespace gadgetgen::gadget {

void SymbolTable::declare_input(const Identifier& name) {
    symbols_.insert_or_assign(name, Origin::Input);
}

auto SymbolTable::is_declared(const Identifier& name) const -> bool {
    return symbols_.contains(name);
}

auto SymbolTable::check(const OperationRecord& record) const -> Result<bool, GadgetError> {
    for (const auto& operand : record.operands) {
        if (!is_declared(operand)) {
            return GadgetError::undeclared_operand(record.kind, operand.view(), record.line);
        }
    }
    return true;
}

void SymbolTable::bind(const OperationRecord& record) {
    if (!record.output)
        return;

    auto [it, inserted] = symbols_.insert_or_assign(*record.output, Origin::Output);
    if (!inserted) {
        GADGETGEN_LOG_DEBUG("symbols", "'" << it->first << "' rebound by " << kind_name(record.kind)
                                           << " (line " << record.line << ")");
    }
}

} // namespace gadgetgen::gadget
