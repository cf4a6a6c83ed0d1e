#include "gadgetgen/gadget/emitter.hpp"

#include "gadgetgen/gadget/registry.hpp"
#include "gadgetgen/log/log.hpp"

namespace gadgetgen::gadget {

Emitter::Emitter(EmitOptions options) : options_(std::move(options)) {}

void Emitter::declare_input(const Identifier& name) {
    symbols_.declare_input(name);
}

void Emitter::fail(GadgetError error) {
    GADGETGEN_LOG_ERROR("emit", error.to_string());
    errors_.push_back(std::move(error));
    if (!options_.keep_going) {
        stopped_ = true;
    }
}

auto Emitter::emit(const OperationRecord& record) -> bool {
    if (stopped_)
        return false;

    if (options_.strict) {
        auto checked = validate_shape(record);
        if (is_ok(checked)) {
            checked = symbols_.check(record);
        }
        if (is_err(checked)) {
            fail(std::move(unwrap_err(checked)));
            return false;
        }
    }

    auto text = render(record);
    if (is_err(text)) {
        fail(std::move(unwrap_err(text)));
        return false;
    }

    if (options_.strict) {
        symbols_.bind(record);
    }

    buffer_ += unwrap(text);
    buffer_ += options_.separator;
    ++emitted_;

    GADGETGEN_LOG_TRACE("emit", "Emitted " << kind_name(record.kind) << " \"" << record.label
                                           << "\"");
    return true;
}

auto Emitter::emit_all(const std::vector<OperationRecord>& records) -> std::size_t {
    std::size_t appended = 0;
    for (const auto& record : records) {
        if (stopped_)
            break;
        if (emit(record))
            ++appended;
    }
    GADGETGEN_LOG_DEBUG("emit", "Emitted " << appended << " of " << records.size()
                                           << " record(s), " << errors_.size() << " error(s)");
    return appended;
}

} // namespace gadgetgen::gadget
