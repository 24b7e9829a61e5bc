#include "flowgate/audit/audit.hpp"

#include "flowgate/core/logger.hpp"

namespace flowgate::audit {

void to_json(json& j, const SinkAuditRecord& r) {
    j = json{
        {"execution_id", r.execution_id},
        {"call_id", r.call_id},
        {"tool", r.tool},
        {"decision", r.decision},
        {"argument_confidentiality", r.argument_confidentiality},
        {"call_path", r.call_path},
        {"policy_name", r.policy_name},
        {"evaluated_at", r.evaluated_at},
    };
    if (r.side_effect_class) j["side_effect_class"] = *r.side_effect_class;
    if (r.redaction_applied) j["redaction_applied"] = *r.redaction_applied;
    if (r.witness) j["witness"] = *r.witness;
}

auto transport_outcome_to_string(TransportOutcome outcome) -> std::string_view {
    switch (outcome) {
        case TransportOutcome::Passed: return "Passed";
        case TransportOutcome::Blocked: return "Blocked";
    }
    return "Blocked";
}

auto transport_guard(const SinkAuditRecord& record) -> TransportOutcome {
    if (record.decision.is_deny()) return TransportOutcome::Blocked;
    if (record.side_effect_class == policy::SideEffectClass::ExternalWrite &&
        !record.redaction_applied.value_or(false)) {
        return TransportOutcome::Blocked;
    }
    return TransportOutcome::Passed;
}

void LogAuditSink::record(const SinkAuditRecord& record) {
    LOG_INFO("audit {}", json(record).dump());
}

void CollectingAuditSink::record(const SinkAuditRecord& record) {
    std::lock_guard lock(mutex_);
    records_.push_back(record);
}

auto CollectingAuditSink::records() const -> std::vector<SinkAuditRecord> {
    std::lock_guard lock(mutex_);
    return records_;
}

void CollectingAuditSink::clear() {
    std::lock_guard lock(mutex_);
    records_.clear();
}

} // namespace flowgate::audit
