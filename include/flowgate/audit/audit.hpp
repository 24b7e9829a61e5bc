#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "flowgate/core/types.hpp"
#include "flowgate/decision/decision.hpp"
#include "flowgate/policy/policy.hpp"

namespace flowgate::audit {

/// Per-call record handed to the audit pipeline.
///
/// Confidentiality appears only as tag names per argument ("*" when the
/// closure failed and the worst case was assumed). Values never appear.
struct SinkAuditRecord {
    std::string execution_id;
    std::string call_id;
    std::string tool;
    decision::Decision decision;
    std::optional<policy::SideEffectClass> side_effect_class;  // unset for unlisted tools
    std::optional<bool> redaction_applied;                     // ExternalWrite tools only
    decision::LlmCallPath call_path = decision::LlmCallPath::Planner;
    std::map<std::string, std::vector<std::string>> argument_confidentiality;
    std::string policy_name;
    Timestamp evaluated_at = 0;
    std::optional<json> witness;
};

void to_json(json& j, const SinkAuditRecord& r);

enum class TransportOutcome {
    Passed,
    Blocked,
};

auto transport_outcome_to_string(TransportOutcome outcome) -> std::string_view;

/// Adapter-side check run before a payload leaves the process. Denied calls
/// are blocked, and so is any sink payload that was not redacted.
[[nodiscard]] auto transport_guard(const SinkAuditRecord& record) -> TransportOutcome;

/// Receiver of audit records. Implementations must be safe to call from
/// concurrent evaluations.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void record(const SinkAuditRecord& record) = 0;
};

/// Writes each record as one JSON line to the flowgate logger.
class LogAuditSink final : public AuditSink {
public:
    void record(const SinkAuditRecord& record) override;
};

/// Keeps records in memory, in arrival order.
class CollectingAuditSink final : public AuditSink {
public:
    void record(const SinkAuditRecord& record) override;

    [[nodiscard]] auto records() const -> std::vector<SinkAuditRecord>;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<SinkAuditRecord> records_;
};

} // namespace flowgate::audit
