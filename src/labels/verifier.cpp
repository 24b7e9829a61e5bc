#include "flowgate/labels/verifier.hpp"

#include "flowgate/core/logger.hpp"

namespace flowgate::labels {

auto VerifierRegistry::register_verifier(std::string_view tag, VerifierFn fn) -> VoidResult {
    auto pattern = IntegrityPattern::parse("Verified(" + std::string(tag) + ")");
    if (!pattern || !fn) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Invalid verifier registration", std::string(tag)));
    }

    std::lock_guard lock(mutex_);
    if (verifiers_.contains(tag)) {
        return std::unexpected(make_error(
            ErrorCode::AlreadyExists, "Verifier already registered", std::string(tag)));
    }
    verifiers_.emplace(std::string(tag), std::move(fn));
    LOG_INFO("Registered verifier for tag '{}'", tag);
    return {};
}

auto VerifierRegistry::verify(std::string_view tag, std::string_view candidate) const
    -> std::optional<IntegrityLabel> {
    VerifierFn fn;
    {
        std::lock_guard lock(mutex_);
        auto it = verifiers_.find(tag);
        if (it == verifiers_.end()) {
            LOG_WARN("No verifier registered for tag '{}'", tag);
            return std::nullopt;
        }
        fn = it->second;
    }

    if (!fn(candidate)) {
        LOG_DEBUG("Verifier '{}' rejected candidate", tag);
        return std::nullopt;
    }
    return IntegrityLabel(IntegrityLevel::Verified, std::string(tag));
}

auto VerifierRegistry::contains(std::string_view tag) const -> bool {
    std::lock_guard lock(mutex_);
    return verifiers_.contains(tag);
}

auto VerifierRegistry::tags() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(verifiers_.size());
    for (const auto& [tag, _] : verifiers_) {
        result.push_back(tag);
    }
    return result;
}

} // namespace flowgate::labels
