#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flowgate/core/error.hpp"
#include "flowgate/labels/label.hpp"

namespace flowgate::labels {

/// Host-registered verifier functions, keyed by verification tag.
///
/// This is the only code path that can produce a `Verified(tag)` integrity
/// label. Policy evaluation never registers verifiers and never calls them.
class VerifierRegistry {
public:
    /// Returns true when the candidate content satisfies the verifier.
    using VerifierFn = std::function<bool(std::string_view candidate)>;

    VerifierRegistry() = default;

    VerifierRegistry(const VerifierRegistry&) = delete;
    VerifierRegistry& operator=(const VerifierRegistry&) = delete;

    /// Registers a verifier for `tag`. Fails with AlreadyExists when the tag
    /// is taken and InvalidArgument when the tag cannot appear in a label.
    auto register_verifier(std::string_view tag, VerifierFn fn) -> VoidResult;

    /// Runs the verifier registered for `tag`. Returns Verified(tag) when it
    /// accepts the candidate, nullopt when it rejects or no verifier exists.
    [[nodiscard]] auto verify(std::string_view tag, std::string_view candidate) const
        -> std::optional<IntegrityLabel>;

    [[nodiscard]] auto contains(std::string_view tag) const -> bool;
    [[nodiscard]] auto tags() const -> std::vector<std::string>;

private:
    mutable std::mutex mutex_;
    std::map<std::string, VerifierFn, std::less<>> verifiers_;
};

} // namespace flowgate::labels
