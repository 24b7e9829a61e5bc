#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowgate::labels {

enum class IntegrityLevel {
    Untrusted,
    Trusted,
    Verified,
};

class VerifierRegistry;

/// Integrity element of a value's label.
///
/// `Untrusted < Trusted`; `Verified(tag)` is incomparable with both and only
/// ever equal to `Verified(tag)` with the same tag. Only a VerifierRegistry
/// can construct a Verified label.
class IntegrityLabel {
public:
    [[nodiscard]] static auto untrusted() -> IntegrityLabel { return {IntegrityLevel::Untrusted, {}}; }
    [[nodiscard]] static auto trusted() -> IntegrityLabel { return {IntegrityLevel::Trusted, {}}; }

    [[nodiscard]] auto level() const noexcept -> IntegrityLevel { return level_; }

    /// Verification tag; empty unless level() == Verified.
    [[nodiscard]] auto tag() const noexcept -> std::string_view { return tag_; }

    [[nodiscard]] auto is_untrusted() const noexcept -> bool { return level_ == IntegrityLevel::Untrusted; }

    /// "Untrusted", "Trusted" or "Verified(<tag>)".
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const IntegrityLabel&) const -> bool = default;

private:
    friend class VerifierRegistry;

    IntegrityLabel(IntegrityLevel level, std::string tag)
        : level_(level), tag_(std::move(tag)) {}

    IntegrityLevel level_;
    std::string tag_;
};

/// Join toward the weaker element. Anything but two equal labels joins to
/// Untrusted: a verified fact never launders an untrusted or merely trusted
/// co-dependency, and two different verification tags do not combine.
[[nodiscard]] auto join(const IntegrityLabel& a, const IntegrityLabel& b) -> IntegrityLabel;

/// Policy-side description of an integrity label. Patterns are parsed from
/// policy text and matched against labels; they can never become labels.
class IntegrityPattern {
public:
    /// Parses "Untrusted", "Trusted" or "Verified(<tag>)".
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<IntegrityPattern>;

    /// Exact match: Verified(tag) matches only Verified with the same tag.
    [[nodiscard]] auto matches(const IntegrityLabel& label) const -> bool;

    [[nodiscard]] auto level() const noexcept -> IntegrityLevel { return level_; }
    [[nodiscard]] auto tag() const noexcept -> std::string_view { return tag_; }
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const IntegrityPattern&) const -> bool = default;

private:
    IntegrityPattern(IntegrityLevel level, std::string tag)
        : level_(level), tag_(std::move(tag)) {}

    IntegrityLevel level_;
    std::string tag_;
};

/// Set of confidentiality tags. Join is set union.
///
/// A saturated label stands for "every tag there is"; it is only produced
/// when a closure could not be computed and the worst case must be assumed.
class ConfidentialityLabel {
public:
    ConfidentialityLabel() = default;
    explicit ConfidentialityLabel(std::set<std::string> tags) : tags_(std::move(tags)) {}

    [[nodiscard]] static auto saturated() -> ConfidentialityLabel;

    [[nodiscard]] auto tags() const noexcept -> const std::set<std::string>& { return tags_; }
    [[nodiscard]] auto is_saturated() const noexcept -> bool { return saturated_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return !saturated_ && tags_.empty(); }
    [[nodiscard]] auto contains(std::string_view tag) const -> bool;

    /// Returns the forbidden tags this label carries. A saturated label
    /// carries all of them.
    [[nodiscard]] auto intersection(const std::vector<std::string>& forbidden) const
        -> std::vector<std::string>;

    /// Tag names for audit output; a saturated label renders as {"*"}.
    [[nodiscard]] auto tag_names() const -> std::vector<std::string>;

    auto operator==(const ConfidentialityLabel&) const -> bool = default;

private:
    std::set<std::string> tags_;
    bool saturated_ = false;
};

[[nodiscard]] auto join(const ConfidentialityLabel& a, const ConfidentialityLabel& b)
    -> ConfidentialityLabel;

/// Full label carried by a value.
struct Label {
    IntegrityLabel integrity = IntegrityLabel::untrusted();
    ConfidentialityLabel confidentiality;

    auto operator==(const Label&) const -> bool = default;
};

[[nodiscard]] auto join(const Label& a, const Label& b) -> Label;

} // namespace flowgate::labels
