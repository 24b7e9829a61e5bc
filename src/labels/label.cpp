#include "flowgate/labels/label.hpp"

#include <algorithm>

namespace flowgate::labels {

namespace {

constexpr std::string_view kVerifiedPrefix = "Verified(";

auto valid_tag(std::string_view tag) -> bool {
    if (tag.empty()) return false;
    return std::ranges::none_of(tag, [](char c) {
        return c == '(' || c == ')' || c == ' ' || c == '\t' || c == '\n';
    });
}

auto render(IntegrityLevel level, std::string_view tag) -> std::string {
    switch (level) {
        case IntegrityLevel::Untrusted: return "Untrusted";
        case IntegrityLevel::Trusted: return "Trusted";
        case IntegrityLevel::Verified: return "Verified(" + std::string(tag) + ")";
    }
    return "Untrusted";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Integrity
// ---------------------------------------------------------------------------

auto IntegrityLabel::to_string() const -> std::string {
    return render(level_, tag_);
}

auto join(const IntegrityLabel& a, const IntegrityLabel& b) -> IntegrityLabel {
    if (a == b) return a;
    return IntegrityLabel::untrusted();
}

auto IntegrityPattern::parse(std::string_view text) -> std::optional<IntegrityPattern> {
    if (text == "Untrusted") return IntegrityPattern(IntegrityLevel::Untrusted, {});
    if (text == "Trusted") return IntegrityPattern(IntegrityLevel::Trusted, {});

    if (text.starts_with(kVerifiedPrefix) && text.ends_with(')')) {
        auto tag = text.substr(kVerifiedPrefix.size(),
                               text.size() - kVerifiedPrefix.size() - 1);
        if (!valid_tag(tag)) return std::nullopt;
        return IntegrityPattern(IntegrityLevel::Verified, std::string(tag));
    }
    return std::nullopt;
}

auto IntegrityPattern::matches(const IntegrityLabel& label) const -> bool {
    if (label.level() != level_) return false;
    return level_ != IntegrityLevel::Verified || label.tag() == tag_;
}

auto IntegrityPattern::to_string() const -> std::string {
    return render(level_, tag_);
}

// ---------------------------------------------------------------------------
// Confidentiality
// ---------------------------------------------------------------------------

auto ConfidentialityLabel::saturated() -> ConfidentialityLabel {
    ConfidentialityLabel label;
    label.saturated_ = true;
    return label;
}

auto ConfidentialityLabel::contains(std::string_view tag) const -> bool {
    if (saturated_) return true;
    return tags_.contains(std::string(tag));
}

auto ConfidentialityLabel::intersection(const std::vector<std::string>& forbidden) const
    -> std::vector<std::string> {
    std::vector<std::string> hits;
    for (const auto& tag : forbidden) {
        if (contains(tag)) hits.push_back(tag);
    }
    return hits;
}

auto ConfidentialityLabel::tag_names() const -> std::vector<std::string> {
    if (saturated_) return {"*"};
    return {tags_.begin(), tags_.end()};
}

auto join(const ConfidentialityLabel& a, const ConfidentialityLabel& b)
    -> ConfidentialityLabel {
    if (a.is_saturated() || b.is_saturated()) return ConfidentialityLabel::saturated();

    auto tags = a.tags();
    tags.insert(b.tags().begin(), b.tags().end());
    return ConfidentialityLabel(std::move(tags));
}

auto join(const Label& a, const Label& b) -> Label {
    return Label{
        .integrity = join(a.integrity, b.integrity),
        .confidentiality = join(a.confidentiality, b.confidentiality),
    };
}

} // namespace flowgate::labels
