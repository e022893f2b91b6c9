#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace retable::rewrite {

// Unquoted component values of a table reference. An absent level is
// std::nullopt, never an empty string.
struct TableComponents final {
    std::optional<std::string> catalog{};
    std::optional<std::string> database{};
    std::optional<std::string> name{};
};

class ComponentDecision final {
public:
    enum class Action : std::uint8_t {
        Keep = 0,
        Clear,
        SetTo
    };

    ComponentDecision() noexcept = default;

    [[nodiscard]] static ComponentDecision keep() noexcept { return ComponentDecision{}; }

    [[nodiscard]] static ComponentDecision clear() noexcept
    {
        ComponentDecision decision{};
        decision.action_ = Action::Clear;
        return decision;
    }

    [[nodiscard]] static ComponentDecision set_to(std::string value)
    {
        ComponentDecision decision{};
        decision.action_ = Action::SetTo;
        decision.value_ = std::move(value);
        return decision;
    }

    [[nodiscard]] Action action() const noexcept { return action_; }
    [[nodiscard]] bool is_keep() const noexcept { return action_ == Action::Keep; }
    [[nodiscard]] bool is_clear() const noexcept { return action_ == Action::Clear; }
    [[nodiscard]] bool is_set() const noexcept { return action_ == Action::SetTo; }

    // Only meaningful for SetTo.
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    friend bool operator==(const ComponentDecision& lhs, const ComponentDecision& rhs) noexcept
    {
        return lhs.action_ == rhs.action_ && (lhs.action_ != Action::SetTo || lhs.value_ == rhs.value_);
    }

private:
    Action action_ = Action::Keep;
    std::string value_{};
};

struct ReplacementDecision final {
    ComponentDecision catalog{};
    ComponentDecision database{};
    ComponentDecision name{};
};

using ReplacementFunction = std::function<ReplacementDecision(const TableComponents&)>;

// Present components replace, absent ones are kept. Matches handlers that only
// return the parts they want to change.
[[nodiscard]] inline ReplacementDecision replace_present(const TableComponents& replacement)
{
    const auto to_decision = [](const std::optional<std::string>& value) {
        return value ? ComponentDecision::set_to(*value) : ComponentDecision::keep();
    };

    ReplacementDecision decision{};
    decision.catalog = to_decision(replacement.catalog);
    decision.database = to_decision(replacement.database);
    decision.name = to_decision(replacement.name);
    return decision;
}

}  // namespace retable::rewrite
