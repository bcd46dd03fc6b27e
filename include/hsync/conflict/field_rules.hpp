#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hsync::conflict {

enum class ResolutionPolicy {
    LastWriterWins,
    FirstWriterWins,
    Merge,
    Custom
};

const char* to_string(ResolutionPolicy policy) noexcept;
std::optional<ResolutionPolicy> policy_from_string(std::string_view text) noexcept;

/**
 * @brief How one named field is resolved when two copies disagree
 *
 * Higher priority wins when several rules name the same field.
 */
struct FieldConflictRule {
    std::string field_name;
    ResolutionPolicy policy = ResolutionPolicy::LastWriterWins;
    int priority = 0;
    std::optional<std::string> custom_resolver;

    friend bool operator==(const FieldConflictRule& a, const FieldConflictRule& b) {
        return a.field_name == b.field_name && a.policy == b.policy &&
               a.priority == b.priority && a.custom_resolver == b.custom_resolver;
    }
};

/**
 * @brief Immutable, priority-ordered rule table
 *
 * Built from the default habit rules plus an explicit extension list. A
 * table never changes after construction; with_extension() returns a new one.
 */
class RuleTable {
public:
    RuleTable();
    explicit RuleTable(std::vector<FieldConflictRule> extensions);
    RuleTable(std::vector<FieldConflictRule> defaults, std::vector<FieldConflictRule> extensions);

    static const std::vector<FieldConflictRule>& default_rules();

    [[nodiscard]] RuleTable with_extension(FieldConflictRule rule) const;

    /// Highest-priority rule naming `field_name`; extensions win ties
    [[nodiscard]] std::optional<FieldConflictRule> rule_for(std::string_view field_name) const;

    /// Every rule, highest priority first
    [[nodiscard]] std::vector<FieldConflictRule> all_rules() const;

    [[nodiscard]] const std::vector<FieldConflictRule>& defaults() const noexcept { return defaults_; }
    [[nodiscard]] const std::vector<FieldConflictRule>& extensions() const noexcept { return extensions_; }

    /**
     * Configuration problems: duplicate rules within one list, custom rules
     * without a resolver name, and (when `resolver_known` is given) custom
     * rules naming a resolver nobody registered.
     */
    [[nodiscard]] std::vector<std::string> validate(
        const std::function<bool(const std::string&)>& resolver_known = {}) const;

    [[nodiscard]] std::string summary() const;

private:
    std::vector<FieldConflictRule> defaults_;
    std::vector<FieldConflictRule> extensions_;
};

} // namespace hsync::conflict
