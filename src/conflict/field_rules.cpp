#include "hsync/conflict/field_rules.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace hsync::conflict {
namespace {

void collect_duplicates(const std::vector<FieldConflictRule>& rules,
                        const char* list_name,
                        std::vector<std::string>& errors) {
    std::set<std::string> seen;
    std::set<std::string> reported;
    for (const auto& rule : rules) {
        if (!seen.insert(rule.field_name).second && reported.insert(rule.field_name).second) {
            errors.push_back(std::string("Duplicate ") + list_name + " rule for field: " + rule.field_name);
        }
    }
}

} // namespace

const char* to_string(ResolutionPolicy policy) noexcept {
    switch (policy) {
        case ResolutionPolicy::LastWriterWins: return "last_writer_wins";
        case ResolutionPolicy::FirstWriterWins: return "first_writer_wins";
        case ResolutionPolicy::Merge: return "merge";
        case ResolutionPolicy::Custom: return "custom";
    }
    return "last_writer_wins";
}

std::optional<ResolutionPolicy> policy_from_string(std::string_view text) noexcept {
    if (text == "last_writer_wins") return ResolutionPolicy::LastWriterWins;
    if (text == "first_writer_wins") return ResolutionPolicy::FirstWriterWins;
    if (text == "merge") return ResolutionPolicy::Merge;
    if (text == "custom") return ResolutionPolicy::Custom;
    return std::nullopt;
}

const std::vector<FieldConflictRule>& RuleTable::default_rules() {
    using P = ResolutionPolicy;
    static const std::vector<FieldConflictRule> rules = {
        // Display fields: the latest edit wins
        {"name", P::LastWriterWins, 100, std::nullopt},
        // updatedAt is always replaced by the fresh merge stamp
        {"updatedAt", P::LastWriterWins, 100, std::nullopt},
        {"description", P::LastWriterWins, 90, std::nullopt},
        {"schedule", P::LastWriterWins, 90, std::nullopt},
        {"goal", P::LastWriterWins, 90, std::nullopt},
        {"habitType", P::LastWriterWins, 90, std::nullopt},
        {"icon", P::LastWriterWins, 80, std::nullopt},
        {"color", P::LastWriterWins, 80, std::nullopt},
        {"reminder", P::LastWriterWins, 80, std::nullopt},

        // History maps are merged key by key
        {"completionHistory", P::Merge, 70, std::nullopt},
        {"difficultyHistory", P::Merge, 70, std::nullopt},
        {"actualUsage", P::Merge, 70, std::nullopt},

        {"isDeleted", P::LastWriterWins, 60, std::nullopt},
        {"baseline", P::LastWriterWins, 60, std::nullopt},
        {"target", P::LastWriterWins, 60, std::nullopt},

        {"endDate", P::Custom, 50, std::string("resolveEndDate")},

        // Provenance never moves forward
        {"startDate", P::FirstWriterWins, 20, std::nullopt},
        {"id", P::FirstWriterWins, 10, std::nullopt},
        {"createdAt", P::FirstWriterWins, 10, std::nullopt},
    };
    return rules;
}

RuleTable::RuleTable() : defaults_(default_rules()) {}

RuleTable::RuleTable(std::vector<FieldConflictRule> extensions)
    : defaults_(default_rules()), extensions_(std::move(extensions)) {}

RuleTable::RuleTable(std::vector<FieldConflictRule> defaults, std::vector<FieldConflictRule> extensions)
    : defaults_(std::move(defaults)), extensions_(std::move(extensions)) {}

RuleTable RuleTable::with_extension(FieldConflictRule rule) const {
    auto extensions = extensions_;
    extensions.push_back(std::move(rule));
    return RuleTable(defaults_, std::move(extensions));
}

std::optional<FieldConflictRule> RuleTable::rule_for(std::string_view field_name) const {
    const FieldConflictRule* best = nullptr;
    for (const auto& rule : extensions_) {
        if (rule.field_name == field_name && (best == nullptr || rule.priority > best->priority)) {
            best = &rule;
        }
    }
    for (const auto& rule : defaults_) {
        if (rule.field_name == field_name && (best == nullptr || rule.priority > best->priority)) {
            best = &rule;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

std::vector<FieldConflictRule> RuleTable::all_rules() const {
    std::vector<FieldConflictRule> rules = extensions_;
    rules.insert(rules.end(), defaults_.begin(), defaults_.end());
    std::stable_sort(rules.begin(), rules.end(), [](const auto& a, const auto& b) {
        return a.priority > b.priority;
    });
    return rules;
}

std::vector<std::string> RuleTable::validate(const std::function<bool(const std::string&)>& resolver_known) const {
    std::vector<std::string> errors;
    collect_duplicates(defaults_, "default", errors);
    collect_duplicates(extensions_, "extension", errors);

    for (const auto& rule : all_rules()) {
        if (rule.policy != ResolutionPolicy::Custom) {
            continue;
        }
        if (!rule.custom_resolver || rule.custom_resolver->empty()) {
            errors.push_back("Custom rule for field " + rule.field_name + " has no custom resolver");
        } else if (resolver_known && !resolver_known(*rule.custom_resolver)) {
            errors.push_back("Custom rule for field " + rule.field_name +
                             " names unknown resolver " + *rule.custom_resolver);
        }
    }
    return errors;
}

std::string RuleTable::summary() const {
    std::ostringstream oss;
    oss << "Conflict resolution rules:\n";
    for (const auto& rule : all_rules()) {
        oss << "- " << rule.field_name << ": " << to_string(rule.policy)
            << " (priority: " << rule.priority << ")";
        if (rule.custom_resolver) {
            oss << " resolver=" << *rule.custom_resolver;
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace hsync::conflict
