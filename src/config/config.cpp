#include "hsync/config/config.hpp"

#include "hsync/conflict/resolver.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace hsync {
namespace {

using nlohmann::json;

Result<conflict::FieldConflictRule> parse_rule(const json& node) {
    if (!node.is_object()) {
        return Err<conflict::FieldConflictRule>(ErrorCode::ConfigError, "Conflict rule must be an object");
    }
    conflict::FieldConflictRule rule;
    rule.field_name = node.value("field", std::string());
    if (rule.field_name.empty()) {
        return Err<conflict::FieldConflictRule>(ErrorCode::ConfigError, "Conflict rule without a field name");
    }

    const auto policy_text = node.value("policy", std::string("last_writer_wins"));
    auto policy = conflict::policy_from_string(policy_text);
    if (!policy) {
        return Err<conflict::FieldConflictRule>(ErrorCode::ConfigError,
                                                "Unknown policy '" + policy_text + "' for field " + rule.field_name);
    }
    rule.policy = *policy;
    rule.priority = node.value("priority", 0);

    if (node.contains("resolver")) {
        rule.custom_resolver = node.at("resolver").get<std::string>();
    }
    if (rule.policy == conflict::ResolutionPolicy::Custom &&
        (!rule.custom_resolver || rule.custom_resolver->empty())) {
        return Err<conflict::FieldConflictRule>(ErrorCode::ConfigError,
                                                "Custom rule for field " + rule.field_name + " has no resolver");
    }
    return Ok(std::move(rule));
}

Result<EngineConfig> from_json(const json& root) {
    EngineConfig config;

    if (root.contains("conflict")) {
        const auto& conflict_node = root.at("conflict");
        if (conflict_node.contains("extensions")) {
            for (const auto& node : conflict_node.at("extensions")) {
                auto rule = parse_rule(node);
                if (rule.is_error()) {
                    return Err<EngineConfig>(rule.error());
                }
                config.conflict.extensions.push_back(rule.value());
            }
        }
    }

    if (root.contains("migration")) {
        const auto& m = root.at("migration");
        config.migration.user_id = m.value("user_id", config.migration.user_id);
        config.migration.dry_run = m.value("dry_run", config.migration.dry_run);
        config.migration.auto_retry_after_recovery =
            m.value("auto_retry_after_recovery", config.migration.auto_retry_after_recovery);
        config.migration.unusual_date_past_days =
            m.value("unusual_date_past_days", config.migration.unusual_date_past_days);
        config.migration.unusual_date_future_days =
            m.value("unusual_date_future_days", config.migration.unusual_date_future_days);
    }

    if (root.contains("sync")) {
        config.sync.max_batch_retries = root.at("sync").value("max_batch_retries", config.sync.max_batch_retries);
        if (config.sync.max_batch_retries < 0) {
            return Err<EngineConfig>(ErrorCode::ConfigError, "sync.max_batch_retries must not be negative");
        }
    }

    if (root.contains("logging")) {
        config.logging.level = root.at("logging").value("level", config.logging.level);
    }

    const auto builtins = conflict::CustomResolverRegistry::with_builtins();
    auto problems = config.conflict.rule_table().validate(
        [&builtins](const std::string& name) { return builtins.contains(name); });
    if (!problems.empty()) {
        std::string message = "Invalid conflict rules:";
        for (const auto& problem : problems) {
            message += " " + problem + ";";
        }
        return Err<EngineConfig>(ErrorCode::ConfigError, message);
    }
    return Ok(std::move(config));
}

} // namespace

Result<EngineConfig> parse_config(const std::string& json_text) {
    try {
        return from_json(json::parse(json_text));
    } catch (const json::exception& e) {
        return Err<EngineConfig>(ErrorCode::ConfigError, std::string("Malformed config: ") + e.what());
    }
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(ErrorCode::ConfigError, "Cannot open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto config = parse_config(buffer.str());
    if (config.is_ok()) {
        spdlog::debug("[Config] loaded path={} extensions={}", path.string(),
                      config.value().conflict.extensions.size());
    }
    return config;
}

Result<void> apply_logging(const LoggingConfig& logging) {
    auto level = spdlog::level::from_str(logging.level);
    // from_str maps unknown names to off; only accept that for "off" itself
    if (level == spdlog::level::off && logging.level != "off") {
        return Err<void>(ErrorCode::ConfigError, "Unknown log level: " + logging.level);
    }
    spdlog::set_level(level);
    return Ok();
}

} // namespace hsync
