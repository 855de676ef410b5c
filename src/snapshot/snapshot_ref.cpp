#include "snapshot/snapshot_ref.hpp"

#include "common/json_util.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

const char* snapshot_strategy_to_string(SnapshotStrategyKind kind) noexcept {
    switch (kind) {
        case SnapshotStrategyKind::kTableCopy: return "table_copy";
        case SnapshotStrategyKind::kFileCopy:  return "file_copy";
    }
    return "table_copy";
}

std::optional<SnapshotStrategyKind> snapshot_strategy_from_string(std::string_view text) {
    if (text == "table_copy") {
        return SnapshotStrategyKind::kTableCopy;
    }
    if (text == "file_copy") {
        return SnapshotStrategyKind::kFileCopy;
    }
    return std::nullopt;
}

std::string snapshot_ref_to_json(const SnapshotRef& ref) {
    return fmt::format(
        R"({{"id": {}, "created_at": {}, "backend": {}, "strategy": {}, "tables": {}, "location": {}}})",
        json_quote(ref.id),
        json_quote(format_iso8601(ref.created_at)),
        json_quote(backend_to_string(ref.backend)),
        json_quote(snapshot_strategy_to_string(ref.strategy)),
        json_string_array(ref.tables),
        json_quote(ref.location));
}

std::expected<SnapshotRef, std::string> snapshot_ref_from_node(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return std::unexpected(std::string{"snapshot_ref: not a mapping"});
    }

    try {
        SnapshotRef ref;
        ref.id = node["id"].as<std::string>();

        const auto created = parse_iso8601(node["created_at"].as<std::string>());
        if (!created) {
            return std::unexpected(fmt::format("snapshot_ref '{}': invalid created_at", ref.id));
        }
        ref.created_at = *created;

        const auto backend = backend_from_string(node["backend"].as<std::string>());
        if (!backend) {
            return std::unexpected(fmt::format("snapshot_ref '{}': unknown backend", ref.id));
        }
        ref.backend = *backend;

        const auto strategy = snapshot_strategy_from_string(node["strategy"].as<std::string>());
        if (!strategy) {
            return std::unexpected(fmt::format("snapshot_ref '{}': unknown strategy", ref.id));
        }
        ref.strategy = *strategy;

        if (const auto tables = node["tables"]; tables && tables.IsSequence()) {
            for (const auto& item : tables) {
                ref.tables.push_back(item.as<std::string>());
            }
        }
        if (const auto location = node["location"]; location && !location.IsNull()) {
            ref.location = location.as<std::string>();
        }
        return ref;
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("snapshot_ref: {}", e.what()));
    }
}
