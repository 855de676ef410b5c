// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 GateConfig 구조체로 파싱한다.
//
// [검증 규칙]
// - database.backend    : sqlite | postgres (그 외 오류)
// - snapshot.strategy   : auto | table_copy | file_copy (그 외 오류)
// - protected_tables[].policy : escalate_one | escalate_to_critical (그 외 오류)
// - gate.approval_timeout : 0 이거나 형식 오류면 오류
// - row_count_threshold_low_medium < row_count_threshold_medium_high
// - global.log_level    : debug | info | warn | error (그 외 오류)
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include "logger/log_types.hpp"

#include <charconv>
#include <cstdlib>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr const char* kDefaultConfigPath = "config/dbsafe.yaml";

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: uint64 필드. 없으면 fallback, 형식 오류는 YAML::BadConversion.
// ---------------------------------------------------------------------------
[[nodiscard]] std::uint64_t read_uint64(const YAML::Node& node, std::uint64_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::uint64_t>();
}

[[nodiscard]] std::expected<GlobalConfig, std::string> parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.log_level = read_string(node["log_level"], cfg.log_level);
    if (!log_level_from_string(cfg.log_level)) {
        return std::unexpected(fmt::format("unknown global.log_level '{}'", cfg.log_level));
    }
    cfg.log_path = read_string(node["log_path"], cfg.log_path.string());
    return cfg;
}

[[nodiscard]] std::expected<DatabaseConfig, std::string> parse_database(const YAML::Node& node) {
    DatabaseConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    if (const auto backend_node = node["backend"]; backend_node) {
        const auto text    = read_string(backend_node, "");
        const auto backend = backend_from_string(text);
        if (!backend) {
            return std::unexpected(fmt::format("unknown database.backend '{}'", text));
        }
        cfg.backend = *backend;
    }
    cfg.path = read_string(node["path"], cfg.path.string());
    cfg.url  = read_string(node["url"], cfg.url);
    return cfg;
}

[[nodiscard]] std::expected<GateSettings, std::string> parse_gate(const YAML::Node& node) {
    GateSettings cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    if (const auto timeout_node = node["approval_timeout"]; timeout_node) {
        const auto raw     = read_string(timeout_node, "");
        const auto timeout = ConfigLoader::parse_duration(raw);
        if (!timeout) {
            return std::unexpected(fmt::format(
                "gate.approval_timeout '{}' must be a positive duration (e.g. 300s, 5m, 1h)", raw));
        }
        cfg.approval_timeout = *timeout;
    }

    cfg.thresholds.low_medium  = read_uint64(node["row_count_threshold_low_medium"],
                                             cfg.thresholds.low_medium);
    cfg.thresholds.medium_high = read_uint64(node["row_count_threshold_medium_high"],
                                             cfg.thresholds.medium_high);
    if (cfg.thresholds.low_medium >= cfg.thresholds.medium_high) {
        return std::unexpected(fmt::format(
            "gate.row_count_threshold_low_medium ({}) must be below row_count_threshold_medium_high ({})",
            cfg.thresholds.low_medium, cfg.thresholds.medium_high));
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: protected_tables 파싱
//   - users
//   - { name: payments, policy: escalate_to_critical }
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<ProtectedTableEntry>, std::string>
parse_protected_tables(const YAML::Node& node) {
    std::vector<ProtectedTableEntry> entries;
    if (!node || node.IsNull()) {
        return entries;
    }
    if (!node.IsSequence()) {
        return std::unexpected(std::string{"protected_tables must be a sequence"});
    }

    entries.reserve(node.size());
    for (const auto& item : node) {
        ProtectedTableEntry entry{};
        if (item.IsScalar()) {
            entry.name = item.as<std::string>();
        } else if (item.IsMap()) {
            entry.name = read_string(item["name"], "");
            if (const auto policy_node = item["policy"]; policy_node) {
                const auto text   = read_string(policy_node, "");
                const auto policy = elevation_policy_from_string(text);
                if (!policy) {
                    return std::unexpected(fmt::format(
                        "unknown protected_tables policy '{}' for table '{}'", text, entry.name));
                }
                entry.policy = *policy;
            }
        } else {
            return std::unexpected(std::string{"protected_tables entries must be a name or a map"});
        }

        if (entry.name.empty()) {
            return std::unexpected(std::string{"protected_tables entry without a name"});
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

[[nodiscard]] std::expected<SnapshotConfig, std::string> parse_snapshot(const YAML::Node& node) {
    SnapshotConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.dir = read_string(node["dir"], cfg.dir.string());
    if (const auto strategy_node = node["strategy"]; strategy_node) {
        const auto text = read_string(strategy_node, "auto");
        if (text != "auto") {
            const auto strategy = snapshot_strategy_from_string(text);
            if (!strategy) {
                return std::unexpected(fmt::format("unknown snapshot.strategy '{}'", text));
            }
            cfg.strategy = *strategy;
        }
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 섹션 하나를 파싱하고 오류에 섹션 이름을 붙인다.
// ---------------------------------------------------------------------------
template <typename T, typename Fn>
[[nodiscard]] std::expected<T, std::string> parse_section(const YAML::Node& root,
                                                          const char*       name,
                                                          Fn                fn) {
    try {
        auto parsed = fn(root[name]);
        if (!parsed) {
            return std::unexpected(fmt::format("config_loader: {}", parsed.error()));
        }
        return std::move(*parsed);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config_loader: error parsing '{}' section: {}", name, e.what()));
    }
}

[[nodiscard]] std::expected<GateConfig, std::string> parse_root(const YAML::Node& root) {
    GateConfig cfg{};

    if (!root || root.IsNull()) {
        return cfg;  // 빈 파일: 기본값
    }
    if (!root.IsMap()) {
        return std::unexpected(std::string{"config_loader: top-level is not a YAML map"});
    }

    auto global = parse_section<GlobalConfig>(root, "global", parse_global);
    if (!global) {
        return std::unexpected(global.error());
    }
    cfg.global = std::move(*global);

    auto database = parse_section<DatabaseConfig>(root, "database", parse_database);
    if (!database) {
        return std::unexpected(database.error());
    }
    cfg.database = std::move(*database);

    auto gate = parse_section<GateSettings>(root, "gate", parse_gate);
    if (!gate) {
        return std::unexpected(gate.error());
    }
    cfg.gate = *gate;

    auto tables = parse_section<std::vector<ProtectedTableEntry>>(root, "protected_tables",
                                                                  parse_protected_tables);
    if (!tables) {
        return std::unexpected(tables.error());
    }
    cfg.protected_tables = std::move(*tables);

    auto snapshot = parse_section<SnapshotConfig>(root, "snapshot", parse_snapshot);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    cfg.snapshot = std::move(*snapshot);

    try {
        if (const auto audit = root["audit"]; audit && audit.IsMap()) {
            cfg.audit.path = read_string(audit["path"], cfg.audit.path.string());
        }
        if (const auto approval = root["approval"]; approval && approval.IsMap()) {
            cfg.approval.socket_path = read_string(approval["socket_path"], cfg.approval.socket_path.string());
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config_loader: error parsing 'audit'/'approval' section: {}", e.what()));
    }

    return cfg;
}

}  // namespace

std::optional<std::chrono::seconds> ConfigLoader::parse_duration(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || value == 0) {
        return std::nullopt;
    }

    const std::string_view unit(ptr, static_cast<std::size_t>(text.data() + text.size() - ptr));
    if (unit.empty() || unit == "s") {
        return std::chrono::seconds{value};
    }
    if (unit == "m") {
        return std::chrono::seconds{value * 60};
    }
    if (unit == "h") {
        return std::chrono::seconds{value * 3600};
    }
    return std::nullopt;
}

void ConfigLoader::apply_env_overrides(GateConfig& cfg) {
    if (const char* url = std::getenv("DATABASE_URL"); url != nullptr && *url != '\0') {
        cfg.database.url = url;
        spdlog::debug("config_loader: database.url overridden by DATABASE_URL");
    }
    if (const char* path = std::getenv("DBSAFE_DB_PATH"); path != nullptr && *path != '\0') {
        cfg.database.path = path;
        spdlog::debug("config_loader: database.path overridden by DBSAFE_DB_PATH");
    }
}

std::expected<GateConfig, std::string> ConfigLoader::load_text(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format("config_loader: YAML parse error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config_loader: YAML error: {}", e.what()));
    }

    auto cfg = parse_root(root);
    if (!cfg) {
        spdlog::error("{}", cfg.error());
        return cfg;
    }
    apply_env_overrides(*cfg);
    return cfg;
}

std::expected<GateConfig, std::string> ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format("config_loader: cannot resolve config path '{}': {}",
                                            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format("config_loader: cannot open file '{}': {}",
                                            canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error in '{}': {}",
                                            canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    auto cfg = parse_root(root);
    if (!cfg) {
        spdlog::error("{}", cfg.error());
        return cfg;
    }
    apply_env_overrides(*cfg);

    spdlog::info("config_loader: backend={} protected_tables={} approval_timeout={}s",
                 backend_to_string(cfg->database.backend), cfg->protected_tables.size(),
                 cfg->gate.approval_timeout.count());
    return cfg;
}

std::expected<GateConfig, std::string>
ConfigLoader::resolve(const std::optional<std::filesystem::path>& cli_path) {
    if (cli_path) {
        return load(*cli_path);
    }
    if (const char* env = std::getenv("DBSAFE_CONFIG"); env != nullptr && *env != '\0') {
        return load(env);
    }

    std::error_code ec;
    if (std::filesystem::exists(kDefaultConfigPath, ec)) {
        return load(kDefaultConfigPath);
    }

    spdlog::info("config_loader: no config file, using defaults");
    GateConfig cfg{};
    apply_env_overrides(cfg);
    return cfg;
}
