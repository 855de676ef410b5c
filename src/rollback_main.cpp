#include "app/runtime.hpp"
#include "common/json_util.hpp"
#include "config/config_loader.hpp"
#include "rollback/rollback_service.hpp"
#include "snapshot/snapshot_manager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// dbsafe-rollback CLI
//
//   dbsafe-rollback [--config <path>] list
//   dbsafe-rollback [--config <path>] restore <snapshot_id> [--yes]
//
// restore 는 --yes 가 없으면 확인을 받은 뒤 진행하며, 결과를 감사 로그에
// kind=rollback 레코드로 남긴다.
// ---------------------------------------------------------------------------

namespace {

void print_usage() {
    std::cerr << "usage:\n"
              << "  dbsafe-rollback [--config <path>] list\n"
              << "  dbsafe-rollback [--config <path>] restore <snapshot_id> [--yes]\n";
}

std::string current_user() {
    const char* user = std::getenv("USER");  // NOLINT(concurrency-mt-unsafe)
    if (user != nullptr && user[0] != '\0') {
        return user;
    }
    return "cli";
}

bool confirm(const SnapshotRef& ref) {
    std::cerr << "restore " << ref.id << " (" << snapshot_strategy_to_string(ref.strategy)
              << ", created " << format_iso8601(ref.created_at) << ") over tables:";
    for (const auto& t : ref.tables) {
        std::cerr << ' ' << t;
    }
    std::cerr << "\nproceed? [y/N] " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        return false;
    }
    return line == "y" || line == "Y" || line == "yes";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;
    bool                                 assume_yes = false;
    std::vector<std::string>             positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--yes") {
            assume_yes = true;
        } else if (arg.starts_with("--")) {
            print_usage();
            return EXIT_FAILURE;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    auto config = ConfigLoader::resolve(config_path);
    if (!config) {
        std::cerr << "dbsafe-rollback: " << config.error() << '\n';
        return EXIT_FAILURE;
    }

    auto rt = Runtime::create(*config, RuntimeOptions{.approver = ApproverMode::kAlwaysNo});
    if (!rt) {
        std::cerr << "dbsafe-rollback: " << rt.error().message << '\n';
        return EXIT_FAILURE;
    }
    auto& runtime = **rt;

    if (positional[0] == "list" && positional.size() == 1) {
        for (const auto& ref : runtime.snapshots().list()) {
            std::cout << ref.id << "  " << format_iso8601(ref.created_at) << "  "
                      << backend_to_string(ref.backend) << "  "
                      << snapshot_strategy_to_string(ref.strategy) << "  ";
            for (std::size_t i = 0; i < ref.tables.size(); ++i) {
                std::cout << (i > 0 ? "," : "") << ref.tables[i];
            }
            std::cout << '\n';
        }
        return EXIT_SUCCESS;
    }

    if (positional[0] == "restore" && positional.size() == 2) {
        const auto& id  = positional[1];
        auto        ref = runtime.snapshots().find(id);
        if (!ref) {
            std::cerr << "dbsafe-rollback: " << ref.error().message << '\n';
            return EXIT_FAILURE;
        }
        if (!assume_yes && !confirm(*ref)) {
            std::cerr << "dbsafe-rollback: restore cancelled\n";
            return EXIT_FAILURE;
        }

        auto rec = runtime.rollback().rollback(id, current_user());
        if (!rec) {
            std::cerr << "dbsafe-rollback: " << gate_error_code_to_string(rec.error().code) << ": "
                      << rec.error().message << '\n';
            return EXIT_FAILURE;
        }
        if (rec->final_status != FinalStatus::kExecuted) {
            std::cerr << "dbsafe-rollback: restore failed: " << rec->execution.error
                      << " (audited as " << rec->run_id << ")\n";
            return EXIT_FAILURE;
        }
        std::cout << "restored " << id << " (audited as " << rec->run_id << ")\n";
        return EXIT_SUCCESS;
    }

    print_usage();
    return EXIT_FAILURE;
}
