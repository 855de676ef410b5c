#include "app/runtime.hpp"
#include "approval/approval_server.hpp"
#include "audit/audit_log.hpp"
#include "common/json_util.hpp"
#include "config/config_loader.hpp"
#include "gate/approval_gate.hpp"
#include "logger/log_types.hpp"
#include "replay/replay_engine.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// dbsafe CLI
//
//   dbsafe [options] "<SQL>"
//   dbsafe [--config <path>] replay <run_id>
//   dbsafe [--config <path>] audit [--since <iso>] [--until <iso>] [--min-risk <level>]
//
// 종료 코드:
//   0 성공 / 1 오류 / 2 BLOCKED / 3 ABORTED / 4 실행 실패 / 5 리플레이 불일치
// ---------------------------------------------------------------------------

namespace {

constexpr int kExitOk         = 0;
constexpr int kExitError      = 1;
constexpr int kExitBlocked    = 2;
constexpr int kExitAborted    = 3;
constexpr int kExitExecFailed = 4;
constexpr int kExitDiverged   = 5;

struct CliArgs {
    std::optional<std::filesystem::path> config_path{};
    ApproverMode                         approver{ApproverMode::kConsole};
    std::optional<std::filesystem::path> approval_socket{};
    std::string                          override_by{};
    std::string                          override_reason{};
    std::string                          since{};
    std::string                          until{};
    std::string                          min_risk{};
    std::vector<std::string>             positional{};
};

void print_usage() {
    std::cerr
        << "usage:\n"
        << "  dbsafe [--config <path>] [--yes | --no | --approval-socket <path>]\n"
        << "         [--override-by <who> --override-reason <why>] \"<SQL>\"\n"
        << "  dbsafe [--config <path>] replay <run_id>\n"
        << "  dbsafe [--config <path>] audit [--since <iso>] [--until <iso>] [--min-risk <level>]\n";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // 값이 필요한 옵션
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "dbsafe: option " << arg << " needs a value\n";
                return std::nullopt;
            }
            return std::string{argv[++i]};
        };

        if (arg == "--config") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.config_path = *v;
        } else if (arg == "--yes") {
            args.approver = ApproverMode::kAlwaysYes;
        } else if (arg == "--no") {
            args.approver = ApproverMode::kAlwaysNo;
        } else if (arg == "--approval-socket") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.approval_socket = *v;
            args.approver        = ApproverMode::kSocket;
        } else if (arg == "--override-by") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.override_by = *v;
        } else if (arg == "--override-reason") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.override_reason = *v;
        } else if (arg == "--since") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.since = *v;
        } else if (arg == "--until") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.until = *v;
        } else if (arg == "--min-risk") {
            auto v = value();
            if (!v) { return std::nullopt; }
            args.min_risk = *v;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg.size() > 2 && arg.starts_with("--")) {
            std::cerr << "dbsafe: unknown option " << arg << '\n';
            return std::nullopt;
        } else {
            args.positional.push_back(arg);
        }
    }

    if (args.override_by.empty() != args.override_reason.empty()) {
        std::cerr << "dbsafe: --override-by and --override-reason must be given together\n";
        return std::nullopt;
    }
    if (args.positional.empty()) {
        return std::nullopt;
    }
    return args;
}

void print_record(const AuditRecord& rec) {
    std::cout << "run_id   : " << rec.run_id << '\n';
    std::cout << "risk     : " << risk_level_to_string(rec.risk.level) << '\n';
    for (const auto& match : rec.risk.matches) {
        std::cout << "  - " << match.rule_id << ": " << match.rationale << '\n';
    }
    if (rec.dry_run) {
        std::cout << "dry run  : " << rec.dry_run->estimated_rows << " row(s)"
                  << (rec.dry_run->exact ? " (exact)" : " (approximate)") << '\n';
    } else if (!rec.dry_run_error.empty()) {
        std::cout << "dry run  : failed: " << rec.dry_run_error << '\n';
    }
    if (rec.snapshot) {
        std::cout << "snapshot : " << rec.snapshot->id << '\n';
    }

    std::cout << "decision : " << final_status_to_string(rec.final_status);
    if (rec.final_status == FinalStatus::kAborted) {
        std::cout << " (" << abort_reason_to_string(rec.abort_reason) << ')';
    }
    if (rec.final_status == FinalStatus::kExecuted) {
        if (rec.execution.status == ExecutionStatus::kSuccess) {
            std::cout << " affected_rows=" << rec.execution.affected_rows;
        } else {
            std::cout << " execution FAILED: " << rec.execution.error;
        }
    }
    std::cout << '\n';
}

int exit_code_for(const AuditRecord& rec) {
    switch (rec.final_status) {
        case FinalStatus::kBlocked: return kExitBlocked;
        case FinalStatus::kAborted: return kExitAborted;
        case FinalStatus::kExecuted:
            return rec.execution.status == ExecutionStatus::kFailed ? kExitExecFailed : kExitOk;
    }
    return kExitError;
}

// ---------------------------------------------------------------------------
// 구문 제출
//   io_context 스레드에서 SIGINT/SIGTERM 을 받아 취소를 요청하고,
//   --approval-socket 이면 승인 소켓 서버도 같은 스레드에서 돌린다.
// ---------------------------------------------------------------------------
int run_submit(Runtime& rt, const CliArgs& args, const std::string& sql) {
    boost::asio::io_context ioc;
    std::stop_source        stop;

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&stop](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::warn("dbsafe: signal {} received, cancelling run", signo);
            stop.request_stop();
        }
    });

    std::unique_ptr<ApprovalServer> server;
    if (rt.broker()) {
        server = std::make_unique<ApprovalServer>(*args.approval_socket, rt.stats(), rt.broker(), ioc);
        boost::asio::co_spawn(ioc, server->run(), boost::asio::detached);
        std::cerr << "waiting for approval on " << args.approval_socket->string() << '\n';
    }

    std::thread io_thread([&ioc] { ioc.run(); });

    SubmitOptions opts;
    opts.stop = stop.get_token();
    if (!args.override_by.empty()) {
        opts.elevated_override = ElevatedOverride{args.override_by, args.override_reason};
    }

    auto result = rt.gate().submit(sql, opts);

    ioc.stop();
    io_thread.join();

    if (!result) {
        std::cerr << "dbsafe: " << gate_error_code_to_string(result.error().code) << ": "
                  << result.error().message << '\n';
        return kExitError;
    }
    print_record(*result);
    return exit_code_for(*result);
}

int run_replay(Runtime& rt, const CliArgs& args) {
    if (args.positional.size() != 2) {
        print_usage();
        return kExitError;
    }
    auto trace = rt.replay().replay(args.positional[1]);
    if (!trace) {
        std::cerr << "dbsafe: " << gate_error_code_to_string(trace.error().code) << ": "
                  << trace.error().message << '\n';
        return kExitError;
    }
    std::cout << format_replay_trace(*trace);
    return trace->diverged() ? kExitDiverged : kExitOk;
}

int run_audit(Runtime& rt, const CliArgs& args) {
    AuditQuery filter;
    if (!args.since.empty()) {
        filter.from = parse_iso8601(args.since);
        if (!filter.from) {
            std::cerr << "dbsafe: invalid --since '" << args.since << "'\n";
            return kExitError;
        }
    }
    if (!args.until.empty()) {
        filter.to = parse_iso8601(args.until);
        if (!filter.to) {
            std::cerr << "dbsafe: invalid --until '" << args.until << "'\n";
            return kExitError;
        }
    }
    if (!args.min_risk.empty()) {
        filter.min_level = risk_level_from_string(args.min_risk);
        if (!filter.min_level) {
            std::cerr << "dbsafe: invalid --min-risk '" << args.min_risk << "'\n";
            return kExitError;
        }
    }

    auto records = rt.audit().query(filter);
    if (!records) {
        std::cerr << "dbsafe: " << records.error().message << '\n';
        return kExitError;
    }
    for (const auto& rec : *records) {
        std::cout << rec.run_id << "  " << format_iso8601(rec.timestamp) << "  "
                  << record_kind_to_string(rec.kind) << "  "
                  << risk_level_to_string(rec.risk.level) << "  "
                  << final_status_to_string(rec.final_status) << "  " << rec.sql << '\n';
    }
    return kExitOk;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return kExitError;
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    auto config = ConfigLoader::resolve(args->config_path);
    if (!config) {
        std::cerr << "dbsafe: " << config.error() << '\n';
        return kExitError;
    }
    if (args->approval_socket) {
        config->approval.socket_path = *args->approval_socket;
    }
    if (const auto level = log_level_from_string(config->global.log_level); level) {
        spdlog::set_level(*level == LogLevel::kDebug  ? spdlog::level::debug
                          : *level == LogLevel::kWarn ? spdlog::level::warn
                          : *level == LogLevel::kError ? spdlog::level::err
                                                       : spdlog::level::info);
    }

    // ── 구성요소 생성 ───────────────────────────────────────────────────
    const std::string& command = args->positional.front();
    RuntimeOptions opts;
    opts.approver = (command == "replay" || command == "audit") ? ApproverMode::kAlwaysNo : args->approver;

    auto rt = Runtime::create(*config, opts, &std::cerr);
    if (!rt) {
        std::cerr << "dbsafe: " << gate_error_code_to_string(rt.error().code) << ": "
                  << rt.error().message << '\n';
        return kExitError;
    }

    if (command == "replay") {
        return run_replay(**rt, *args);
    }
    if (command == "audit") {
        return run_audit(**rt, *args);
    }
    if (args->positional.size() != 1) {
        std::cerr << "dbsafe: pass the SQL statement as a single quoted argument\n";
        return kExitError;
    }
    return run_submit(**rt, *args, command);
}
