// ---------------------------------------------------------------------------
// approval_server.cpp
//
// ApprovalServer 구현.
//
// [프로토콜]
//   요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
//   요청 JSON 은 yaml-cpp 로 파싱한다 (JSON ⊂ YAML flow).
// ---------------------------------------------------------------------------

#include "approval/approval_server.hpp"

#include "common/json_util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// serialize_stats
//   GateStatsSnapshot → JSON. captured_at 은 Unix epoch 밀리초.
// ---------------------------------------------------------------------------
std::string serialize_stats(const GateStatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    return fmt::format(
        R"({{"total_runs": {}, "executed": {}, "blocked": {}, "aborted": {}, )"
        R"("execution_failed": {}, "snapshots": {}, "rollbacks": {}, "pending_approvals": {}, )"
        R"("block_rate": {:.4f}, "captured_at_ms": {}}})",
        s.total_runs, s.executed, s.blocked, s.aborted, s.execution_failed,
        s.snapshots, s.rollbacks, s.pending_approvals, s.block_rate, epoch_ms);
}

std::string serialize_pending(const std::vector<ApprovalRequest>& requests) {
    std::string out = "[";
    for (std::size_t i = 0; i < requests.size(); ++i) {
        const auto& r = requests[i];
        if (i > 0) {
            out += ", ";
        }
        out += fmt::format(
            R"({{"run_id": {}, "sql": {}, "risk_level": {}, "reasons": {}, "estimated_rows": {}}})",
            json_quote(r.run_id), json_quote(r.sql),
            json_quote(risk_level_to_string(r.risk.level)),
            json_string_array(r.risk.rule_ids()),
            r.dry_run ? std::to_string(r.dry_run->estimated_rows) : std::string{"null"});
    }
    out += ']';
    return out;
}

std::string make_ok_response(std::string_view data) {
    return fmt::format(R"({{"ok": true, "payload": {}}})", data);
}

std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok": false, "error": {}}})", json_quote(msg));
}

std::array<uint8_t, 4> encode_le4(uint32_t val) {
    return {
        static_cast<uint8_t>(val),
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val >> 16),
        static_cast<uint8_t>(val >> 24),
    };
}

uint32_t decode_le4(const std::array<uint8_t, 4>& buf) {
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

// 단일 클라이언트에서 수신할 최대 메시지 크기 (1MiB)
constexpr uint32_t kMaxRequestSize = 1024u * 1024u;

} // namespace

ApprovalServer::ApprovalServer(const std::filesystem::path&        socket_path,
                               std::shared_ptr<GateStatsCollector> stats,
                               std::shared_ptr<ApprovalBroker>     broker,
                               asio::io_context&                   ioc)
    : socket_path_{socket_path}
    , stats_{std::move(stats)}
    , broker_{std::move(broker)}
    , ioc_{ioc}
    , acceptor_{ioc}
{}

ApprovalServer::~ApprovalServer() {
    stop();
}

void ApprovalServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("[approval_server] stop: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("[approval_server] stop: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리한다.
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

std::string ApprovalServer::dispatch(std::string_view request_json) {
    std::string cmd;
    std::string run_id;
    try {
        const YAML::Node req = YAML::Load(std::string(request_json));
        if (!req.IsMap() || !req["command"]) {
            spdlog::warn("[approval_server] missing or malformed 'command' field");
            return make_error_response("missing or malformed 'command' field");
        }
        cmd = req["command"].as<std::string>();
        if (const auto id = req["run_id"]; id && !id.IsNull()) {
            run_id = id.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        spdlog::warn("[approval_server] malformed request: {}", e.what());
        return make_error_response("malformed request");
    }

    if (cmd == "stats") {
        return make_ok_response(serialize_stats(stats_->snapshot()));
    }
    if (cmd == "pending") {
        return make_ok_response(serialize_pending(broker_->pending()));
    }
    if (cmd == "approve" || cmd == "deny") {
        if (run_id.empty()) {
            return make_error_response(fmt::format("'{}' requires run_id", cmd));
        }
        if (!broker_->decide(run_id, cmd == "approve")) {
            return make_error_response(fmt::format("run '{}' is not awaiting approval", run_id));
        }
        return make_ok_response(fmt::format(R"({{"run_id": {}, "decision": {}}})",
                                            json_quote(run_id), json_quote(cmd)));
    }

    spdlog::warn("[approval_server] unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}

asio::awaitable<void> ApprovalServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    // 기존 소켓 파일 제거 (bind 실패 방지)
    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[approval_server] failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[approval_server] open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[approval_server] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[approval_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[approval_server] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket   client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[approval_server] accept loop stopped");
            } else {
                spdlog::error("[approval_server] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   1. 4바이트 LE 헤더로 요청 크기 읽기
//   2. JSON 바디 읽기
//   3. dispatch()
//   4. 4바이트 LE 헤더 + JSON 바디 응답 송신
// ---------------------------------------------------------------------------
asio::awaitable<void> ApprovalServer::handle_client(asio::local::stream_protocol::socket socket) {
    // ── 요청 헤더 읽기 ──────────────────────────────────────────────────
    std::array<uint8_t, 4>    req_hdr{};
    boost::system::error_code hdr_ec;
    const std::size_t hdr_n = co_await asio::async_read(
        socket, asio::buffer(req_hdr), asio::redirect_error(asio::use_awaitable, hdr_ec));

    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("[approval_server] read header error: {}", hdr_ec.message());
        }
        co_return;
    }
    if (hdr_n != 4) {
        spdlog::warn("[approval_server] short header ({} bytes)", hdr_n);
        co_return;
    }

    const uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("[approval_server] invalid body length {}", body_len);
        co_return;
    }

    // ── 요청 바디 읽기 ──────────────────────────────────────────────────
    std::vector<char>         body_buf(body_len);
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body_buf), asio::redirect_error(asio::use_awaitable, body_ec));

    if (body_ec || body_n != body_len) {
        spdlog::warn("[approval_server] read body error ({}/{} bytes): {}",
                     body_n, body_len, body_ec.message());
        co_return;
    }

    // ── 디스패치 + 응답 송신 ────────────────────────────────────────────
    const std::string response_body = dispatch(std::string_view{body_buf.data(), body_n});
    const auto        resp_hdr      = encode_le4(static_cast<uint32_t>(response_body.size()));

    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    boost::system::error_code write_ec;
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));

    if (write_ec) {
        spdlog::warn("[approval_server] write error: {}", write_ec.message());
        co_return;
    }

    spdlog::debug("[approval_server] response_bytes={}", write_n);
}
