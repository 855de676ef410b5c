#pragma once

// ---------------------------------------------------------------------------
// approval_server.hpp
//
// Unix Domain Socket 서버. 승인 대기 중인 실행을 외부 운영자에게 노출하고
// 승인/거부 결정을 받는다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임:
//     [4byte LE 길이][JSON 본문]
//     예: {"command": "approve", "run_id": "RUN_20240102T030405_a1b2c3d4"}
//
//   응답 프레임:
//     [4byte LE 길이][JSON 본문]
//     성공: {"ok": true,  "payload": { ... }}
//     실패: {"ok": false, "error": "<메시지>"}
//
// [지원 커맨드]
//   "stats"   : GateStatsSnapshot
//   "pending" : 대기 중인 요청 목록 [{run_id, sql, risk_level, reasons, estimated_rows}]
//   "approve" : run_id 필수. 대기 중이 아니면 ok=false
//   "deny"    : run_id 필수. 대기 중이 아니면 ok=false
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   run() 은 co_return 까지 accept 루프를 유지한다.
//   stop() 은 acceptor 를 닫아 run() 을 종료시킨다.
//
// [격리 원칙]
//   소켓 I/O 실패가 게이트 실행으로 전파되지 않는다. 서버가 건드리는 상태는
//   GateStatsCollector::snapshot() 과 ApprovalBroker 의 decide()/pending() 뿐이다.
// ---------------------------------------------------------------------------

#include "approval/approval_broker.hpp"
#include "stats/stats_collector.hpp"

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

class ApprovalServer {
public:
    // 생성자
    //   socket_path : Unix Domain Socket 파일 경로
    //   stats       : 공유 통계 수집기 (read-only 접근만 수행)
    //   broker      : 승인 대기열
    //   ioc         : 외부에서 주입된 Asio io_context
    ApprovalServer(const std::filesystem::path&        socket_path,
                   std::shared_ptr<GateStatsCollector> stats,
                   std::shared_ptr<ApprovalBroker>     broker,
                   asio::io_context&                   ioc);

    ~ApprovalServer();

    ApprovalServer(const ApprovalServer&)            = delete;
    ApprovalServer& operator=(const ApprovalServer&) = delete;
    ApprovalServer(ApprovalServer&&)                 = delete;
    ApprovalServer& operator=(ApprovalServer&&)      = delete;

    // run
    //   기존 소켓 파일 제거 → bind/listen → accept 루프.
    //   호출자는 co_spawn 으로 이 코루틴을 구동해야 한다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    void stop();

    // dispatch
    //   요청 JSON 한 건을 처리하여 응답 JSON 을 만든다. 소켓과 무관한 순수 처리부.
    [[nodiscard]] std::string dispatch(std::string_view request_json);

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    std::filesystem::path                  socket_path_;
    std::shared_ptr<GateStatsCollector>    stats_;
    std::shared_ptr<ApprovalBroker>        broker_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
