#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 서버. 에이전트 측 어댑터에 QueryService 를 노출한다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임:
//     [4byte LE 길이][JSON 본문]
//     예: {"command": "execute_query", "code_snippet": "..."}
//
//   응답 프레임:
//     [4byte LE 길이][JSON 본문]
//
// [지원 커맨드]
//   "execute_query"        : Envelope JSON 반환
//                             ("code_snippet" 또는 "snippet" 필드)
//   "describe_capabilities": 도구 스키마 + 화이트리스트 요약
//   "stats"                : {"ok": true, "payload": { ...StatsSnapshot... }}
//   그 외 / 잘못된 요청     : {"ok": false, "error": "<메시지>"}
//
//   연결 하나에 요청 하나. 응답 송신 후 연결을 닫는다.
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   execute_query 는 fork/wait 로 블로킹되므로 내부 thread_pool 에서 실행하고
//   결과만 io_context 로 돌려받는다. accept 루프는 막히지 않는다.
//   stop() 은 acceptor 를 닫아 run() 을 종료시킨다.
// ---------------------------------------------------------------------------

#include "serializer/json_value.hpp"
#include "service/query_service.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

// 단일 클라이언트에서 수신할 최대 메시지 크기 (4MiB)
inline constexpr std::uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

// stats_to_json: StatsSnapshot → {"total_queries":..,"errors":{kind:count},..}
[[nodiscard]] JsonValue stats_to_json(const StatsSnapshot& snapshot);

// ---------------------------------------------------------------------------
// UdsServer
// ---------------------------------------------------------------------------
class UdsServer {
public:
    // 생성자
    //   socket_path    : Unix Domain Socket 파일 경로
    //   service        : 요청을 처리할 QueryService
    //   ioc            : 외부에서 주입된 Asio io_context
    //   worker_threads : execute_query 실행 스레드 수 (0 이면 1)
    UdsServer(const std::filesystem::path&  socket_path,
              std::shared_ptr<QueryService> service,
              asio::io_context&             ioc,
              std::size_t                   worker_threads = 4);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;

    UdsServer(UdsServer&&)            = delete;
    UdsServer& operator=(UdsServer&&) = delete;

    // run
    //   UDS 소켓 바인드/리슨 후 accept 루프를 실행한다.
    //   호출자는 co_spawn 으로 이 코루틴을 구동해야 한다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    //   io_context 스레드에서 안전하게 호출 가능.
    void stop();

    // dispatch
    //   요청 본문 하나를 처리해 응답 본문을 반환한다 (I/O 없음).
    //   execute_query 는 호출 스레드에서 블로킹 실행된다.
    [[nodiscard]] std::string dispatch(std::string_view request_json) const;

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    // dispatch 를 thread_pool 에서 실행하는 코루틴
    asio::awaitable<std::string> dispatch_on_pool(std::string request_json);

    std::filesystem::path                  socket_path_;
    std::shared_ptr<QueryService>          service_;
    asio::io_context&                      ioc_;
    asio::thread_pool                      workers_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
