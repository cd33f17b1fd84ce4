// ---------------------------------------------------------------------------
// uds_server.cpp
//
// UdsServer 구현: Unix Domain Socket 서버.
//
// [프로토콜]
//   요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
//   요청 JSON 은 JsonValue::parse 로 파싱한다.
// ---------------------------------------------------------------------------

#include "server/uds_server.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// make_ok_response
//   {"ok":true,"payload":<data>}
// ---------------------------------------------------------------------------
std::string make_ok_response(JsonValue payload) {
    JsonValue out = JsonValue::object();
    out.set("ok", JsonValue::boolean(true));
    out.set("payload", std::move(payload));
    return out.dump();
}

// ---------------------------------------------------------------------------
// make_error_response
//   {"ok":false,"error":"<msg>"}
// ---------------------------------------------------------------------------
std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":"{}"}})", json_escape(msg));
}

// ---------------------------------------------------------------------------
// encode_le4 / decode_le4
// ---------------------------------------------------------------------------
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

// 요청 본문에서 문자열 필드를 꺼낸다. 없거나 문자열이 아니면 nullptr.
const std::string* string_field(const JsonValue& request, std::string_view key) {
    const JsonValue* field = request.find(key);
    if (field == nullptr || !field->is_string()) {
        return nullptr;
    }
    return &field->as_string();
}

} // namespace

// ---------------------------------------------------------------------------
// stats_to_json
//   captured_at 는 Unix epoch 밀리초로 직렬화한다.
// ---------------------------------------------------------------------------
JsonValue stats_to_json(const StatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    JsonValue errors = JsonValue::object();
    for (std::size_t i = 0; i < kQueryErrorKindCount; ++i) {
        const auto kind = static_cast<QueryErrorKind>(i);
        errors.set(std::string(to_string(kind)), JsonValue::integer(static_cast<std::int64_t>(s.errors[i])));
    }

    JsonValue out = JsonValue::object();
    out.set("total_queries", JsonValue::integer(static_cast<std::int64_t>(s.total_queries)));
    out.set("succeeded_queries", JsonValue::integer(static_cast<std::int64_t>(s.succeeded_queries)));
    out.set("errors", std::move(errors));
    out.set("in_flight", JsonValue::integer(static_cast<std::int64_t>(s.in_flight)));
    out.set("qps", JsonValue::number(s.qps));
    out.set("deny_rate", JsonValue::number(s.deny_rate));
    out.set("captured_at_ms", JsonValue::integer(epoch_ms));
    return out;
}

// ---------------------------------------------------------------------------
// UdsServer 생성자/소멸자
// ---------------------------------------------------------------------------
UdsServer::UdsServer(const std::filesystem::path&  socket_path,
                     std::shared_ptr<QueryService> service,
                     asio::io_context&             ioc,
                     std::size_t                   worker_threads)
    : socket_path_{socket_path}
    , service_{std::move(service)}
    , ioc_{ioc}
    , workers_{std::max<std::size_t>(worker_threads, 1)}
    , acceptor_{ioc}
{}

UdsServer::~UdsServer() {
    stop();
    workers_.join();
}

// ---------------------------------------------------------------------------
// stop
//   acceptor를 닫아 run()의 accept 루프를 종료한다.
// ---------------------------------------------------------------------------
void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("uds_server: stop: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("uds_server: stop: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리해 TSan 경합을 방지한다.
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
std::string UdsServer::dispatch(std::string_view request_json) const {
    auto parsed = JsonValue::parse(request_json);
    if (!parsed) {
        spdlog::warn("uds_server: malformed request: {}", parsed.error());
        return make_error_response(fmt::format("malformed request: {}", parsed.error()));
    }
    if (!parsed->is_object()) {
        return make_error_response("request must be a JSON object");
    }

    const std::string* cmd = string_field(*parsed, "command");
    if (cmd == nullptr || cmd->empty()) {
        spdlog::warn("uds_server: missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }

    if (*cmd == "execute_query") {
        const std::string* snippet = string_field(*parsed, "code_snippet");
        if (snippet == nullptr) {
            snippet = string_field(*parsed, "snippet");
        }
        if (snippet == nullptr) {
            return make_error_response("execute_query requires a 'code_snippet' string");
        }
        QueryRequest request{};
        request.request_id = service_->next_request_id();
        request.snippet    = *snippet;
        return service_->execute(request).to_json().dump();
    }
    if (*cmd == "describe_capabilities") {
        return service_->describe_capabilities().dump();
    }
    if (*cmd == "stats") {
        if (!service_->stats()) {
            return make_error_response("stats are not collected");
        }
        return make_ok_response(stats_to_json(service_->stats()->snapshot()));
    }

    spdlog::warn("uds_server: unknown command '{}'", *cmd);
    return make_error_response(fmt::format("unknown command '{}'", *cmd));
}

asio::awaitable<std::string> UdsServer::dispatch_on_pool(std::string request_json) {
    co_return dispatch(request_json);
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프.
//   accept 오류 시 로그 후 루프 종료.
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    // 기존 소켓 파일 제거 (bind 실패 방지)
    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("uds_server: failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("uds_server: open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("uds_server: bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("uds_server: listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("uds_server: listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                // stop() 으로 acceptor가 닫힌 경우: 정상 종료
                spdlog::info("uds_server: accept loop stopped");
            } else {
                spdlog::error("uds_server: accept error: {}", accept_ec.message());
            }
            co_return;
        }

        // 클라이언트 처리 코루틴을 독립적으로 spawn (실패가 서버에 영향 없음)
        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   1. 4바이트 LE 헤더로 요청 크기 읽기
//   2. JSON 바디 읽기
//   3. thread_pool 에서 dispatch
//   4. 4바이트 LE 헤더 + JSON 바디 응답 송신
//
//   프레임 오류 시 응답 없이 연결을 닫는다.
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::handle_client(asio::local::stream_protocol::socket socket) {
    // ── 요청 헤더 읽기 ──────────────────────────────────────────────────
    std::array<uint8_t, 4> req_hdr{};
    boost::system::error_code hdr_ec;
    const std::size_t hdr_n = co_await asio::async_read(
        socket, asio::buffer(req_hdr), asio::redirect_error(asio::use_awaitable, hdr_ec));

    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("uds_server: handle_client: read header error: {}", hdr_ec.message());
        }
        co_return;
    }
    if (hdr_n != 4) {
        spdlog::warn("uds_server: handle_client: short header ({} bytes)", hdr_n);
        co_return;
    }

    const uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("uds_server: handle_client: invalid body length {}", body_len);
        co_return;
    }

    // ── 요청 바디 읽기 ──────────────────────────────────────────────────
    std::string body(body_len, '\0');
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body), asio::redirect_error(asio::use_awaitable, body_ec));

    if (body_ec) {
        spdlog::warn("uds_server: handle_client: read body error: {}", body_ec.message());
        co_return;
    }
    if (body_n != body_len) {
        spdlog::warn("uds_server: handle_client: short body ({}/{} bytes)", body_n, body_len);
        co_return;
    }

    // ── 디스패치 (worker thread) ───────────────────────────────────────
    std::string response_body;
    try {
        response_body = co_await asio::co_spawn(
            workers_.get_executor(), dispatch_on_pool(std::move(body)), asio::use_awaitable);
    } catch (const std::exception& e) {
        spdlog::error("uds_server: handle_client: dispatch failed: {}", e.what());
        response_body = make_error_response(fmt::format("internal error: {}", e.what()));
    }

    // ── 응답 송신 ───────────────────────────────────────────────────────
    const auto resp_hdr = encode_le4(static_cast<uint32_t>(response_body.size()));
    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    boost::system::error_code write_ec;
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));

    if (write_ec) {
        spdlog::warn("uds_server: handle_client: write error: {}", write_ec.message());
        co_return;
    }

    spdlog::debug("uds_server: handled request response_bytes={}", write_n);
}
