// ---------------------------------------------------------------------------
// test_uds_server.cpp
//
// UdsServer 단위 테스트.
//
// [테스트 범위]
// - "execute_query" 커맨드 → Envelope JSON ("code_snippet" / "snippet" 필드)
// - 거부된 스니펫 → {"ok":false,"kind":"CapabilityDenied",...}
// - "describe_capabilities" → 도구 스키마 + 화이트리스트 요약
// - "stats" 커맨드 → {"ok":true,"payload":{...}} 응답
// - 미지원 커맨드 / "command" 누락 / 잘못된 JSON → {"ok":false,"error":"..."}
// - 잘못된 프레임(0-length body, 과대 body length) → 서버가 안전하게 처리
// - 여러 클라이언트 동시 접속 → 각자 올바른 응답 수신
// - run() 전 stop() 호출 → 크래시/hang 없음
// - 진단 로그 접두사 "uds_server:"
//
// [테스트 패턴]
// - 각 테스트는 임시 소켓 경로(/tmp/test_uds_<pid>_<N>.sock)를 사용한다.
// - UdsServer 를 서버 전용 io_context 에서 백그라운드 스레드로 구동한다.
// - 클라이언트는 별도 io_context 의 동기 소켓(sync connect/write/read) 사용.
// - QueryService 는 저장소 화이트리스트 + 예제 catalog fixture 로 구성한다.
//
// [프로토콜]
//   요청: [4byte LE 길이][JSON 바디]
//   응답: [4byte LE 길이][JSON 바디]
//
// [알려진 한계]
// - wait_for_socket(2s) 안에 완료되지 않으면 실패. CI 부하에 따라 간헐 실패
//   가능성이 있으나 서버 기동 시간은 수 ms 이므로 2s 는 충분한 마진이다.
// ---------------------------------------------------------------------------

#include "policy/capability_loader.hpp"
#include "server/uds_server.hpp"
#include "session/catalog_client.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace asio = boost::asio;
using stream_protocol = asio::local::stream_protocol;

// ---------------------------------------------------------------------------
// 익명 네임스페이스: 테스트 내부 헬퍼
// ---------------------------------------------------------------------------
namespace {

// 임시 소켓 경로 생성 (PID + 단조 카운터로 테스트 간 충돌 방지)
std::filesystem::path temp_socket_path(const char* tag) {
    static std::atomic<int> counter{0};
    return std::filesystem::path("/tmp") /
           ("test_uds_" + std::to_string(::getpid()) +
            "_" + std::to_string(counter.fetch_add(1)) +
            "_" + tag + ".sock");
}

// encode_le4: uint32_t → 4바이트 little-endian 배열
std::array<uint8_t, 4> encode_le4(uint32_t v) {
    return {
        static_cast<uint8_t>(v),
        static_cast<uint8_t>(v >> 8),
        static_cast<uint8_t>(v >> 16),
        static_cast<uint8_t>(v >> 24),
    };
}

// decode_le4: 4바이트 LE 배열 → uint32_t
uint32_t decode_le4(const std::array<uint8_t, 4>& b) {
    return static_cast<uint32_t>(b[0])
         | (static_cast<uint32_t>(b[1]) << 8)
         | (static_cast<uint32_t>(b[2]) << 16)
         | (static_cast<uint32_t>(b[3]) << 24);
}

// ---------------------------------------------------------------------------
// UdsSyncClient
//   동기 UDS 클라이언트 (테스트 전용).
//   자체 io_context 를 보유하여 서버 ioc 와 완전히 분리된다.
// ---------------------------------------------------------------------------
struct UdsSyncClient {
    asio::io_context        ioc;
    stream_protocol::socket sock{ioc};

    void connect(const std::filesystem::path& path) {
        sock.connect(stream_protocol::endpoint{path.string()});
    }

    // send: [4LE 헤더][JSON 바디] 형식으로 전송
    void send(std::string_view body) {
        const auto hdr = encode_le4(static_cast<uint32_t>(body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(hdr),
            asio::buffer(body.data(), body.size()),
        };
        asio::write(sock, bufs);
    }

    // recv: 서버가 소켓을 닫으면(EOF/오류) 빈 문자열 반환.
    std::string recv() {
        std::array<uint8_t, 4> hdr{};
        boost::system::error_code ec;
        asio::read(sock, asio::buffer(hdr), ec);
        if (ec) { return {}; }

        const uint32_t len = decode_le4(hdr);
        if (len == 0 || len > 16u * 1024u * 1024u) { return {}; }

        std::string body(len, '\0');
        asio::read(sock, asio::buffer(body), ec);
        if (ec) { return {}; }
        return body;
    }

    // send_raw_header: 헤더만 전송 (malformed frame 테스트용)
    void send_raw_header(uint32_t fake_len) {
        const auto hdr = encode_le4(fake_len);
        boost::system::error_code ec;
        asio::write(sock, asio::buffer(hdr), ec);
    }
};

// 요청 하나를 보내고 파싱된 응답을 돌려준다
JsonValue round_trip(const std::filesystem::path& path, std::string_view request) {
    UdsSyncClient client;
    client.connect(path);
    client.send(request);
    const std::string resp = client.recv();
    auto parsed = JsonValue::parse(resp);
    EXPECT_TRUE(parsed.has_value()) << "response is not JSON: " << resp;
    return parsed ? std::move(*parsed) : JsonValue{};
}

std::shared_ptr<QueryService> make_service(const std::filesystem::path& config_dir,
                                           std::shared_ptr<StatsCollector> stats) {
    {
        std::ofstream out{config_dir / "config"};
        out << "[DEFAULT]\nuser=u\nfingerprint=f\nkey_file=/k.pem\n"
               "tenancy=ocid1.compartment.oc1..prod\nregion=us-ashburn-1\n";
    }
    auto wl = CapabilityLoader::load(OCIGATE_SOURCE_DIR "/config/capabilities.yaml");
    EXPECT_TRUE(wl.has_value()) << (wl ? "" : wl.error());
    auto factory = CatalogClientFactory::load(OCIGATE_SOURCE_DIR "/config/catalog.example.yaml");
    EXPECT_TRUE(factory.has_value()) << (factory ? "" : factory.error());

    auto session = std::make_shared<OciSession>(
        config_dir / "config", "DEFAULT",
        factory ? std::shared_ptr<ClientFactory>(*factory) : nullptr);
    EXPECT_TRUE(session->load().has_value());

    ServiceOptions options;
    options.executor.timeout = std::chrono::milliseconds{1000};
    return std::make_shared<QueryService>(
        std::make_shared<const CapabilityWhitelist>(wl ? std::move(*wl) : CapabilityWhitelist{}),
        std::move(session), options, nullptr, std::move(stats));
}

} // namespace

// ---------------------------------------------------------------------------
// UdsServerTest 픽스처
//   각 테스트마다 독립된 소켓 경로 + UdsServer + io_context 를 생성/정리한다.
// ---------------------------------------------------------------------------
class UdsServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = temp_socket_path("srv");
        config_dir_  = std::filesystem::path(socket_path_).replace_extension(".d");
        std::filesystem::create_directories(config_dir_);

        stats_   = std::make_shared<StatsCollector>();
        service_ = make_service(config_dir_, stats_);
        ioc_     = std::make_unique<asio::io_context>();
        server_  = std::make_unique<UdsServer>(socket_path_, service_, *ioc_, 2);
    }

    void TearDown() override {
        stop_server();
        server_.reset();
        std::error_code ec;
        std::filesystem::remove(socket_path_, ec);
        std::filesystem::remove_all(config_dir_, ec);
    }

    // start_server: 백그라운드 스레드에서 서버 io_context 실행
    void start_server() {
        asio::co_spawn(*ioc_, server_->run(), asio::detached);
        server_thread_ = std::thread([this]() { ioc_->run(); });
    }

    void stop_server() {
        if (server_) { server_->stop(); }
        ioc_->stop();
        if (server_thread_.joinable()) { server_thread_.join(); }
    }

    // wait_for_socket: 서버가 소켓 파일을 생성할 때까지 polling 대기
    bool wait_for_socket(std::chrono::milliseconds timeout = std::chrono::seconds{2}) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (std::filesystem::exists(socket_path_)) { return true; }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return false;
    }

    std::filesystem::path             socket_path_;
    std::filesystem::path             config_dir_;
    std::shared_ptr<StatsCollector>   stats_;
    std::shared_ptr<QueryService>     service_;
    std::unique_ptr<asio::io_context> ioc_;
    std::unique_ptr<UdsServer>        server_;
    std::thread                       server_thread_;
};

// ---------------------------------------------------------------------------
// ExecuteQuery_ReturnsEnvelope
//   소켓으로 보낸 스니펫이 실행되어 {"ok":true,"result":...} 가 돌아온다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, ExecuteQuery_ReturnsEnvelope) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    const auto resp = round_trip(socket_path_,
        R"json({"command":"execute_query","code_snippet":"c = oci.core.ComputeClient(config)\nresult = len(c.list_instances(config['tenancy']).data)"})json");

    ASSERT_TRUE(resp.is_object());
    EXPECT_TRUE(resp.find("ok")->as_bool()) << resp.dump();
    ASSERT_NE(resp.find("result"), nullptr) << resp.dump();
    EXPECT_EQ(resp.find("result")->as_int(), 2);
}

// "snippet" 필드도 받아들인다
TEST_F(UdsServerTest, ExecuteQuery_SnippetFieldAlias) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    const auto resp = round_trip(socket_path_, R"({"command":"execute_query","snippet":"'a' + 'b'"})");
    EXPECT_EQ(resp.dump(), R"({"ok":true,"result":"ab"})");
}

// ---------------------------------------------------------------------------
// ExecuteQuery_DeniedSnippet
//   거부된 스니펫은 kind 와 violations 를 담은 실패 envelope 을 받는다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, ExecuteQuery_DeniedSnippet) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    const auto resp = round_trip(socket_path_,
        R"json({"command":"execute_query","code_snippet":"import subprocess\nsubprocess.run(['id'])"})json");

    EXPECT_FALSE(resp.find("ok")->as_bool());
    EXPECT_EQ(resp.find("kind")->as_string(), "CapabilityDenied") << resp.dump();
    ASSERT_NE(resp.find("violations"), nullptr);
    EXPECT_GE(resp.find("violations")->size(), 1u);
}

TEST_F(UdsServerTest, ExecuteQuery_MissingSnippet_ReturnsError) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    const auto resp = round_trip(socket_path_, R"({"command":"execute_query","code_snippet":42})");
    EXPECT_FALSE(resp.find("ok")->as_bool());
    EXPECT_NE(resp.find("error")->as_string().find("code_snippet"), std::string::npos) << resp.dump();
}

// ---------------------------------------------------------------------------
// DescribeCapabilities
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, DescribeCapabilities_ReturnsToolSchema) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    const auto resp = round_trip(socket_path_, R"({"command":"describe_capabilities"})");
    ASSERT_NE(resp.find("tool"), nullptr) << resp.dump();
    EXPECT_EQ(resp.find("tool")->find("name")->as_string(), std::string(kToolName));
    EXPECT_EQ(resp.find("timeout_ms")->as_int(), 1000);
    EXPECT_FALSE(resp.find("version")->as_string().empty());
}

// ---------------------------------------------------------------------------
// StatsCommand_ReturnsValidSnapshot
//   "stats" 커맨드를 전송하면 {"ok":true,"payload":{...}} JSON이 반환되어야 한다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, StatsCommand_ReturnsValidSnapshot) {
    // 사전에 통계 데이터 추가
    stats_->on_query(std::nullopt);
    stats_->on_query(QueryErrorKind::kCapabilityDenied);

    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_))
        << "Client must connect to UDS server successfully";

    client.send(R"({"command":"stats"})");

    const std::string resp = client.recv();
    ASSERT_FALSE(resp.empty())
        << "stats command must return a non-empty response";

    EXPECT_NE(resp.find(R"("ok":true)"), std::string::npos)
        << "stats response must contain \"ok\":true. Got: " << resp;

    const auto parsed = JsonValue::parse(resp);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    const auto* payload = parsed->find("payload");
    ASSERT_NE(payload, nullptr) << "Got: " << resp;
    EXPECT_EQ(payload->find("total_queries")->as_int(), 2);
    EXPECT_EQ(payload->find("succeeded_queries")->as_int(), 1);
    EXPECT_EQ(payload->find("errors")->find("CapabilityDenied")->as_int(), 1);
    EXPECT_DOUBLE_EQ(payload->find("deny_rate")->as_double(), 0.5);
    EXPECT_NE(payload->find("captured_at_ms"), nullptr);
}

// ---------------------------------------------------------------------------
// UnknownCommand_ReturnsError
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, UnknownCommand_ReturnsError) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    client.send(R"({"command":"xyz_unknown_command"})");

    const std::string resp = client.recv();
    ASSERT_FALSE(resp.empty())
        << "Unknown command must return a response (not silence)";

    EXPECT_NE(resp.find(R"("ok":false)"), std::string::npos)
        << "Unknown command must return ok:false. Got: " << resp;
    EXPECT_NE(resp.find("unknown command 'xyz_unknown_command'"), std::string::npos)
        << "Got: " << resp;
}

// ---------------------------------------------------------------------------
// MissingCommandField_ReturnsError
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, MissingCommandField_ReturnsError) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    client.send(R"({"version":1,"data":"no_command_here"})");

    const std::string resp = client.recv();
    ASSERT_FALSE(resp.empty())
        << "Missing command field must trigger an error response";

    EXPECT_NE(resp.find(R"("ok":false)"), std::string::npos)
        << "Missing command must return ok:false. Got: " << resp;
}

// ---------------------------------------------------------------------------
// Dispatch_MalformedJson
//   I/O 없이 dispatch() 를 직접 호출한다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, Dispatch_MalformedJson) {
    const auto resp = JsonValue::parse(server_->dispatch("{not json"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_FALSE(resp->find("ok")->as_bool());
    EXPECT_EQ(resp->find("error")->as_string().rfind("malformed request:", 0), 0u);

    const auto array_resp = JsonValue::parse(server_->dispatch("[1,2]"));
    ASSERT_TRUE(array_resp.has_value());
    EXPECT_EQ(array_resp->find("error")->as_string(), "request must be a JSON object");
}

// ---------------------------------------------------------------------------
// Dispatch_LogsWithComponentPrefix
//   진단 로그는 다른 컴포넌트와 같은 "uds_server:" 접두사를 쓴다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, Dispatch_LogsWithComponentPrefix) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%v");
    const auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("uds_capture", sink));

    const std::string resp = server_->dispatch(R"({"command":"nope"})");
    spdlog::default_logger()->flush();
    spdlog::set_default_logger(previous);

    EXPECT_NE(resp.find("unknown command 'nope'"), std::string::npos) << resp;
    EXPECT_EQ(captured.str().rfind("uds_server: unknown command 'nope'", 0), 0u)
        << "Got: " << captured.str();
}

// ---------------------------------------------------------------------------
// MalformedFrame_ZeroBodyLength_Handled
//   body_len == 0 → 서버가 응답 없이 소켓을 닫는다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, MalformedFrame_ZeroBodyLength_Handled) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    client.send_raw_header(0u);

    const std::string resp = client.recv();
    EXPECT_TRUE(resp.empty())
        << "Server must close connection on zero-length body without sending response";
}

// ---------------------------------------------------------------------------
// MalformedFrame_OversizedBodyLength_Handled
//   body_len 이 kMaxRequestSize(4MiB)를 초과 → 메모리 할당 없이 연결 종료
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, MalformedFrame_OversizedBodyLength_Handled) {
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    client.send_raw_header(0xFFFFFFFFu);

    const std::string resp = client.recv();
    EXPECT_TRUE(resp.empty())
        << "Server must close connection for oversized body length without crash";
}

// ---------------------------------------------------------------------------
// MultipleClients_Concurrent
//   N개 스레드가 각자 스니펫을 동시에 실행해도 모두 자기 결과를 받는다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, MultipleClients_Concurrent) {
    constexpr int kClientCount = 4;

    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    std::vector<std::string> responses(static_cast<std::size_t>(kClientCount));
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(kClientCount));

    for (int i = 0; i < kClientCount; ++i) {
        threads.emplace_back([this, i, &responses]() {
            UdsSyncClient client;
            try {
                client.connect(socket_path_);
                client.send(R"({"command":"execute_query","code_snippet":"result = )" +
                            std::to_string(i) + R"( * 10"})");
                responses[static_cast<std::size_t>(i)] = client.recv();
            } catch (const std::exception& ex) {
                responses[static_cast<std::size_t>(i)] =
                    std::string("EXCEPTION: ") + ex.what();
            }
        });
    }

    for (auto& t : threads) { t.join(); }

    for (int i = 0; i < kClientCount; ++i) {
        const auto& resp = responses[static_cast<std::size_t>(i)];
        EXPECT_EQ(resp, R"({"ok":true,"result":)" + std::to_string(i * 10) + "}")
            << "Client " << i << " must receive its own result";
    }
    EXPECT_EQ(stats_->snapshot().total_queries, static_cast<std::uint64_t>(kClientCount));
}

// ---------------------------------------------------------------------------
// StopBeforeRun_NoCrash
//   run() 을 호출하지 않고 stop() 을 호출해도 크래시/hang이 없어야 한다.
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, StopBeforeRun_NoCrash) {
    ASSERT_NO_THROW(server_->stop())
        << "stop() before run() must not throw or crash";
}
