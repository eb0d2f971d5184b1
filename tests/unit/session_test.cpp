/*
 * 설명: 클라이언트 세션의 등록 절차, 자동 PONG, 선택적 expect, 연결 종료/강제 종료 시 대기 해제를 루프백 서버로 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "client/session.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "client/errors.hpp"
#include "fake_server.hpp"

using testing_support::FakePeer;
using testing_support::FakeServer;

namespace {
typedef std::chrono::steady_clock Clock;

client::Identity MakeIdentity(const std::string &nick) {
    client::Identity identity;
    identity.nick = nick;
    identity.username = "tester";
    identity.realname = "unit test";
    return identity;
}

client::SessionOptions FastOptions() {
    client::SessionOptions options;
    options.connect_timeout_ms = 1000;
    options.registration_timeout_ms = 2000;
    options.settle_ms = 500;
    options.expect_timeout_ms = 1000;
    return options;
}

long ElapsedMs(Clock::time_point start) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}
}  // namespace

void TestRegisterPingAndQuit() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);

    std::string pass_line;
    std::string user_line;
    std::string pong_line;
    std::string privmsg_line;
    std::string quit_line;
    bool closed = false;
    std::thread script([&]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        assert(peer->ReadLine(pass_line, 2000));
        std::string line;
        assert(peer->ReadUntil("USER", user_line, 2000));
        peer->SendLine(":fake.local 001 alice :Welcome alice");
        peer->SendLine(":fake.local 375 alice :- motd -");
        peer->SendLine(":fake.local 376 alice :End of MOTD");

        assert(peer->ReadUntil("PING", line, 2000));
        peer->SendLine(":fake.local PONG fake.local :client-token");
        peer->SendLine("PING :server-token");
        assert(peer->ReadUntil("PONG", pong_line, 2000));
        assert(peer->ReadUntil("PRIVMSG", privmsg_line, 2000));
        assert(peer->ReadUntil("QUIT", quit_line, 2000));
        closed = peer->WaitForClose(2000);
    });

    client::ClientSession session(MakeIdentity("alice"), FastOptions(), logger);
    assert(session.registration_state() == client::RegistrationState::kUnregistered);
    session.Open("127.0.0.1", server.port());
    assert(session.connection_state() == net::ConnectionState::kConnected);

    protocol::Message welcome = session.Register("secret");
    assert(welcome.command == "001");
    assert(session.registration_state() == client::RegistrationState::kRegistered);
    // 환영 메시지는 정리되어 있다.
    assert(session.DrainUnexpected().empty());

    session.Ping("client-token");
    session.Expect(client::expect::AllOf(
        {client::expect::Command("PONG"), client::expect::ParamContains("client-token")}));
    // 서버 PING 은 자동으로 응답되고 대기열에도 남는다.
    protocol::Message ping = session.Expect(client::expect::Command("PING"));
    assert(ping.LastParam() == "server-token");

    session.Privmsg("bob", "hello there");
    session.Disconnect("bye");
    script.join();

    assert(pass_line == "PASS secret");
    assert(user_line == "USER tester 0 * :unit test");
    assert(pong_line == "PONG :server-token");
    assert(privmsg_line == "PRIVMSG bob :hello there");
    assert(quit_line == "QUIT :bye");
    assert(closed);
    assert(session.connection_state() == net::ConnectionState::kClosed);
}

void TestRegisterRejected() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        std::string line;
        assert(peer->ReadUntil("USER", line, 2000));
        peer->SendLine(":fake.local 433 * alice :Nickname is already in use");
        peer->WaitForClose(2000);
    });

    client::ClientSession session(MakeIdentity("alice"), FastOptions(), logger);
    session.Open("127.0.0.1", server.port());
    bool threw = false;
    try {
        session.Register("");
    } catch (const client::RegistrationError &ex) {
        threw = true;
        assert(ex.code() == "433");
        assert(std::string(ex.what()).find("433") != std::string::npos);
    }
    assert(threw);
    assert(session.registration_state() == client::RegistrationState::kFailed);
    session.Close();
    script.join();
}

void TestRegisterTimeout() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        peer->WaitForClose(3000);
    });

    client::SessionOptions options = FastOptions();
    options.registration_timeout_ms = 200;
    client::ClientSession session(MakeIdentity("slow"), options, logger);
    session.Open("127.0.0.1", server.port());

    Clock::time_point start = Clock::now();
    bool threw = false;
    try {
        session.Register("");
    } catch (const client::RegistrationError &ex) {
        threw = true;
        assert(ex.code() == "timeout");
    }
    long elapsed = ElapsedMs(start);
    assert(threw);
    assert(elapsed >= 200);
    assert(elapsed < 200 + 1000);
    session.Close();
    script.join();
}

void TestServerCloseFailsPendingExpect() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        assert(!testing_support::ServeRegistration(*peer).empty());
        std::string line;
        assert(peer->ReadUntil("JOIN", line, 2000));
        peer->Close();
    });

    client::ClientSession session(MakeIdentity("carol"), FastOptions(), logger);
    session.Open("127.0.0.1", server.port());
    session.Register("");
    session.Join("#room");

    Clock::time_point start = Clock::now();
    bool threw = false;
    try {
        session.Expect(client::expect::Command("JOIN"), client::Duration(5000));
    } catch (const net::ConnectionClosedError &) {
        threw = true;
    }
    assert(threw);
    assert(ElapsedMs(start) < 2000);
    script.join();

    // 종료 이후의 expect 도 즉시 실패한다.
    threw = false;
    try {
        session.Expect(client::expect::Command("PRIVMSG"), client::Duration(5000));
    } catch (const net::ConnectionClosedError &) {
        threw = true;
    }
    assert(threw);
}

void TestCloseUnblocksExpect() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        assert(!testing_support::ServeRegistration(*peer).empty());
        peer->WaitForClose(3000);
    });

    client::ClientSession session(MakeIdentity("dave"), FastOptions(), logger);
    session.Open("127.0.0.1", server.port());
    session.Register("");

    bool closed_error = false;
    Clock::time_point start = Clock::now();
    std::thread waiter([&session, &closed_error]() {
        try {
            session.Expect(client::expect::Command("KICK"), client::Duration(10000));
        } catch (const net::ConnectionClosedError &) {
            closed_error = true;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    session.Close();
    waiter.join();
    assert(closed_error);
    assert(ElapsedMs(start) < 2000);
    session.Close();
    script.join();
}

void TestViolationAndTimeoutDiagnostics() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        assert(!testing_support::ServeRegistration(*peer).empty());
        std::string line;
        assert(peer->ReadUntil("MODE", line, 2000));
        peer->SendRaw(std::string(700, 'x') + "\r\n");
        peer->SendLine(":fake.local NOTICE erin :still here");
        peer->WaitForClose(3000);
    });

    client::ClientSession session(MakeIdentity("erin"), FastOptions(), logger);
    session.Open("127.0.0.1", server.port());
    session.Register("");
    session.Mode("erin");

    bool parse_error = false;
    try {
        session.Expect(client::expect::Command("MODE"), client::Duration(2000));
    } catch (const protocol::ParseError &ex) {
        parse_error = true;
        assert(ex.line() == std::string(64, 'x'));
    }
    assert(parse_error);

    bool timed_out = false;
    try {
        session.Expect(client::expect::Command("MODE"), client::Duration(300));
    } catch (const client::TimeoutError &ex) {
        timed_out = true;
        assert(ex.pending().size() == 1);
        assert(ex.pending()[0].find("NOTICE erin :still here") != std::string::npos);
    }
    assert(timed_out);

    session.Nick("erin2");
    assert(session.nick() == "erin2");
    assert(session.identity().username == "tester");
    session.Close();
    script.join();
}

int main() {
    TestRegisterPingAndQuit();
    TestRegisterRejected();
    TestRegisterTimeout();
    TestServerCloseFailsPendingExpect();
    TestCloseUnblocksExpect();
    TestViolationAndTimeoutDiagnostics();
    return 0;
}
