/*
 * 설명: 연결 하나를 감싸 등록 절차(PASS/NICK/USER)를 진행하고, 백그라운드 수신 루프가 채우는
 *       대기열 위에서 send/expect API 를 제공하는 테스트용 IRC 클라이언트 세션.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/expect.hpp"
#include "client/inbound_queue.hpp"
#include "net/connection.hpp"
#include "protocol/message.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

namespace client {

struct Identity {
    std::string nick;
    std::string username;
    std::string realname;
};

enum class RegistrationState { kUnregistered = 0, kRegistrationSent = 1, kRegistered = 2, kFailed = 3 };

struct SessionOptions {
    std::size_t connect_timeout_ms;
    std::size_t registration_timeout_ms;
    std::size_t settle_ms;
    std::size_t expect_timeout_ms;
    std::size_t queue_capacity;
    bool auto_pong;

    SessionOptions();
};

SessionOptions OptionsFromSettings(const config::Settings &settings);

class ClientSession {
   public:
    ClientSession(const Identity &identity, const SessionOptions &options, Logger &logger);
    ~ClientSession();

    ClientSession(const ClientSession &) = delete;
    ClientSession &operator=(const ClientSession &) = delete;

    // 연결 후 수신 루프를 시작한다. 실패하면 net::ConnectError.
    void Open(const std::string &host, int port);
    // 001 을 받으면 그 메시지를 돌려준다. 거부/시간 초과/연결 종료는 RegistrationError.
    protocol::Message Register(const std::string &password);

    void Send(const protocol::Message &msg);
    void Send(const std::string &command, const std::vector<std::string> &params);

    // 로컬 닉네임도 즉시 바꾼다 (서버 확인 여부는 호출자가 기대로 검사).
    void Nick(const std::string &nick);
    void Join(const std::string &channel, const std::string &key = "");
    void Part(const std::string &channel, const std::string &reason = "");
    void Privmsg(const std::string &target, const std::string &text);
    void Kick(const std::string &channel, const std::string &target, const std::string &reason = "");
    void Invite(const std::string &nick, const std::string &channel);
    void Topic(const std::string &channel);
    void SetTopic(const std::string &channel, const std::string &topic);
    void Mode(const std::string &target, const std::string &flags = "",
              const std::vector<std::string> &args = std::vector<std::string>());
    void Ping(const std::string &token);
    void Quit(const std::string &reason);

    protocol::Message Expect(const Expectation &expectation);
    protocol::Message Expect(const Expectation &expectation, Duration timeout);
    // 시간 초과는 false. 연결 종료와 프로토콜 위반은 Expect 와 같이 예외로 알린다.
    bool TryExpect(const Expectation &expectation, Duration timeout, protocol::Message &out);
    // 모든 기대를 서로 다른 메시지로 만족시키면 true 와 기대 순서의 메시지들.
    // 시간 초과면 false 이고 unmet 에 만족되지 않은 기대 번호가 남는다.
    bool TryExpectAll(const std::vector<Expectation> &all, Duration timeout,
                      std::vector<protocol::Message> &out, std::vector<std::size_t> &unmet);
    std::vector<protocol::Message> DrainUnexpected();
    std::vector<std::string> PendingLines() const;

    // QUIT 을 보내 보고 닫는다.
    void Disconnect(const std::string &reason);
    // 멱등. 대기 중인 Expect 를 즉시 깨운다.
    void Close();

    std::string nick() const;
    Identity identity() const;
    const SessionOptions &options() const { return options_; }
    RegistrationState registration_state() const;
    net::ConnectionState connection_state() const { return connection_.state(); }
    std::uint64_t received_count() const { return queue_.last_seq(); }

   private:
    void ReceiveLoop();
    void FailRegistration(const std::string &what, const std::string &code);

    Identity identity_;
    SessionOptions options_;
    Logger &logger_;
    net::Connection connection_;
    InboundQueue queue_;
    std::thread reader_;
    std::atomic<int> registration_state_;
    mutable std::mutex identity_mutex_;
    std::mutex close_mutex_;
    bool closed_;
};

}  // namespace client
