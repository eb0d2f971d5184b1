/*
 * 설명: 세션 등록 절차, 명령 송신, 백그라운드 수신 루프(자동 PONG 포함)와 기대 대기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp
 */
#include "client/session.hpp"

#include <sstream>

#include "client/errors.hpp"
#include "protocol/numerics.hpp"

namespace {
std::string FormatMillis(client::Duration duration) {
    std::ostringstream oss;
    oss << duration.count() << "ms";
    return oss.str();
}
}  // namespace

namespace client {

SessionOptions::SessionOptions()
    : connect_timeout_ms(5000),
      registration_timeout_ms(10000),
      settle_ms(1000),
      expect_timeout_ms(5000),
      queue_capacity(4096),
      auto_pong(true) {}

SessionOptions OptionsFromSettings(const config::Settings &settings) {
    SessionOptions options;
    options.connect_timeout_ms = settings.registration_timeout_ms;
    options.registration_timeout_ms = settings.registration_timeout_ms;
    options.settle_ms = settings.settle_ms;
    options.expect_timeout_ms = settings.expect_timeout_ms;
    options.queue_capacity = settings.queue_capacity;
    return options;
}

ClientSession::ClientSession(const Identity &identity, const SessionOptions &options, Logger &logger)
    : identity_(identity),
      options_(options),
      logger_(logger),
      queue_(options.queue_capacity),
      registration_state_(static_cast<int>(RegistrationState::kUnregistered)),
      closed_(false) {}

ClientSession::~ClientSession() { Close(); }

void ClientSession::Open(const std::string &host, int port) {
    connection_.Connect(host, port, options_.connect_timeout_ms);

    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        // 연결 도중 Close 가 호출된 경우
        connection_.Close();
        throw net::ConnectError(nick() + ": 연결 중 세션이 닫힘");
    }
    logger_.Log(config::LogLevel::kDebug, nick() + ": " + connection_.peer() + " 연결됨");
    reader_ = std::thread(&ClientSession::ReceiveLoop, this);
}

protocol::Message ClientSession::Register(const std::string &password) {
    Identity id = identity();
    registration_state_ = static_cast<int>(RegistrationState::kRegistrationSent);
    if (!password.empty()) {
        Send("PASS", {password});
    }
    Send("NICK", {id.nick});

    protocol::Message user = protocol::MakeMessage("USER", {id.username, "0", "*"});
    user.has_trailing = true;
    user.trailing = id.realname;
    Send(user);

    const Expectation outcome = expect::AnyOf({expect::Numeric(protocol::numeric::kWelcome),
                                               expect::Numeric(protocol::numeric::kErroneusNickname),
                                               expect::Numeric(protocol::numeric::kNicknameInUse),
                                               expect::Numeric(protocol::numeric::kNickCollision),
                                               expect::Numeric(protocol::numeric::kPasswdMismatch),
                                               expect::Command("ERROR")});
    protocol::Message reply;
    bool replied = false;
    try {
        replied = TryExpect(outcome, Duration(options_.registration_timeout_ms), reply);
    } catch (const net::ConnectionClosedError &ex) {
        FailRegistration(id.nick + ": 등록 중 연결 종료 - " + ex.what(), "closed");
    } catch (const protocol::ParseError &) {
        registration_state_ = static_cast<int>(RegistrationState::kFailed);
        throw;
    }

    if (!replied) {
        FailRegistration(id.nick + ": " + FormatMillis(Duration(options_.registration_timeout_ms)) +
                             " 안에 001 을 받지 못함",
                         "timeout");
    }
    if (reply.command != protocol::numeric::kWelcome) {
        FailRegistration(id.nick + ": 등록 거부 - " + protocol::DescribeMessage(reply), reply.command);
    }

    registration_state_ = static_cast<int>(RegistrationState::kRegistered);
    logger_.Log(config::LogLevel::kDebug, id.nick + ": 등록 완료");

    // 환영 메시지(MOTD 등)를 정리해 시나리오가 빈 대기열에서 시작하도록 한다.
    if (options_.settle_ms > 0) {
        protocol::Message motd_end;
        TryExpect(expect::AnyOf({expect::Numeric(protocol::numeric::kEndOfMotd),
                                 expect::Numeric(protocol::numeric::kNoMotd)}),
                  Duration(options_.settle_ms), motd_end);
    }
    std::vector<protocol::Message> burst = DrainUnexpected();
    std::ostringstream oss;
    oss << id.nick << ": 환영 메시지 " << burst.size() << "줄 정리";
    logger_.Log(config::LogLevel::kDebug, oss.str());
    return reply;
}

void ClientSession::FailRegistration(const std::string &what, const std::string &code) {
    registration_state_ = static_cast<int>(RegistrationState::kFailed);
    logger_.Log(config::LogLevel::kDebug, what);
    throw RegistrationError(what, code);
}

void ClientSession::Send(const protocol::Message &msg) {
    std::string line = protocol::SerializeMessage(msg);
    if (logger_.IsEnabled(config::LogLevel::kDebug)) {
        logger_.Log(config::LogLevel::kDebug, nick() + " >> " + line);
    }
    connection_.Send(line);
}

void ClientSession::Send(const std::string &command, const std::vector<std::string> &params) {
    Send(protocol::MakeMessage(command, params));
}

void ClientSession::Nick(const std::string &nick) {
    Send("NICK", {nick});
    std::lock_guard<std::mutex> lock(identity_mutex_);
    identity_.nick = nick;
}

void ClientSession::Join(const std::string &channel, const std::string &key) {
    if (key.empty()) {
        Send("JOIN", {channel});
    } else {
        Send("JOIN", {channel, key});
    }
}

void ClientSession::Part(const std::string &channel, const std::string &reason) {
    protocol::Message msg = protocol::MakeMessage("PART", {channel});
    if (!reason.empty()) {
        msg.has_trailing = true;
        msg.trailing = reason;
    }
    Send(msg);
}

void ClientSession::Privmsg(const std::string &target, const std::string &text) {
    protocol::Message msg = protocol::MakeMessage("PRIVMSG", {target});
    msg.has_trailing = true;
    msg.trailing = text;
    Send(msg);
}

void ClientSession::Kick(const std::string &channel, const std::string &target,
                         const std::string &reason) {
    protocol::Message msg = protocol::MakeMessage("KICK", {channel, target});
    if (!reason.empty()) {
        msg.has_trailing = true;
        msg.trailing = reason;
    }
    Send(msg);
}

void ClientSession::Invite(const std::string &nick, const std::string &channel) {
    Send("INVITE", {nick, channel});
}

void ClientSession::Topic(const std::string &channel) { Send("TOPIC", {channel}); }

void ClientSession::SetTopic(const std::string &channel, const std::string &topic) {
    protocol::Message msg = protocol::MakeMessage("TOPIC", {channel});
    msg.has_trailing = true;
    msg.trailing = topic;
    Send(msg);
}

void ClientSession::Mode(const std::string &target, const std::string &flags,
                         const std::vector<std::string> &args) {
    std::vector<std::string> params(1, target);
    if (!flags.empty()) {
        params.push_back(flags);
        params.insert(params.end(), args.begin(), args.end());
    }
    Send("MODE", params);
}

void ClientSession::Ping(const std::string &token) {
    protocol::Message msg = protocol::MakeMessage("PING", std::vector<std::string>());
    msg.has_trailing = true;
    msg.trailing = token;
    Send(msg);
}

void ClientSession::Quit(const std::string &reason) {
    protocol::Message msg = protocol::MakeMessage("QUIT", std::vector<std::string>());
    msg.has_trailing = true;
    msg.trailing = reason;
    Send(msg);
}

protocol::Message ClientSession::Expect(const Expectation &expectation) {
    return Expect(expectation, Duration(options_.expect_timeout_ms));
}

protocol::Message ClientSession::Expect(const Expectation &expectation, Duration timeout) {
    protocol::Message msg;
    if (!TryExpect(expectation, timeout, msg)) {
        throw TimeoutError(nick() + ": " + FormatMillis(timeout) + " 안에 받지 못함: " +
                               expectation.description,
                           queue_.Snapshot());
    }
    return msg;
}

bool ClientSession::TryExpect(const Expectation &expectation, Duration timeout,
                              protocol::Message &out) {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;
    InboundEntry entry;
    switch (queue_.WaitFor(expectation.matches, deadline, entry)) {
        case WaitStatus::kMatched:
            out = entry.message;
            return true;
        case WaitStatus::kTimedOut:
            return false;
        case WaitStatus::kClosed:
            throw net::ConnectionClosedError(nick() + ": '" + expectation.description +
                                             "' 대기 중 연결 종료 (" + entry.detail + ")");
        case WaitStatus::kViolation:
            throw protocol::ParseError(nick() + ": 프로토콜 위반 수신 - " + entry.detail, entry.raw);
    }
    return false;
}

bool ClientSession::TryExpectAll(const std::vector<Expectation> &all, Duration timeout,
                                 std::vector<protocol::Message> &out,
                                 std::vector<std::size_t> &unmet) {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<MessagePredicate> predicates;
    for (std::size_t i = 0; i < all.size(); ++i) {
        predicates.push_back(all[i].matches);
    }

    std::vector<InboundEntry> matched;
    InboundEntry stop;
    switch (queue_.WaitForAll(predicates, deadline, matched, unmet, stop)) {
        case WaitStatus::kMatched:
            out.clear();
            for (std::size_t i = 0; i < matched.size(); ++i) {
                out.push_back(matched[i].message);
            }
            return true;
        case WaitStatus::kTimedOut:
            return false;
        case WaitStatus::kClosed:
            throw net::ConnectionClosedError(nick() + ": 복수 기대 대기 중 연결 종료 (" +
                                             stop.detail + ")");
        case WaitStatus::kViolation:
            throw protocol::ParseError(nick() + ": 프로토콜 위반 수신 - " + stop.detail, stop.raw);
    }
    return false;
}

std::vector<protocol::Message> ClientSession::DrainUnexpected() {
    std::vector<InboundEntry> entries = queue_.DrainMessages();
    std::vector<protocol::Message> messages;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        messages.push_back(entries[i].message);
    }
    return messages;
}

std::vector<std::string> ClientSession::PendingLines() const { return queue_.Snapshot(); }

void ClientSession::Disconnect(const std::string &reason) {
    if (connection_.state() == net::ConnectionState::kConnected) {
        try {
            Quit(reason);
        } catch (const net::ConnectionClosedError &ex) {
            logger_.Log(config::LogLevel::kDebug, nick() + ": QUIT 송신 실패 - " + ex.what());
        }
    }
    Close();
}

void ClientSession::Close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    connection_.Shutdown();
    queue_.Close("세션 종료");
    if (reader_.joinable()) {
        reader_.join();
    }
    connection_.Close();
}

std::string ClientSession::nick() const {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    return identity_.nick;
}

Identity ClientSession::identity() const {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    return identity_;
}

RegistrationState ClientSession::registration_state() const {
    return static_cast<RegistrationState>(registration_state_.load());
}

void ClientSession::ReceiveLoop() {
    while (true) {
        std::string line;
        try {
            if (!connection_.ReceiveLine(line)) {
                break;
            }
        } catch (const protocol::ParseError &ex) {
            logger_.Log(config::LogLevel::kWarn, nick() + ": " + ex.what() + ": " + ex.line());
            if (!queue_.PushViolation(ex.line(), ex.what())) {
                break;
            }
            continue;
        }

        if (logger_.IsEnabled(config::LogLevel::kDebug)) {
            logger_.Log(config::LogLevel::kDebug, nick() + " << " + line);
        }

        protocol::Message msg;
        try {
            msg = protocol::ParseMessage(line);
        } catch (const protocol::ParseError &ex) {
            logger_.Log(config::LogLevel::kWarn, nick() + ": " + ex.what() + ": " + line);
            if (!queue_.PushViolation(line, ex.what())) {
                break;
            }
            continue;
        }

        if (options_.auto_pong && msg.IsCommand("PING")) {
            protocol::Message pong = protocol::MakeMessage("PONG", std::vector<std::string>());
            if (msg.ParamCount() > 0) {
                pong.has_trailing = true;
                pong.trailing = msg.LastParam();
            }
            try {
                Send(pong);
            } catch (const net::ConnectionClosedError &ex) {
                logger_.Log(config::LogLevel::kDebug, nick() + ": PONG 송신 실패 - " + ex.what());
            } catch (const std::invalid_argument &ex) {
                logger_.Log(config::LogLevel::kWarn, nick() + ": PONG 구성 실패 - " + ex.what());
            }
        }

        if (!queue_.PushMessage(msg, line)) {
            break;
        }
    }

    std::string reason = connection_.close_reason();
    queue_.PushDisconnect(reason.empty() ? "연결 종료" : reason);
    logger_.Log(config::LogLevel::kDebug, nick() + ": 수신 루프 종료 (" + reason + ")");
}

}  // namespace client
