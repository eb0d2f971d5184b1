/*
 * 설명: 대상 서버와의 TCP 소켓 하나를 소유하고 바이트 스트림을 IRC 라인 단위로 송수신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/connection_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>

#include "protocol/framer.hpp"

namespace net {

class ConnectError : public std::runtime_error {
   public:
    explicit ConnectError(const std::string &what) : std::runtime_error(what) {}
};

class ConnectionClosedError : public std::runtime_error {
   public:
    explicit ConnectionClosedError(const std::string &what) : std::runtime_error(what) {}
};

enum class ConnectionState { kDisconnected = 0, kConnected = 1, kClosed = 2 };

class Connection {
   public:
    Connection();
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // 재시도하지 않는다. 실패하면 ConnectError.
    void Connect(const std::string &host, int port, std::size_t timeout_ms);
    // CRLF 를 붙여 한 줄을 모두 쓴다. 쓰기 실패 시 ConnectionClosedError.
    void Send(const std::string &line);
    // 한 번에 한 줄. 상대가 닫았거나 소켓 오류면 false. 길이 초과 라인은 ParseError.
    bool ReceiveLine(std::string &line);
    // 다른 스레드에서 대기 중인 ReceiveLine 을 깨운다.
    void Shutdown();
    void Close();

    ConnectionState state() const;
    const std::string &peer() const { return peer_; }
    std::string close_reason() const;

   private:
    void MarkClosed(const std::string &reason);

    std::atomic<int> fd_;
    std::atomic<int> state_;
    std::string peer_;
    protocol::LineFramer framer_;
    std::deque<std::string> pending_;
    std::deque<std::string> rejected_;
    std::mutex send_mutex_;
    mutable std::mutex reason_mutex_;
    std::string close_reason_;
};

}  // namespace net
