/*
 * 설명: getaddrinfo 기반 연결, 제한 시간 있는 non-blocking connect, 라인 단위 송수신과 멱등 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/connection_test.cpp
 */
#include "net/connection.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "protocol/message.hpp"

namespace {
const std::size_t kReadChunk = 4096;

// 성공 시 빈 문자열, 실패 시 원인을 돌려준다.
std::string ConnectWithTimeout(int fd, const sockaddr *addr, socklen_t len, std::size_t timeout_ms) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::string("fcntl 실패: ") + std::strerror(errno);
    }

    if (::connect(fd, addr, len) < 0) {
        if (errno != EINPROGRESS) {
            return std::strerror(errno);
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ret = 0;
        do {
            ret = poll(&pfd, 1, static_cast<int>(timeout_ms));
        } while (ret < 0 && errno == EINTR);
        if (ret == 0) {
            return "연결 시간 초과";
        }
        if (ret < 0) {
            return std::string("poll 실패: ") + std::strerror(errno);
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
            return std::string("getsockopt 실패: ") + std::strerror(errno);
        }
        if (so_error != 0) {
            return std::strerror(so_error);
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        return std::string("fcntl 실패: ") + std::strerror(errno);
    }
    return std::string();
}
}  // namespace

namespace net {

Connection::Connection()
    : fd_(-1),
      state_(static_cast<int>(ConnectionState::kDisconnected)),
      framer_(protocol::kMaxLineLength) {}

Connection::~Connection() { Close(); }

void Connection::Connect(const std::string &host, int port, std::size_t timeout_ms) {
    if (state() != ConnectionState::kDisconnected) {
        throw ConnectError("이미 사용된 연결");
    }

    std::ostringstream peer;
    peer << host << ":" << port;
    peer_ = peer.str();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::ostringstream service;
    service << port;
    struct addrinfo *results = NULL;
    int rc = getaddrinfo(host.c_str(), service.str().c_str(), &hints, &results);
    if (rc != 0) {
        throw ConnectError(peer_ + " 주소 해석 실패: " + gai_strerror(rc));
    }

    std::string last_error = "주소 없음";
    int fd = -1;
    for (struct addrinfo *ai = results; ai != NULL; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("소켓 생성 실패: ") + std::strerror(errno);
            continue;
        }
        last_error = ConnectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms);
        if (last_error.empty()) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) {
        throw ConnectError(peer_ + " 연결 실패: " + last_error);
    }

    fd_ = fd;
    state_ = static_cast<int>(ConnectionState::kConnected);
}

void Connection::Send(const std::string &line) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    int fd = fd_.load();
    if (fd < 0 || state() != ConnectionState::kConnected) {
        throw ConnectionClosedError(peer_ + " 송신 불가: 연결 닫힘 (" + line + ")");
    }

    std::string data = line + "\r\n";
    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        std::string reason = std::string("송신 실패: ") + std::strerror(errno);
        MarkClosed(reason);
        throw ConnectionClosedError(peer_ + " " + reason);
    }
}

bool Connection::ReceiveLine(std::string &line) {
    while (true) {
        if (!rejected_.empty()) {
            std::string head = rejected_.front();
            rejected_.pop_front();
            throw protocol::ParseError("라인 길이 초과 (512 바이트)", head);
        }
        if (!pending_.empty()) {
            line = pending_.front();
            pending_.pop_front();
            return true;
        }

        int fd = fd_.load();
        if (fd < 0) {
            MarkClosed("소켓 닫힘");
            return false;
        }

        char buf[kReadChunk];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            protocol::FrameResult res = framer_.Feed(buf, static_cast<std::size_t>(n));
            pending_.insert(pending_.end(), res.lines.begin(), res.lines.end());
            rejected_.insert(rejected_.end(), res.rejected.begin(), res.rejected.end());
            continue;
        }
        if (n == 0) {
            MarkClosed("서버가 연결을 닫음");
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        MarkClosed(std::string("수신 실패: ") + std::strerror(errno));
        return false;
    }
}

void Connection::Shutdown() {
    int fd = fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void Connection::Close() {
    std::lock_guard<std::mutex> lock(send_mutex_);
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
    MarkClosed("로컬에서 닫음");
}

ConnectionState Connection::state() const { return static_cast<ConnectionState>(state_.load()); }

std::string Connection::close_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return close_reason_;
}

void Connection::MarkClosed(const std::string &reason) {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    if (state_.load() == static_cast<int>(ConnectionState::kClosed)) {
        return;
    }
    if (state_.load() == static_cast<int>(ConnectionState::kConnected)) {
        close_reason_ = reason;
    }
    state_ = static_cast<int>(ConnectionState::kClosed);
}

}  // namespace net
