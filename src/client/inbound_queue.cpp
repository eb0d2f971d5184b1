/*
 * 설명: 용량 제한, 도착 순서 보존, 연결 종료 표지를 가진 세션 수신 대기열을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/inbound_queue_test.cpp
 */
#include "client/inbound_queue.hpp"

#include <cstddef>
#include <sstream>

namespace {
// 증가 경로 탐색. 조건 p 에 후보 항목을 하나씩 시도하고, 이미 주인이 있으면 그 주인을 옮겨 본다.
bool Augment(std::size_t p, const std::vector<std::vector<std::size_t> > &candidates,
             std::vector<bool> &visited, std::vector<int> &owner, std::vector<int> &assigned) {
    for (std::size_t c = 0; c < candidates[p].size(); ++c) {
        std::size_t entry = candidates[p][c];
        if (visited[entry]) {
            continue;
        }
        visited[entry] = true;
        if (owner[entry] < 0 ||
            Augment(static_cast<std::size_t>(owner[entry]), candidates, visited, owner, assigned)) {
            owner[entry] = static_cast<int>(p);
            assigned[p] = static_cast<int>(entry);
            return true;
        }
    }
    return false;
}
}  // namespace

namespace client {

InboundQueue::InboundQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity),
      next_seq_(0),
      closed_(false),
      disconnect_queued_(false) {}

bool InboundQueue::PushMessage(const protocol::Message &msg, const std::string &raw) {
    InboundEntry entry;
    entry.kind = EntryKind::kMessage;
    entry.message = msg;
    entry.raw = raw;
    std::unique_lock<std::mutex> lock(mutex_);
    return PushLocked(lock, entry);
}

bool InboundQueue::PushViolation(const std::string &raw, const std::string &detail) {
    InboundEntry entry;
    entry.kind = EntryKind::kViolation;
    entry.raw = raw;
    entry.detail = detail;
    std::unique_lock<std::mutex> lock(mutex_);
    return PushLocked(lock, entry);
}

bool InboundQueue::PushLocked(std::unique_lock<std::mutex> &lock, const InboundEntry &entry) {
    space_.wait(lock, [this]() { return closed_ || entries_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    entries_.push_back(entry);
    entries_.back().seq = ++next_seq_;
    arrived_.notify_all();
    return true;
}

void InboundQueue::PushDisconnect(const std::string &reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!disconnect_queued_) {
        InboundEntry entry;
        entry.kind = EntryKind::kDisconnect;
        entry.detail = reason;
        entry.seq = ++next_seq_;
        entries_.push_back(entry);
        disconnect_queued_ = true;
    }
    if (!closed_) {
        closed_ = true;
        close_reason_ = reason;
    }
    arrived_.notify_all();
    space_.notify_all();
}

void InboundQueue::Close(const std::string &reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        closed_ = true;
        close_reason_ = reason;
    }
    arrived_.notify_all();
    space_.notify_all();
}

WaitStatus InboundQueue::WaitFor(const MessagePredicate &predicate,
                                 std::chrono::steady_clock::time_point deadline,
                                 InboundEntry &out) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        for (std::deque<InboundEntry>::iterator it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->kind == EntryKind::kDisconnect) {
                out = *it;
                return WaitStatus::kClosed;
            }
            if (it->kind == EntryKind::kViolation) {
                out = *it;
                entries_.erase(it);
                space_.notify_all();
                return WaitStatus::kViolation;
            }
            if (predicate(it->message)) {
                out = *it;
                entries_.erase(it);
                space_.notify_all();
                return WaitStatus::kMatched;
            }
        }

        if (closed_) {
            out = InboundEntry();
            out.kind = EntryKind::kDisconnect;
            out.detail = close_reason_;
            return WaitStatus::kClosed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return WaitStatus::kTimedOut;
        }
        arrived_.wait_until(lock, deadline);
    }
}

std::size_t InboundQueue::AssignLocked(const std::vector<MessagePredicate> &predicates,
                                       std::vector<int> &assigned, std::size_t &scan_end) const {
    scan_end = 0;
    while (scan_end < entries_.size() && entries_[scan_end].kind == EntryKind::kMessage) {
        ++scan_end;
    }

    std::vector<std::vector<std::size_t> > candidates(predicates.size());
    for (std::size_t p = 0; p < predicates.size(); ++p) {
        for (std::size_t i = 0; i < scan_end; ++i) {
            if (predicates[p](entries_[i].message)) {
                candidates[p].push_back(i);
            }
        }
    }

    assigned.assign(predicates.size(), -1);
    std::vector<int> owner(scan_end, -1);
    std::size_t count = 0;
    for (std::size_t p = 0; p < predicates.size(); ++p) {
        std::vector<bool> visited(scan_end, false);
        if (Augment(p, candidates, visited, owner, assigned)) {
            ++count;
        }
    }
    return count;
}

WaitStatus InboundQueue::WaitForAll(const std::vector<MessagePredicate> &predicates,
                                    std::chrono::steady_clock::time_point deadline,
                                    std::vector<InboundEntry> &matched,
                                    std::vector<std::size_t> &unmet, InboundEntry &stop) {
    matched.clear();
    unmet.clear();
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        std::vector<int> assigned;
        std::size_t scan_end = 0;
        if (AssignLocked(predicates, assigned, scan_end) == predicates.size()) {
            std::vector<bool> taken(entries_.size(), false);
            for (std::size_t p = 0; p < assigned.size(); ++p) {
                matched.push_back(entries_[static_cast<std::size_t>(assigned[p])]);
                taken[static_cast<std::size_t>(assigned[p])] = true;
            }
            std::deque<InboundEntry> kept;
            for (std::size_t i = 0; i < entries_.size(); ++i) {
                if (!taken[i]) {
                    kept.push_back(entries_[i]);
                }
            }
            entries_.swap(kept);
            space_.notify_all();
            return WaitStatus::kMatched;
        }

        if (scan_end < entries_.size()) {
            stop = entries_[scan_end];
            if (stop.kind == EntryKind::kDisconnect) {
                return WaitStatus::kClosed;
            }
            entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(scan_end));
            space_.notify_all();
            return WaitStatus::kViolation;
        }
        if (closed_) {
            stop = InboundEntry();
            stop.kind = EntryKind::kDisconnect;
            stop.detail = close_reason_;
            return WaitStatus::kClosed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            for (std::size_t p = 0; p < assigned.size(); ++p) {
                if (assigned[p] < 0) {
                    unmet.push_back(p);
                }
            }
            return WaitStatus::kTimedOut;
        }
        arrived_.wait_until(lock, deadline);
    }
}

std::vector<InboundEntry> InboundQueue::DrainMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InboundEntry> drained;
    std::deque<InboundEntry> kept;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].kind == EntryKind::kMessage) {
            drained.push_back(entries_[i]);
        } else {
            kept.push_back(entries_[i]);
        }
    }
    entries_.swap(kept);
    space_.notify_all();
    return drained;
}

std::vector<std::string> InboundQueue::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lines;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        lines.push_back(DescribeEntry(entries_[i]));
    }
    return lines;
}

std::uint64_t InboundQueue::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_;
}

std::size_t InboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string DescribeEntry(const InboundEntry &entry) {
    std::ostringstream oss;
    oss << "#" << entry.seq << " ";
    switch (entry.kind) {
        case EntryKind::kMessage:
            oss << protocol::DescribeMessage(entry.message);
            break;
        case EntryKind::kViolation:
            oss << "<프로토콜 위반: " << entry.detail << "> " << entry.raw;
            break;
        case EntryKind::kDisconnect:
            oss << "<연결 종료: " << entry.detail << ">";
            break;
    }
    return oss.str();
}

}  // namespace client
