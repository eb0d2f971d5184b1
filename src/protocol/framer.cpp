/*
 * 설명: 조각난 입력을 누적해 완성된 라인만 꺼내고, 길이 초과 라인은 종결자까지 버린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/framer_test.cpp
 */
#include "protocol/framer.hpp"

#include <cstddef>

namespace {
const std::size_t kRejectedHeadLength = 64;
}

namespace protocol {

LineFramer::LineFramer(std::size_t max_length) : max_length_(max_length), discarding_(false) {}

std::size_t LineFramer::MaxContent() const {
    return max_length_ > 2 ? max_length_ - 2 : 0;
}

FrameResult LineFramer::Feed(const char *data, std::size_t len) {
    FrameResult result;
    buffer_.append(data, len);

    std::size_t pos = std::string::npos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        if (discarding_) {
            discarding_ = false;
            result.rejected.push_back(discarded_head_);
            discarded_head_.clear();
            continue;
        }

        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        // 빈 라인은 RFC 1459 2.3.1 에 따라 무시한다.
        if (line.empty()) {
            continue;
        }
        // 한도는 내용 기준 (max_length_ - 2). 종결자가 단독 LF 여도 같은 한도를 쓴다.
        if (line.size() > MaxContent()) {
            result.rejected.push_back(line.substr(0, kRejectedHeadLength));
            continue;
        }
        result.lines.push_back(line);
    }

    // 뒤따를 수 있는 CR 하나를 빼고도 한도를 넘긴 미완성 라인은 다음 LF 까지 버린다.
    if (buffer_.size() > MaxContent() + 1) {
        if (!discarding_) {
            discarding_ = true;
            discarded_head_ = buffer_.substr(0, kRejectedHeadLength);
        }
        buffer_.clear();
    }

    return result;
}

}  // namespace protocol
