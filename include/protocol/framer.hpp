/*
 * 설명: 수신 바이트를 CRLF(또는 단독 LF) 기준 라인으로 나누고 512 바이트 제한을 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/framer_test.cpp
 */
#pragma once

#include <string>
#include <vector>

namespace protocol {

struct FrameResult {
    std::vector<std::string> lines;
    // 길이 제한을 넘겨 버려진 라인의 앞부분 (진단용)
    std::vector<std::string> rejected;
};

class LineFramer {
   public:
    // max_length 는 CRLF 를 포함한 길이. 내용은 max_length - 2 바이트까지 받는다.
    explicit LineFramer(std::size_t max_length);

    FrameResult Feed(const char *data, std::size_t len);
    std::size_t buffered() const { return buffer_.size(); }

   private:
    std::size_t MaxContent() const;

    std::size_t max_length_;
    std::string buffer_;
    bool discarding_;
    std::string discarded_head_;
};

}  // namespace protocol
