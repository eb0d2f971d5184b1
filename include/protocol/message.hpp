/*
 * 설명: IRC 라인을 prefix/command/middle/trailing 으로 파싱하고 역으로 직렬화한다. 닉네임과 source(nick!user@host) 유틸을 포함한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace protocol {

const std::size_t kMaxLineLength = 512;
const std::size_t kMaxMiddleParams = 14;

class ParseError : public std::runtime_error {
   public:
    ParseError(const std::string &what, const std::string &line)
        : std::runtime_error(what), line_(line) {}

    const std::string &line() const { return line_; }

   private:
    std::string line_;
};

struct Message {
    std::string prefix;
    std::string command;
    std::vector<std::string> params;
    bool has_trailing;
    std::string trailing;

    Message() : has_trailing(false) {}

    // middle 파라미터 뒤에 trailing 을 붙인 전체 파라미터 목록
    std::vector<std::string> AllParams() const;
    // 전체 파라미터 기준 인덱스 접근. 범위 밖이면 빈 문자열.
    std::string Param(std::size_t index) const;
    std::size_t ParamCount() const;
    std::string LastParam() const;
    bool IsCommand(const std::string &name) const;
};

struct Source {
    std::string nick;
    std::string user;
    std::string host;
};

// 라인에는 CRLF 가 포함되지 않아야 한다.
Message ParseMessage(const std::string &line);
// CRLF 없이 한 줄을 만든다. 구조적으로 잘못된 메시지는 std::invalid_argument.
std::string SerializeMessage(const Message &msg);
// 진단 출력용. 직렬화할 수 없는 (비정형 입력에서 온) 메시지는 필드를 나열한다.
std::string DescribeMessage(const Message &msg);
// 마지막 파라미터가 공백/빈 문자열/':' 시작이면 trailing 으로 옮긴다.
Message MakeMessage(const std::string &command, const std::vector<std::string> &params);

Source ParseSource(const std::string &prefix);
bool IsNumeric(const std::string &command);
bool IsValidNickname(const std::string &nick);
// RFC 1459 대소문자 규칙: A-Z 외에 {}|^ 를 []\~ 와 같은 문자로 본다.
char FoldCase(char c);
bool EqualsIgnoreCase(const std::string &lhs, const std::string &rhs);
std::string ToUpper(const std::string &text);

}  // namespace protocol
