/*
 * 설명: IRC 라인 파싱/직렬화와 source, 닉네임 검증 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#include "protocol/message.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace {
const std::string kForbiddenChars("\r\n\0", 3);

bool IsSpecial(unsigned char ch) {
    return ch == '[' || ch == ']' || ch == '\\' || ch == '`' || ch == '_' || ch == '^' ||
           ch == '{' || ch == '|' || ch == '}';
}

bool IsValidCommand(const std::string &command) {
    if (command.empty()) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(command[0]))) {
        return protocol::IsNumeric(command);
    }
    for (std::size_t i = 0; i < command.size(); ++i) {
        if (!std::isalpha(static_cast<unsigned char>(command[i]))) {
            return false;
        }
    }
    return true;
}

bool IsValidMiddle(const std::string &param) {
    return !param.empty() && param[0] != ':' && param.find(' ') == std::string::npos &&
           param.find_first_of(kForbiddenChars) == std::string::npos;
}

bool NeedsTrailing(const std::string &param) {
    return param.empty() || param[0] == ':' || param.find(' ') != std::string::npos;
}
}  // namespace

namespace protocol {

std::vector<std::string> Message::AllParams() const {
    std::vector<std::string> all = params;
    if (has_trailing) {
        all.push_back(trailing);
    }
    return all;
}

std::string Message::Param(std::size_t index) const {
    if (index < params.size()) {
        return params[index];
    }
    if (has_trailing && index == params.size()) {
        return trailing;
    }
    return std::string();
}

std::size_t Message::ParamCount() const { return params.size() + (has_trailing ? 1 : 0); }

std::string Message::LastParam() const {
    if (has_trailing) {
        return trailing;
    }
    return params.empty() ? std::string() : params.back();
}

bool Message::IsCommand(const std::string &name) const { return EqualsIgnoreCase(command, name); }

Message ParseMessage(const std::string &line) {
    if (line.empty()) {
        throw ParseError("빈 라인", line);
    }
    // CRLF 두 바이트를 포함해 512 바이트를 넘으면 잘라내지 않고 거부한다.
    if (line.size() + 2 > kMaxLineLength) {
        throw ParseError("라인 길이 초과 (512 바이트)", line);
    }
    if (line.find_first_of(kForbiddenChars) != std::string::npos) {
        throw ParseError("라인 내부에 CR/LF/NUL 포함", line);
    }

    Message msg;
    std::size_t idx = 0;
    if (line[0] == ':') {
        std::size_t space = line.find(' ');
        if (space == std::string::npos) {
            throw ParseError("command 누락", line);
        }
        msg.prefix = line.substr(1, space - 1);
        if (msg.prefix.empty()) {
            throw ParseError("빈 prefix", line);
        }
        idx = space + 1;
        while (idx < line.size() && line[idx] == ' ') {
            ++idx;
        }
    }

    std::size_t command_end = line.find(' ', idx);
    if (command_end == std::string::npos) {
        command_end = line.size();
    }
    msg.command = line.substr(idx, command_end - idx);
    if (msg.command.empty()) {
        throw ParseError("command 누락", line);
    }
    if (!IsValidCommand(msg.command)) {
        throw ParseError("잘못된 command: " + msg.command, line);
    }
    idx = command_end;

    while (idx < line.size()) {
        if (line[idx] == ' ') {
            ++idx;
            continue;
        }
        if (line[idx] == ':') {
            msg.has_trailing = true;
            msg.trailing = line.substr(idx + 1);
            break;
        }

        std::size_t next_space = line.find(' ', idx);
        if (next_space == std::string::npos) {
            next_space = line.size();
        }
        msg.params.push_back(line.substr(idx, next_space - idx));
        if (msg.params.size() > kMaxMiddleParams) {
            throw ParseError("파라미터 개수 초과 (14)", line);
        }
        idx = next_space;
    }

    return msg;
}

std::string SerializeMessage(const Message &msg) {
    if (!IsValidCommand(msg.command)) {
        throw std::invalid_argument("직렬화 불가: 잘못된 command '" + msg.command + "'");
    }
    if (msg.params.size() > kMaxMiddleParams) {
        throw std::invalid_argument("직렬화 불가: 파라미터 개수 초과");
    }

    std::string line;
    if (!msg.prefix.empty()) {
        if (!IsValidMiddle(msg.prefix)) {
            throw std::invalid_argument("직렬화 불가: 잘못된 prefix '" + msg.prefix + "'");
        }
        line += ':';
        line += msg.prefix;
        line += ' ';
    }
    line += msg.command;

    for (std::size_t i = 0; i < msg.params.size(); ++i) {
        if (!IsValidMiddle(msg.params[i])) {
            throw std::invalid_argument("직렬화 불가: 잘못된 middle 파라미터 '" + msg.params[i] +
                                        "'");
        }
        line += ' ';
        line += msg.params[i];
    }

    if (msg.has_trailing) {
        if (msg.trailing.find_first_of(kForbiddenChars) != std::string::npos) {
            throw std::invalid_argument("직렬화 불가: trailing 에 CR/LF/NUL 포함");
        }
        line += " :";
        line += msg.trailing;
    }

    if (line.size() + 2 > kMaxLineLength) {
        throw std::invalid_argument("직렬화 불가: 512 바이트 초과");
    }
    return line;
}

std::string DescribeMessage(const Message &msg) {
    try {
        return SerializeMessage(msg);
    } catch (const std::invalid_argument &) {
        std::string text = "[prefix=" + msg.prefix + " command=" + msg.command;
        std::vector<std::string> all = msg.AllParams();
        for (std::size_t i = 0; i < all.size(); ++i) {
            text += " param=" + all[i];
        }
        return text + "]";
    }
}

Message MakeMessage(const std::string &command, const std::vector<std::string> &params) {
    Message msg;
    msg.command = command;
    msg.params = params;
    if (!msg.params.empty() && NeedsTrailing(msg.params.back())) {
        msg.has_trailing = true;
        msg.trailing = msg.params.back();
        msg.params.pop_back();
    }
    return msg;
}

Source ParseSource(const std::string &prefix) {
    Source source;
    std::size_t bang = prefix.find('!');
    std::size_t at = prefix.find('@', bang == std::string::npos ? 0 : bang);
    if (bang != std::string::npos) {
        source.nick = prefix.substr(0, bang);
        if (at != std::string::npos) {
            source.user = prefix.substr(bang + 1, at - bang - 1);
            source.host = prefix.substr(at + 1);
        } else {
            source.user = prefix.substr(bang + 1);
        }
    } else if (at != std::string::npos) {
        source.nick = prefix.substr(0, at);
        source.host = prefix.substr(at + 1);
    } else {
        source.nick = prefix;
    }
    return source;
}

bool IsNumeric(const std::string &command) {
    return command.size() == 3 && std::isdigit(static_cast<unsigned char>(command[0])) &&
           std::isdigit(static_cast<unsigned char>(command[1])) &&
           std::isdigit(static_cast<unsigned char>(command[2]));
}

bool IsValidNickname(const std::string &nick) {
    if (nick.empty()) {
        return false;
    }

    for (std::size_t i = 0; i < nick.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(nick[i]);
        bool allowed = std::isalnum(ch) || ch == '-' || IsSpecial(ch);
        if (!allowed) {
            return false;
        }
        // RFC 2812: 첫 글자는 문자 또는 special
        if (i == 0 && !std::isalpha(ch) && !IsSpecial(ch)) {
            return false;
        }
    }
    return true;
}

char FoldCase(char c) {
    switch (c) {
        case '[':
            return '{';
        case ']':
            return '}';
        case '\\':
            return '|';
        case '~':
            return '^';
        default:
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

bool EqualsIgnoreCase(const std::string &lhs, const std::string &rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (FoldCase(lhs[i]) != FoldCase(rhs[i])) {
            return false;
        }
    }
    return true;
}

std::string ToUpper(const std::string &text) {
    std::string upper = text;
    for (std::size_t i = 0; i < upper.size(); ++i) {
        upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(upper[i])));
    }
    return upper;
}

}  // namespace protocol
