/*
 * 설명: IRC 메시지 파서/직렬화기, source 분해, 닉네임 검증을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "protocol/message.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
bool Rejects(const std::string &line) {
    try {
        protocol::ParseMessage(line);
    } catch (const protocol::ParseError &ex) {
        assert(ex.line() == line);
        return true;
    }
    return false;
}
}  // namespace

void TestParseWithPrefixAndTrailing() {
    std::string line = ":nick!user@host PRIVMSG target :hello world";
    protocol::Message msg = protocol::ParseMessage(line);
    assert(msg.command == "PRIVMSG");
    assert(msg.prefix == "nick!user@host");
    assert(msg.params.size() == 1);
    assert(msg.params[0] == "target");
    assert(msg.has_trailing);
    assert(msg.trailing == "hello world");
    assert(msg.ParamCount() == 2);
    assert(msg.LastParam() == "hello world");
}

void TestParseWithoutPrefix() {
    protocol::Message msg = protocol::ParseMessage("PING token");
    assert(msg.prefix.empty());
    assert(msg.command == "PING");
    assert(msg.params.size() == 1);
    assert(msg.params[0] == "token");
    assert(!msg.has_trailing);
}

void TestParseWithExtraSpaces() {
    protocol::Message msg = protocol::ParseMessage(":srv   NOTICE   user   : spaced  payload");
    assert(msg.command == "NOTICE");
    assert(msg.prefix == "srv");
    assert(msg.params.size() == 1);
    assert(msg.params[0] == "user");
    assert(msg.trailing == " spaced  payload");
}

void TestNumericAndEmptyTrailing() {
    protocol::Message msg = protocol::ParseMessage(":irc.local 331 me #chan :");
    assert(protocol::IsNumeric(msg.command));
    assert(msg.has_trailing);
    assert(msg.trailing.empty());
    assert(msg.Param(1) == "#chan");
    assert(msg.Param(2).empty());
    assert(msg.Param(9).empty());
}

void TestRoundTrip() {
    const char *lines[] = {
        ":nick!user@host PRIVMSG #chan :hello : world",
        "PING :irc.local",
        ":irc.local 353 me = #chan :@op member",
        "MODE #chan +k secret",
        ":a!b@c KICK #x,#y u1,u2 :bye",
        "TOPIC #chan :",
    };
    for (std::size_t i = 0; i < sizeof(lines) / sizeof(lines[0]); ++i) {
        assert(protocol::SerializeMessage(protocol::ParseMessage(lines[i])) == lines[i]);
    }
}

void TestRejectMalformed() {
    assert(Rejects(""));
    assert(Rejects(":prefixonly"));
    assert(Rejects(": PRIVMSG x"));
    assert(Rejects("12 short numeric"));
    assert(Rejects("1234 long numeric"));
    assert(Rejects("PRIV-MSG x"));
    assert(Rejects(std::string("PRIVMSG x :a\rb")));

    std::string fifteen = "CMD";
    for (int i = 0; i < 15; ++i) {
        fifteen += " p";
    }
    assert(Rejects(fifteen));
    assert(!Rejects(fifteen.substr(0, fifteen.size() - 2) + " :last"));
}

void TestLengthLimit() {
    // CRLF 포함 정확히 512 바이트는 허용, 1 바이트라도 넘으면 거부
    std::string body(510 - std::string("PRIVMSG x :").size(), 'a');
    std::string exact = "PRIVMSG x :" + body;
    assert(exact.size() == 510);
    assert(!Rejects(exact));
    assert(Rejects(exact + "a"));
}

void TestSerializeMakeMessage() {
    assert(protocol::SerializeMessage(protocol::MakeMessage("PRIVMSG", {"#c", "hi there"})) ==
           "PRIVMSG #c :hi there");
    assert(protocol::SerializeMessage(protocol::MakeMessage("JOIN", {"#c"})) == "JOIN #c");
    assert(protocol::SerializeMessage(protocol::MakeMessage("TOPIC", {"#c", ""})) == "TOPIC #c :");
    assert(protocol::SerializeMessage(protocol::MakeMessage("PRIVMSG", {"x", ":smile"})) ==
           "PRIVMSG x ::smile");

    bool threw = false;
    try {
        protocol::SerializeMessage(protocol::MakeMessage("PRIVMSG", {"a b", "text"}));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    protocol::Message bad;
    bad.command = "NO SUCH";
    assert(protocol::DescribeMessage(bad).find("command=NO SUCH") != std::string::npos);
}

void TestParseSource() {
    protocol::Source full = protocol::ParseSource("nick!user@host.example");
    assert(full.nick == "nick");
    assert(full.user == "user");
    assert(full.host == "host.example");

    protocol::Source server = protocol::ParseSource("irc.local");
    assert(server.nick == "irc.local");
    assert(server.user.empty());

    protocol::Source no_user = protocol::ParseSource("nick@host");
    assert(no_user.nick == "nick");
    assert(no_user.host == "host");
}

void TestNicknameValidation() {
    assert(protocol::IsValidNickname("User1"));
    assert(protocol::IsValidNickname("nick_[]"));
    assert(protocol::IsValidNickname("[away]"));
    assert(!protocol::IsValidNickname(""));
    assert(!protocol::IsValidNickname("-bad"));
    assert(!protocol::IsValidNickname("9lives"));
    assert(!protocol::IsValidNickname("bad nick"));
    assert(!protocol::IsValidNickname("bad!"));
}

void TestCaseInsensitiveHelpers() {
    assert(protocol::EqualsIgnoreCase("#Chan", "#chan"));
    assert(!protocol::EqualsIgnoreCase("#chan", "#chan2"));
    // RFC 1459 대소문자 규칙
    assert(protocol::EqualsIgnoreCase("Nick[a]\\~", "nick{a}|^"));
    assert(protocol::FoldCase('[') == '{');
    assert(protocol::FoldCase('~') == '^');
    assert(!protocol::EqualsIgnoreCase("nick[", "nick]"));
    assert(protocol::ToUpper("privmsg") == "PRIVMSG");
    assert(protocol::ParseMessage("privmsg x y").IsCommand("PRIVMSG"));
}

int main() {
    TestParseWithPrefixAndTrailing();
    TestParseWithoutPrefix();
    TestParseWithExtraSpaces();
    TestNumericAndEmptyTrailing();
    TestRoundTrip();
    TestRejectMalformed();
    TestLengthLimit();
    TestSerializeMakeMessage();
    TestParseSource();
    TestNicknameValidation();
    TestCaseInsensitiveHelpers();
    return 0;
}
