/*
 * 설명: 기대 기본형과 조합기, 윈도우 단위 복합 기대를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/expect_test.cpp
 */
#include "client/expect.hpp"

#include <sstream>

#include "client/errors.hpp"
#include "client/session.hpp"

namespace {
std::string JoinDescriptions(const std::vector<client::Expectation> &parts, const std::string &sep) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += sep;
        }
        joined += parts[i].description;
    }
    return joined;
}

std::string QuoteParams(const std::vector<std::string> &params) {
    std::string text;
    for (std::size_t i = 0; i < params.size(); ++i) {
        text += (i == 0 ? "" : ", ") + ("'" + params[i] + "'");
    }
    return text;
}
}  // namespace

namespace client {
namespace expect {

Expectation Command(const std::string &command) {
    Expectation e;
    e.description = protocol::ToUpper(command);
    e.matches = [command](const protocol::Message &msg) { return msg.IsCommand(command); };
    return e;
}

Expectation Command(const std::string &command, const std::vector<std::string> &params) {
    Expectation e;
    e.description = protocol::ToUpper(command) + " [" + QuoteParams(params) + "]";
    e.matches = [command, params](const protocol::Message &msg) {
        return msg.IsCommand(command) && msg.AllParams() == params;
    };
    return e;
}

Expectation Numeric(const std::string &code) {
    Expectation e;
    e.description = "numeric " + code;
    e.matches = [code](const protocol::Message &msg) { return msg.command == code; };
    return e;
}

Expectation From(const std::string &nick) {
    Expectation e;
    e.description = "from " + nick;
    e.matches = [nick](const protocol::Message &msg) {
        return protocol::EqualsIgnoreCase(protocol::ParseSource(msg.prefix).nick, nick);
    };
    return e;
}

Expectation FromTo(const std::string &nick, const std::string &target) {
    Expectation e;
    e.description = "from " + nick + " to " + target;
    e.matches = [nick, target](const protocol::Message &msg) {
        return protocol::EqualsIgnoreCase(protocol::ParseSource(msg.prefix).nick, nick) &&
               protocol::EqualsIgnoreCase(msg.Param(0), target);
    };
    return e;
}

Expectation Privmsg(const std::string &nick, const std::string &target, const std::string &text) {
    Expectation e = AllOf({Command("PRIVMSG"), FromTo(nick, target)});
    e.description = ":" + nick + " PRIVMSG " + target + " :" + text;
    std::function<bool(const protocol::Message &)> base = e.matches;
    e.matches = [base, text](const protocol::Message &msg) {
        return base(msg) && msg.ParamCount() >= 2 && msg.LastParam() == text;
    };
    return e;
}

Expectation ParamEquals(std::size_t index, const std::string &value) {
    std::ostringstream oss;
    oss << "param[" << index << "] == '" << value << "'";
    Expectation e;
    e.description = oss.str();
    e.matches = [index, value](const protocol::Message &msg) {
        return index < msg.ParamCount() && protocol::EqualsIgnoreCase(msg.Param(index), value);
    };
    return e;
}

Expectation ParamContains(const std::string &text) {
    Expectation e;
    e.description = "params contain '" + text + "'";
    e.matches = [text](const protocol::Message &msg) {
        std::vector<std::string> all = msg.AllParams();
        for (std::size_t i = 0; i < all.size(); ++i) {
            if (all[i].find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    };
    return e;
}

Expectation AllOf(const std::vector<Expectation> &parts) {
    Expectation e;
    e.description = "(" + JoinDescriptions(parts, " && ") + ")";
    e.matches = [parts](const protocol::Message &msg) {
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (!parts[i].matches(msg)) {
                return false;
            }
        }
        return true;
    };
    return e;
}

Expectation AnyOf(const std::vector<Expectation> &parts) {
    Expectation e;
    e.description = "(" + JoinDescriptions(parts, " || ") + ")";
    e.matches = [parts](const protocol::Message &msg) {
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].matches(msg)) {
                return true;
            }
        }
        return false;
    };
    return e;
}

Expectation Not(const Expectation &inner) {
    Expectation e;
    e.description = "!" + inner.description;
    e.matches = [inner](const protocol::Message &msg) { return !inner.matches(msg); };
    return e;
}

}  // namespace expect

std::vector<protocol::Message> ExpectAllWithin(ClientSession &session,
                                               const std::vector<Expectation> &all,
                                               Duration window) {
    std::vector<protocol::Message> matched;
    std::vector<std::size_t> unmet_index;
    if (session.TryExpectAll(all, window, matched, unmet_index)) {
        return matched;
    }

    std::vector<Expectation> unmet;
    for (std::size_t i = 0; i < unmet_index.size(); ++i) {
        unmet.push_back(all[unmet_index[i]]);
    }
    std::ostringstream oss;
    oss << session.nick() << ": " << window.count() << "ms 안에 만족되지 않은 기대: "
        << JoinDescriptions(unmet, ", ");
    throw TimeoutError(oss.str(), session.PendingLines());
}

protocol::Message ExpectAnyWithin(ClientSession &session, const std::vector<Expectation> &any,
                                  Duration window, std::size_t *matched_index) {
    protocol::Message msg = session.Expect(expect::AnyOf(any), window);
    if (matched_index != NULL) {
        for (std::size_t i = 0; i < any.size(); ++i) {
            if (any[i].matches(msg)) {
                *matched_index = i;
                break;
            }
        }
    }
    return msg;
}

void ExpectSilence(ClientSession &session, const Expectation &forbidden, Duration window) {
    protocol::Message msg;
    if (session.TryExpect(forbidden, window, msg)) {
        std::string line = protocol::DescribeMessage(msg);
        throw UnexpectedMessageError(
            session.nick() + ": 오지 말아야 할 메시지 수신 (" + forbidden.description + "): " + line,
            line);
    }
}

}  // namespace client
