/*
 * 설명: 채널 단계 헬퍼 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#include "suites/channel_steps.hpp"

#include <sstream>

#include "protocol/numerics.hpp"

namespace {
const char *const kJoinErrors[] = {
    protocol::numeric::kNoSuchChannel,  protocol::numeric::kChannelIsFull,
    protocol::numeric::kInviteOnlyChan, protocol::numeric::kBannedFromChan,
    protocol::numeric::kBadChannelKey,  protocol::numeric::kNeedMoreParams,
};

std::vector<client::Expectation> JoinErrorExpectations(const std::string &channel) {
    std::vector<client::Expectation> errors;
    for (std::size_t i = 0; i < sizeof(kJoinErrors) / sizeof(kJoinErrors[0]); ++i) {
        errors.push_back(suites::ChannelError(kJoinErrors[i], channel));
    }
    return errors;
}
}  // namespace

namespace suites {

using client::Expectation;
namespace expect = client::expect;

Expectation JoinOf(const std::string &nick, const std::string &channel) {
    Expectation e = expect::AllOf(
        {expect::Command("JOIN"), expect::From(nick), expect::ParamEquals(0, channel)});
    e.description = ":" + nick + " JOIN " + channel;
    return e;
}

Expectation PartOf(const std::string &nick, const std::string &channel) {
    Expectation e = expect::AllOf(
        {expect::Command("PART"), expect::From(nick), expect::ParamEquals(0, channel)});
    e.description = ":" + nick + " PART " + channel;
    return e;
}

Expectation KickOf(const std::string &op, const std::string &channel, const std::string &target) {
    Expectation e = expect::AllOf({expect::Command("KICK"), expect::From(op),
                                   expect::ParamEquals(0, channel),
                                   expect::ParamEquals(1, target)});
    e.description = ":" + op + " KICK " + channel + " " + target;
    return e;
}

Expectation ModeChange(const std::string &nick, const std::string &channel,
                       const std::string &flags) {
    Expectation e = expect::AllOf({expect::Command("MODE"), expect::From(nick),
                                   expect::ParamEquals(0, channel),
                                   expect::ParamEquals(1, flags)});
    e.description = ":" + nick + " MODE " + channel + " " + flags;
    return e;
}

Expectation ChannelError(const std::string &code, const std::string &channel) {
    Expectation e = expect::AllOf({expect::Numeric(code), expect::ParamEquals(1, channel)});
    e.description = code + " " + channel;
    return e;
}

Expectation NamesContain(const std::string &channel, const std::string &name) {
    Expectation e;
    e.description = "353 " + channel + " contains " + name;
    e.matches = [channel, name](const protocol::Message &msg) {
        if (msg.command != protocol::numeric::kNamReply || msg.ParamCount() < 3) {
            return false;
        }
        // 353 <me> [=*@] <channel> :names 이지만 일부 서버는 기호를 생략한다.
        if (!protocol::EqualsIgnoreCase(msg.Param(msg.ParamCount() - 2), channel)) {
            return false;
        }
        std::istringstream names(msg.LastParam());
        std::string entry;
        while (names >> entry) {
            if (protocol::EqualsIgnoreCase(entry, name)) {
                return true;
            }
        }
        return false;
    };
    return e;
}

void JoinChannel(harness::ScenarioContext &ctx, client::ClientSession &session,
                 const std::string &channel, const std::string &key) {
    const std::string nick = session.nick();
    session.Join(channel, key);

    std::vector<Expectation> outcomes = JoinErrorExpectations(channel);
    outcomes.insert(outcomes.begin(), JoinOf(nick, channel));
    std::size_t index = 0;
    protocol::Message reply =
        client::ExpectAnyWithin(session, outcomes, ctx.expect_timeout(), &index);
    if (index != 0) {
        throw harness::ScenarioError(nick + " 의 " + channel + " 입장 거부: " +
                                     protocol::DescribeMessage(reply));
    }
    session.Expect(ChannelError(protocol::numeric::kEndOfNames, channel));
}

void ExpectJoinRejected(harness::ScenarioContext &ctx, client::ClientSession &session,
                        const std::string &channel, const std::string &code,
                        const std::string &key) {
    const std::string nick = session.nick();
    session.Join(channel, key);

    std::vector<Expectation> outcomes;
    outcomes.push_back(ChannelError(code, channel));
    outcomes.push_back(JoinOf(nick, channel));
    std::size_t index = 0;
    protocol::Message reply =
        client::ExpectAnyWithin(session, outcomes, ctx.expect_timeout(), &index);
    if (index != 0) {
        throw harness::ScenarioError(nick + " 이 " + channel + " 에 입장함 (기대: " + code +
                                     "): " + protocol::DescribeMessage(reply));
    }
}

void SetChannelMode(harness::ScenarioContext &ctx, client::ClientSession &op,
                    const std::string &channel, const std::string &flags,
                    const std::vector<std::string> &args) {
    op.Mode(channel, flags, args);
    std::vector<Expectation> outcomes;
    outcomes.push_back(ModeChange(op.nick(), channel, flags));
    outcomes.push_back(ChannelError(protocol::numeric::kChanOpPrivsNeeded, channel));
    std::size_t index = 0;
    protocol::Message reply =
        client::ExpectAnyWithin(op, outcomes, ctx.expect_timeout(), &index);
    if (index != 0) {
        throw harness::ScenarioError(op.nick() + " 의 MODE " + flags + " 거부: " +
                                     protocol::DescribeMessage(reply));
    }
}

}  // namespace suites
