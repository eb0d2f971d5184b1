/*
 * 설명: 단일 사용자 시나리오 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#include "suites/single_user_suite.hpp"

#include <memory>

#include "client/errors.hpp"
#include "client/expect.hpp"
#include "protocol/numerics.hpp"
#include "suites/channel_steps.hpp"
#include "suites/suite.hpp"

namespace {

using client::ClientSession;
using client::Expectation;
using harness::ScenarioContext;
namespace expect = client::expect;
namespace numeric = protocol::numeric;

typedef std::shared_ptr<ClientSession> SessionPtr;

void Connect(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewConnectedSession();
    ctx.Check(s->connection_state() == net::ConnectionState::kConnected, "연결 상태가 Connected 가 아님");
}

void Registration(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewConnectedSession();
    protocol::Message welcome = s->Register(ctx.settings().password);
    ctx.Check(protocol::EqualsIgnoreCase(welcome.Param(0), s->nick()),
              "001 의 대상이 등록한 닉네임이 아님: " + protocol::DescribeMessage(welcome));
    ctx.Check(s->registration_state() == client::RegistrationState::kRegistered,
              "001 이후에도 Registered 상태가 아님");
}

void BadPassword(ScenarioContext &ctx) {
    if (ctx.settings().password.empty()) {
        ctx.Note("서버 비밀번호가 없어 건너뜀");
        return;
    }
    SessionPtr s = ctx.NewConnectedSession();
    try {
        s->Register(ctx.settings().password + "-wrong");
    } catch (const client::RegistrationError &ex) {
        if (ex.code() == numeric::kPasswdMismatch || ex.code() == "ERROR" || ex.code() == "closed") {
            ctx.Note("거부 확인: " + ex.code());
            return;
        }
        throw harness::ScenarioError(std::string("464 대신 다른 거부: ") + ex.what());
    }
    throw harness::ScenarioError("잘못된 비밀번호로 등록이 완료됨");
}

void ErroneousNickname(ScenarioContext &ctx) {
    client::Identity identity = ctx.MakeIdentity();
    // 숫자로 시작하는 닉네임은 RFC 2812 문법 위반
    identity.nick = "9" + identity.nick;
    SessionPtr s = ctx.NewConnectedSession(identity);
    try {
        s->Register(ctx.settings().password);
    } catch (const client::RegistrationError &ex) {
        ctx.Check(ex.code() == numeric::kErroneusNickname,
                  std::string("432 가 아닌 거부: ") + ex.what());
        return;
    }
    throw harness::ScenarioError("잘못된 닉네임 " + identity.nick + " 으로 등록됨");
}

void NickChange(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string old_nick = s->nick();
    const std::string new_nick = ctx.UniqueNick("N");
    s->Nick(new_nick);
    s->Expect(expect::AllOf({expect::Command("NICK", {new_nick}), expect::From(old_nick)}));
    ctx.Check(s->nick() == new_nick, "세션 닉네임이 갱신되지 않음");
}

void PingPong(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string token = "conformance-" + s->nick();
    s->Ping(token);
    s->Expect(expect::AllOf({expect::Command("PONG"), expect::ParamContains(token)}));
}

void JoinChannelScenario(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    suites::JoinChannel(ctx, *s, channel);
}

void PartChannel(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    suites::JoinChannel(ctx, *s, channel);
    s->Part(channel, "leaving");
    s->Expect(suites::PartOf(s->nick(), channel));
}

void PartNotOnChannel(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    s->Part(channel);
    std::size_t index = 0;
    client::ExpectAnyWithin(*s,
                            {suites::ChannelError(numeric::kNotOnChannel, channel),
                             suites::ChannelError(numeric::kNoSuchChannel, channel)},
                            ctx.expect_timeout(), &index);
    if (index == 1) {
        ctx.Note("442 대신 403 응답");
    }
}

void JoinNeedMoreParams(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    s->Send("JOIN", std::vector<std::string>());
    s->Expect(expect::AllOf({expect::Numeric(numeric::kNeedMoreParams), expect::ParamEquals(1, "JOIN")}));
}

void TopicView(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    suites::JoinChannel(ctx, *s, channel);
    s->Topic(channel);
    client::ExpectAnyWithin(*s,
                            {suites::ChannelError(numeric::kNoTopic, channel),
                             suites::ChannelError(numeric::kTopic, channel)},
                            ctx.expect_timeout(), NULL);
}

void TopicSet(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    const std::string topic = "conformance topic " + channel;
    suites::JoinChannel(ctx, *s, channel);

    s->SetTopic(channel, topic);
    s->Expect(expect::AllOf({expect::Command("TOPIC", {channel, topic}), expect::From(s->nick())}));

    s->Topic(channel);
    protocol::Message reply = s->Expect(suites::ChannelError(numeric::kTopic, channel));
    ctx.Check(reply.LastParam() == topic, "332 의 토픽 불일치: " + protocol::DescribeMessage(reply));
}

void ModeView(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    suites::JoinChannel(ctx, *s, channel);
    s->Mode(channel);
    s->Expect(suites::ChannelError(numeric::kChannelModeIs, channel));
}

void PrivmsgToSelf(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string text = "hello myself";
    s->Privmsg(s->nick(), text);
    s->Expect(expect::Privmsg(s->nick(), s->nick(), text));
}

void PrivmsgToChannel(ScenarioContext &ctx) {
    SessionPtr s = ctx.NewSession();
    const std::string channel = ctx.UniqueChannel();
    const std::string text = "hello channel";
    suites::JoinChannel(ctx, *s, channel);
    s->Privmsg(channel, text);
    // 오류 응답도, 자기 자신에게 되돌아오는 메시지도 없어야 한다.
    client::ExpectSilence(*s,
                          expect::AnyOf({expect::Numeric(numeric::kCannotSendToChan),
                                         expect::Numeric(numeric::kNoSuchNick),
                                         expect::Numeric(numeric::kNoSuchChannel),
                                         expect::Privmsg(s->nick(), channel, text)}),
                          ctx.quiet_window());
}

}  // namespace

namespace suites {

std::vector<harness::Scenario> SingleUserSuite::Scenarios() const {
    std::vector<harness::Scenario> scenarios;
    scenarios.push_back(harness::Scenario{"connect", Connect});
    scenarios.push_back(harness::Scenario{"registration", Registration});
    scenarios.push_back(harness::Scenario{"bad_password", BadPassword});
    scenarios.push_back(harness::Scenario{"erroneous_nickname", ErroneousNickname});
    scenarios.push_back(harness::Scenario{"nick_change", NickChange});
    scenarios.push_back(harness::Scenario{"ping_pong", PingPong});
    scenarios.push_back(harness::Scenario{"join_channel", JoinChannelScenario});
    scenarios.push_back(harness::Scenario{"part_channel", PartChannel});
    scenarios.push_back(harness::Scenario{"part_not_on_channel", PartNotOnChannel});
    scenarios.push_back(harness::Scenario{"join_need_more_params", JoinNeedMoreParams});
    scenarios.push_back(harness::Scenario{"topic_view", TopicView});
    scenarios.push_back(harness::Scenario{"topic_set", TopicSet});
    scenarios.push_back(harness::Scenario{"mode_view", ModeView});
    scenarios.push_back(harness::Scenario{"privmsg_to_self", PrivmsgToSelf});
    scenarios.push_back(harness::Scenario{"privmsg_to_channel", PrivmsgToChannel});
    return scenarios;
}

std::vector<harness::ScenarioResult> SingleUserSuite::Run(harness::Orchestrator &orchestrator) const {
    return RunSuite(*this, orchestrator);
}

}  // namespace suites
