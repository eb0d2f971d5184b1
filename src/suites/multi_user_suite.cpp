/*
 * 설명: 다중 사용자 시나리오 구현. 서로 다른 연결 사이에는 순서 보장이 없으므로 상대의 JOIN/MODE 가
 *       관찰된 뒤에만 다음 단계로 넘어간다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#include "suites/multi_user_suite.hpp"

#include <functional>
#include <memory>

#include "client/errors.hpp"
#include "client/expect.hpp"
#include "protocol/numerics.hpp"
#include "suites/channel_steps.hpp"
#include "suites/suite.hpp"

namespace {

using client::ClientSession;
using harness::ScenarioContext;
namespace expect = client::expect;
namespace numeric = protocol::numeric;

typedef std::shared_ptr<ClientSession> SessionPtr;

// op 이 먼저 들어가 채널 운영자가 되고, 나머지가 들어온 것을 op 이 확인한다.
std::string OpenChannel(ScenarioContext &ctx, ClientSession &op,
                        const std::vector<ClientSession *> &members) {
    const std::string channel = ctx.UniqueChannel();
    suites::JoinChannel(ctx, op, channel);
    for (std::size_t i = 0; i < members.size(); ++i) {
        suites::JoinChannel(ctx, *members[i], channel);
        op.Expect(suites::JoinOf(members[i]->nick(), channel));
    }
    return channel;
}

void PrivateMessage(ScenarioContext &ctx) {
    SessionPtr a = ctx.NewSession("A");
    SessionPtr b = ctx.NewSession("B");
    const std::string text = "private hello";
    a->Privmsg(b->nick(), text);
    b->Expect(expect::Privmsg(a->nick(), b->nick(), text));
    client::ExpectSilence(*a, expect::Numeric(numeric::kNoSuchNick), ctx.quiet_window());
}

void NickCollision(ScenarioContext &ctx) {
    SessionPtr a = ctx.NewSession("A");
    client::Identity identity = ctx.MakeIdentity("B");
    identity.nick = a->nick();
    SessionPtr b = ctx.NewConnectedSession(identity);
    try {
        b->Register(ctx.settings().password);
    } catch (const client::RegistrationError &ex) {
        ctx.Check(ex.code() == numeric::kNicknameInUse || ex.code() == numeric::kNickCollision,
                  std::string("433 가 아닌 거부: ") + ex.what());
        return;
    }
    throw harness::ScenarioError("사용 중인 닉네임 " + identity.nick + " 으로 두 번째 등록이 완료됨");
}

void ChannelBroadcast(ScenarioContext &ctx) {
    SessionPtr a = ctx.NewSession("A");
    SessionPtr b = ctx.NewSession("B");
    SessionPtr c = ctx.NewSession("C");
    SessionPtr outsider = ctx.NewSession("D");
    const std::string channel = ctx.UniqueChannel();
    const std::string text = "broadcast to " + channel;

    std::vector<std::function<void()> > steps;
    SessionPtr members[] = {a, b, c};
    for (std::size_t i = 0; i < 3; ++i) {
        SessionPtr member = members[i];
        steps.push_back([&ctx, member, channel]() {
            suites::JoinChannel(ctx, *member, channel);
            ctx.Barrier("members-joined", 3);
        });
    }
    // 세 명 모두 366 을 받은 뒤에만 barrier 를 통과한다.
    ctx.RunConcurrently(steps);

    a->Privmsg(channel, text);
    b->Expect(expect::Privmsg(a->nick(), channel, text));
    c->Expect(expect::Privmsg(a->nick(), channel, text));
    client::ExpectSilence(*outsider, expect::Command("PRIVMSG"), ctx.quiet_window());
    client::ExpectSilence(*a, expect::Privmsg(a->nick(), channel, text), ctx.quiet_window());

    std::vector<protocol::Message> leftover = outsider->DrainUnexpected();
    for (std::size_t i = 0; i < leftover.size(); ++i) {
        ctx.Check(!leftover[i].IsCommand("PRIVMSG") && !leftover[i].IsCommand("JOIN"),
                  "채널 밖 사용자가 채널 트래픽을 받음: " + protocol::DescribeMessage(leftover[i]));
    }
}

void OperatorStatus(ScenarioContext &ctx) {
    SessionPtr a = ctx.NewSession("A");
    SessionPtr b = ctx.NewSession("B");
    const std::string channel = ctx.UniqueChannel();
    suites::JoinChannel(ctx, *a, channel);
    a->Expect(suites::NamesContain(channel, "@" + a->nick()));

    suites::JoinChannel(ctx, *b, channel);
    b->Expect(suites::NamesContain(channel, "@" + a->nick()));
}

void Kick(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr victim = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, {victim.get()});

    op->Kick(channel, victim->nick(), "conformance kick");
    op->Expect(suites::KickOf(op->nick(), channel, victim->nick()));
    victim->Expect(suites::KickOf(op->nick(), channel, victim->nick()));

    const std::string text = "after kick";
    op->Privmsg(channel, text);
    client::ExpectSilence(*victim, expect::Privmsg(op->nick(), channel, text), ctx.quiet_window());

    // 쫓겨난 사용자는 더 이상 채널에 말할 수 없다.
    const std::string reply = "kicked but talking";
    victim->Privmsg(channel, reply);
    client::ExpectAnyWithin(*victim,
                            {suites::ChannelError(numeric::kCannotSendToChan, channel),
                             suites::ChannelError(numeric::kNotOnChannel, channel),
                             suites::ChannelError(numeric::kNoSuchChannel, channel)},
                            ctx.expect_timeout(), NULL);
    client::ExpectSilence(*op, expect::Privmsg(victim->nick(), channel, reply), ctx.quiet_window());
}

void KickRequiresOperator(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr member = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, {member.get()});

    member->Kick(channel, op->nick());
    member->Expect(suites::ChannelError(numeric::kChanOpPrivsNeeded, channel));
    client::ExpectSilence(*op, expect::Command("KICK"), ctx.quiet_window());
}

void KickMultipleTargets(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr b = ctx.NewSession("B");
    SessionPtr c = ctx.NewSession("C");
    const std::string channel = OpenChannel(ctx, *op, {b.get(), c.get()});

    op->Kick(channel, b->nick() + "," + c->nick());
    client::ExpectAllWithin(*op,
                            {suites::KickOf(op->nick(), channel, b->nick()),
                             suites::KickOf(op->nick(), channel, c->nick())},
                            ctx.expect_timeout());
    b->Expect(suites::KickOf(op->nick(), channel, b->nick()));
    c->Expect(suites::KickOf(op->nick(), channel, c->nick()));
}

void KickAcrossChannels(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr b = ctx.NewSession("B");
    SessionPtr c = ctx.NewSession("C");
    const std::string first = OpenChannel(ctx, *op, {b.get()});
    const std::string second = OpenChannel(ctx, *op, {c.get()});

    // KICK <c1>,<c2> <u1>,<u2> 는 채널과 대상을 순서대로 짝짓는다.
    op->Kick(first + "," + second, b->nick() + "," + c->nick());
    client::ExpectAllWithin(*op,
                            {suites::KickOf(op->nick(), first, b->nick()),
                             suites::KickOf(op->nick(), second, c->nick())},
                            ctx.expect_timeout());
    b->Expect(suites::KickOf(op->nick(), first, b->nick()));
    c->Expect(suites::KickOf(op->nick(), second, c->nick()));
}

void KickUserNotOnChannel(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr outsider = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, std::vector<ClientSession *>());

    op->Kick(channel, outsider->nick());
    op->Expect(expect::AllOf({expect::Numeric(numeric::kUserNotInChannel),
                              expect::ParamEquals(1, outsider->nick()),
                              expect::ParamEquals(2, channel)}));
    client::ExpectSilence(*outsider, expect::Command("KICK"), ctx.quiet_window());
}

void Invite(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr invitee = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, std::vector<ClientSession *>());

    op->Invite(invitee->nick(), channel);
    op->Expect(expect::AllOf({expect::Numeric(numeric::kInviting), expect::ParamContains(channel)}));
    invitee->Expect(
        expect::AllOf({expect::Command("INVITE", {invitee->nick(), channel}), expect::From(op->nick())}));
}

void InviteRequiresOperator(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr member = ctx.NewSession("B");
    SessionPtr outsider = ctx.NewSession("C");
    const std::string channel = OpenChannel(ctx, *op, {member.get()});
    suites::SetChannelMode(ctx, *op, channel, "+i");
    member->Expect(suites::ModeChange(op->nick(), channel, "+i"));

    member->Invite(outsider->nick(), channel);
    member->Expect(suites::ChannelError(numeric::kChanOpPrivsNeeded, channel));
    client::ExpectSilence(*outsider, expect::Command("INVITE"), ctx.quiet_window());
}

void ModeRequiresOperator(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr member = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, {member.get()});

    member->Mode(channel, "+i");
    member->Expect(suites::ChannelError(numeric::kChanOpPrivsNeeded, channel));
    client::ExpectSilence(*op, expect::Command("MODE"), ctx.quiet_window());
}

void ModeInviteOnly(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr outsider = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, std::vector<ClientSession *>());
    suites::SetChannelMode(ctx, *op, channel, "+i");

    suites::ExpectJoinRejected(ctx, *outsider, channel, numeric::kInviteOnlyChan);
    client::ExpectSilence(*op, suites::JoinOf(outsider->nick(), channel), ctx.quiet_window());

    // 거부된 사용자에게 채널 브로드캐스트가 새어 나가면 안 된다.
    op->Privmsg(channel, "members only");
    client::ExpectSilence(*outsider, expect::Command("PRIVMSG"), ctx.quiet_window());
    std::vector<protocol::Message> leftover = outsider->DrainUnexpected();
    for (std::size_t i = 0; i < leftover.size(); ++i) {
        ctx.Check(!protocol::EqualsIgnoreCase(leftover[i].Param(0), channel),
                  "입장 거부된 사용자가 채널 트래픽을 받음: " +
                      protocol::DescribeMessage(leftover[i]));
    }

    op->Invite(outsider->nick(), channel);
    outsider->Expect(expect::Command("INVITE", {outsider->nick(), channel}));
    suites::JoinChannel(ctx, *outsider, channel);
    op->Expect(suites::JoinOf(outsider->nick(), channel));
}

void InviteOnlyRejoinAfterPart(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr regular = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, std::vector<ClientSession *>());
    suites::SetChannelMode(ctx, *op, channel, "+i");

    op->Invite(regular->nick(), channel);
    regular->Expect(expect::Command("INVITE", {regular->nick(), channel}));
    suites::JoinChannel(ctx, *regular, channel);

    regular->Part(channel);
    regular->Expect(suites::PartOf(regular->nick(), channel));

    // 초대는 한 번 입장하면 소진된다.
    suites::ExpectJoinRejected(ctx, *regular, channel, numeric::kInviteOnlyChan);
}

void ModeTopicRestrict(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr member = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, {member.get()});
    suites::SetChannelMode(ctx, *op, channel, "+t");
    member->Expect(suites::ModeChange(op->nick(), channel, "+t"));

    member->SetTopic(channel, "not allowed");
    member->Expect(suites::ChannelError(numeric::kChanOpPrivsNeeded, channel));

    const std::string topic = "operator topic";
    op->SetTopic(channel, topic);
    member->Expect(expect::AllOf({expect::Command("TOPIC", {channel, topic}), expect::From(op->nick())}));
}

void ModeChannelKey(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr guest = ctx.NewSession("B");
    const std::string channel = OpenChannel(ctx, *op, std::vector<ClientSession *>());
    const std::string key = "secret";
    suites::SetChannelMode(ctx, *op, channel, "+k", {key});

    suites::ExpectJoinRejected(ctx, *guest, channel, numeric::kBadChannelKey);
    suites::ExpectJoinRejected(ctx, *guest, channel, numeric::kBadChannelKey, "wrong" + key);
    suites::JoinChannel(ctx, *guest, channel, key);
    op->Expect(suites::JoinOf(guest->nick(), channel));
}

void ModeOperatorGrantRevoke(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr deputy = ctx.NewSession("B");
    SessionPtr target = ctx.NewSession("C");
    const std::string channel = OpenChannel(ctx, *op, {deputy.get(), target.get()});

    suites::SetChannelMode(ctx, *op, channel, "+o", {deputy->nick()});
    deputy->Expect(suites::ModeChange(op->nick(), channel, "+o"));

    deputy->Kick(channel, target->nick());
    target->Expect(suites::KickOf(deputy->nick(), channel, target->nick()));

    suites::JoinChannel(ctx, *target, channel);
    deputy->Expect(suites::JoinOf(target->nick(), channel));

    suites::SetChannelMode(ctx, *op, channel, "-o", {deputy->nick()});
    deputy->Expect(suites::ModeChange(op->nick(), channel, "-o"));

    deputy->Kick(channel, target->nick());
    deputy->Expect(suites::ChannelError(numeric::kChanOpPrivsNeeded, channel));
    client::ExpectSilence(*target, expect::Command("KICK"), ctx.quiet_window());
}

void ModeUserLimit(ScenarioContext &ctx) {
    SessionPtr op = ctx.NewSession("A");
    SessionPtr second = ctx.NewSession("B");
    SessionPtr third = ctx.NewSession("C");
    const std::string channel = OpenChannel(ctx, *op, std::vector<ClientSession *>());
    suites::SetChannelMode(ctx, *op, channel, "+l", {"2"});

    suites::JoinChannel(ctx, *second, channel);
    op->Expect(suites::JoinOf(second->nick(), channel));
    suites::ExpectJoinRejected(ctx, *third, channel, numeric::kChannelIsFull);

    suites::SetChannelMode(ctx, *op, channel, "-l");
    suites::JoinChannel(ctx, *third, channel);
}

}  // namespace

namespace suites {

std::vector<harness::Scenario> MultiUserSuite::Scenarios() const {
    std::vector<harness::Scenario> scenarios;
    scenarios.push_back(harness::Scenario{"private_message", PrivateMessage});
    scenarios.push_back(harness::Scenario{"nick_collision", NickCollision});
    scenarios.push_back(harness::Scenario{"channel_broadcast", ChannelBroadcast});
    scenarios.push_back(harness::Scenario{"operator_status", OperatorStatus});
    scenarios.push_back(harness::Scenario{"kick", Kick});
    scenarios.push_back(harness::Scenario{"kick_requires_operator", KickRequiresOperator});
    scenarios.push_back(harness::Scenario{"kick_multiple_targets", KickMultipleTargets});
    scenarios.push_back(harness::Scenario{"kick_across_channels", KickAcrossChannels});
    scenarios.push_back(harness::Scenario{"kick_user_not_on_channel", KickUserNotOnChannel});
    scenarios.push_back(harness::Scenario{"invite", Invite});
    scenarios.push_back(harness::Scenario{"invite_requires_operator", InviteRequiresOperator});
    scenarios.push_back(harness::Scenario{"mode_requires_operator", ModeRequiresOperator});
    scenarios.push_back(harness::Scenario{"mode_invite_only", ModeInviteOnly});
    scenarios.push_back(harness::Scenario{"invite_only_rejoin_after_part", InviteOnlyRejoinAfterPart});
    scenarios.push_back(harness::Scenario{"mode_topic_restrict", ModeTopicRestrict});
    scenarios.push_back(harness::Scenario{"mode_channel_key", ModeChannelKey});
    scenarios.push_back(harness::Scenario{"mode_operator_grant_revoke", ModeOperatorGrantRevoke});
    scenarios.push_back(harness::Scenario{"mode_user_limit", ModeUserLimit});
    return scenarios;
}

std::vector<harness::ScenarioResult> MultiUserSuite::Run(harness::Orchestrator &orchestrator) const {
    return RunSuite(*this, orchestrator);
}

}  // namespace suites
