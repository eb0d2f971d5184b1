/*
 * 설명: 스위트 실행기의 연결 불가 중단, 스위트 공통 실행 진입점, 시나리오 목록, 대본 서버 상대의 실제 시나리오 판정
 *       (여러 연결이 얽힌 채널 브로드캐스트, 운영자 권한, 초대 전용, 인원 제한 포함)을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "runner.hpp"

#include <cassert>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "fake_server.hpp"
#include "harness/orchestrator.hpp"
#include "suites/multi_user_suite.hpp"
#include "suites/single_user_suite.hpp"
#include "suites/suite.hpp"

using harness::Scenario;
using harness::ScenarioResult;
using testing_support::FakePeer;
using testing_support::FakeServer;
using testing_support::RegisteredPeer;

namespace {
config::Settings FastSettings(int port) {
    config::Settings settings;
    settings.host = "127.0.0.1";
    settings.port = port;
    settings.expect_timeout_ms = 1000;
    settings.registration_timeout_ms = 1000;
    settings.settle_ms = 200;
    settings.quiet_ms = 100;
    settings.scenario_timeout_ms = 5000;
    return settings;
}

template <typename Suite>
Scenario FindScenario(const Suite &suite, const std::string &name) {
    std::vector<Scenario> scenarios = suite.Scenarios();
    for (std::size_t i = 0; i < scenarios.size(); ++i) {
        if (scenarios[i].name == name) {
            return scenarios[i];
        }
    }
    assert(false);
    return Scenario();
}

bool Mentions(const ScenarioResult &result, const std::string &text) {
    for (std::size_t i = 0; i < result.diagnostics().size(); ++i) {
        if (result.diagnostics()[i].find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string Token(const std::string &line, std::size_t index) {
    std::istringstream in(line);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return index < tokens.size() ? tokens[index] : std::string();
}

// joiner 의 JOIN 을 받아 입장시키고 observers 에게 알린다. 채널 이름을 돌려준다.
std::string AdmitJoin(RegisteredPeer &joiner, const std::vector<RegisteredPeer *> &observers) {
    std::string line;
    assert(joiner.peer->ReadUntil("JOIN", line, 2000));
    const std::string channel = Token(line, 1);
    joiner.peer->SendLine(joiner.Prefix() + " JOIN " + channel);
    joiner.peer->SendLine(":fake.local 366 " + joiner.nick + " " + channel + " :End of /NAMES list");
    for (std::size_t i = 0; i < observers.size(); ++i) {
        observers[i]->peer->SendLine(joiner.Prefix() + " JOIN " + channel);
    }
    return channel;
}

void RejectJoin(RegisteredPeer &joiner, const std::string &code, const std::string &text) {
    std::string line;
    assert(joiner.peer->ReadUntil("JOIN", line, 2000));
    joiner.peer->SendLine(":fake.local " + code + " " + joiner.nick + " " + Token(line, 1) + " :" +
                          text);
}

// 운영자의 MODE 를 그대로 되돌려 적용된 것처럼 알린다.
void EchoMode(RegisteredPeer &op) {
    std::string line;
    assert(op.peer->ReadUntil("MODE", line, 2000));
    op.peer->SendLine(op.Prefix() + " " + line);
}

ScenarioResult RunMultiUser(FakeServer &server, const std::string &run_tag,
                            const std::string &name) {
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    harness::Orchestrator orchestrator(FastSettings(server.port()), logger, run_tag);
    return orchestrator.RunScenario(FindScenario(suites::MultiUserSuite(), name));
}

class TwoStepSuite {
   public:
    std::string Name() const { return "two_step"; }
    std::vector<Scenario> Scenarios() const {
        std::vector<Scenario> scenarios;
        scenarios.push_back(Scenario{"first", [](harness::ScenarioContext &) {}});
        scenarios.push_back(
            Scenario{"second", [](harness::ScenarioContext &ctx) { ctx.Check(false, "nope"); }});
        return scenarios;
    }
};
}  // namespace

void TestUnreachableServerAbortsRun() {
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    bool aborted = false;
    try {
        RunAllSuites(FastSettings(testing_support::ClosedPort()), logger);
    } catch (const harness::SuiteAbortError &ex) {
        aborted = true;
        assert(std::string(ex.what()).find("127.0.0.1") != std::string::npos);
    }
    assert(aborted);

    aborted = false;
    try {
        std::vector<ScenarioResult> flat = RunAllSuites("127.0.0.1", testing_support::ClosedPort());
        assert(flat.empty());
    } catch (const harness::SuiteAbortError &) {
        aborted = true;
    }
    assert(aborted);
}

void TestRunSuiteIsGeneric() {
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    harness::Orchestrator orchestrator(FastSettings(testing_support::ClosedPort()), logger, "0100");
    std::vector<ScenarioResult> results = suites::RunSuite(TwoStepSuite(), orchestrator);
    assert(results.size() == 2);
    assert(results[0].passed());
    assert(results[1].verdict() == harness::Verdict::kFail);

    SuiteReport report;
    report.name = "two_step";
    report.results = results;
    assert(report.passed() == 1);
    assert(report.failed() == 1);

    // 이어 붙인 결과는 스위트 순서와 스위트 안의 시나리오 순서를 따른다.
    SuiteReport second;
    second.name = "two_step_again";
    second.results = suites::RunSuite(TwoStepSuite(), orchestrator);
    std::vector<SuiteReport> reports;
    reports.push_back(report);
    reports.push_back(second);
    std::vector<ScenarioResult> flat = FlattenResults(reports);
    assert(flat.size() == 4);
    assert(flat[0].name() == "first");
    assert(flat[1].name() == "second");
    assert(flat[2].name() == "first");
    assert(!flat[3].passed());
}

void TestScenarioCatalogues() {
    std::vector<Scenario> single = suites::SingleUserSuite().Scenarios();
    std::vector<Scenario> multi = suites::MultiUserSuite().Scenarios();
    assert(single.size() == 15);
    assert(multi.size() == 18);

    std::set<std::string> names;
    for (std::size_t i = 0; i < single.size(); ++i) {
        assert(single[i].body);
        names.insert(single[i].name);
    }
    for (std::size_t i = 0; i < multi.size(); ++i) {
        assert(multi[i].body);
        names.insert(multi[i].name);
    }
    assert(names.size() == single.size() + multi.size());
    assert(names.count("bad_password") == 1);
    assert(names.count("invite_only_rejoin_after_part") == 1);
    assert(names.count("mode_user_limit") == 1);
}

void TestPingPongAgainstScriptedServer() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    harness::Orchestrator orchestrator(FastSettings(server.port()), logger, "0101");

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        assert(!testing_support::ServeRegistration(*peer).empty());
        std::string line;
        assert(peer->ReadUntil("PING", line, 2000));
        std::string token = line.substr(line.find(':') + 1);
        peer->SendLine(":fake.local PONG fake.local :" + token);
        peer->WaitForClose(2000);
    });

    ScenarioResult result =
        orchestrator.RunScenario(FindScenario(suites::SingleUserSuite(), "ping_pong"));
    script.join();
    assert(result.passed());
}

void TestJoinRejectionFailsJoinScenario() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    harness::Orchestrator orchestrator(FastSettings(server.port()), logger, "0102");

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        std::string nick = testing_support::ServeRegistration(*peer);
        std::string line;
        assert(peer->ReadUntil("JOIN", line, 2000));
        std::string channel = line.substr(5);
        peer->SendLine(":fake.local 474 " + nick + " " + channel + " :Cannot join channel (+b)");
        peer->WaitForClose(2000);
    });

    ScenarioResult result =
        orchestrator.RunScenario(FindScenario(suites::SingleUserSuite(), "join_channel"));
    script.join();
    assert(result.verdict() == harness::Verdict::kFail);
    bool mentions_reply = false;
    for (std::size_t i = 0; i < result.diagnostics().size(); ++i) {
        mentions_reply = mentions_reply || result.diagnostics()[i].find("474") != std::string::npos;
    }
    assert(mentions_reply);
}

void TestTopicSetAgainstScriptedServer() {
    FakeServer server;
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    harness::Orchestrator orchestrator(FastSettings(server.port()), logger, "0103");

    std::thread script([&server]() {
        std::unique_ptr<FakePeer> peer = server.Accept(2000);
        assert(peer);
        std::string nick = testing_support::ServeRegistration(*peer);
        std::string prefix = ":" + nick + "!" + nick + "@localhost";
        std::string line;

        assert(peer->ReadUntil("JOIN", line, 2000));
        std::string channel = line.substr(5);
        peer->SendLine(prefix + " JOIN " + channel);
        peer->SendLine(":fake.local 353 " + nick + " = " + channel + " :@" + nick);
        peer->SendLine(":fake.local 366 " + nick + " " + channel + " :End of /NAMES list");

        assert(peer->ReadUntil("TOPIC", line, 2000));
        std::string topic = line.substr(line.find(" :") + 2);
        peer->SendLine(prefix + " TOPIC " + channel + " :" + topic);

        assert(peer->ReadUntil("TOPIC", line, 2000));
        peer->SendLine(":fake.local 332 " + nick + " " + channel + " :" + topic);
        peer->WaitForClose(2000);
    });

    ScenarioResult result =
        orchestrator.RunScenario(FindScenario(suites::SingleUserSuite(), "topic_set"));
    script.join();
    assert(result.passed());
}

void TestBadPasswordSkippedWithoutPassword() {
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    harness::Orchestrator orchestrator(FastSettings(testing_support::ClosedPort()), logger, "0104");
    ScenarioResult result =
        orchestrator.RunScenario(FindScenario(suites::SingleUserSuite(), "bad_password"));
    assert(result.passed());
    assert(result.diagnostics().size() == 1);
}

// A, B, C 가 채널에 들어가고 D 는 밖에 있다. leak 이면 D 에게도 채널 메시지를 보낸다.
ScenarioResult RunChannelBroadcast(const std::string &run_tag, bool leak) {
    FakeServer server;
    std::thread script([&server, leak]() {
        std::vector<RegisteredPeer> clients;
        assert(testing_support::AcceptRegistered(server, 4, clients));
        for (std::size_t i = 0; i < 3; ++i) {
            AdmitJoin(clients[i], std::vector<RegisteredPeer *>());
        }

        std::string line;
        assert(clients[0].peer->ReadUntil("PRIVMSG", line, 2000));
        const std::string relay = clients[0].Prefix() + " " + line;
        if (leak) {
            clients[3].peer->SendLine(relay);
        }
        clients[1].peer->SendLine(relay);
        clients[2].peer->SendLine(relay);
        testing_support::WaitAllClosed(clients);
    });
    ScenarioResult result = RunMultiUser(server, run_tag, "channel_broadcast");
    script.join();
    return result;
}

void TestChannelBroadcastAgainstScriptedServer() {
    assert(RunChannelBroadcast("0105", false).passed());

    ScenarioResult leaked = RunChannelBroadcast("0106", true);
    assert(leaked.verdict() == harness::Verdict::kFail);
    assert(Mentions(leaked, "PRIVMSG"));
}

ScenarioResult RunKick(const std::string &run_tag, bool relay_after_kick) {
    FakeServer server;
    std::thread script([&server, relay_after_kick]() {
        std::vector<RegisteredPeer> clients;
        assert(testing_support::AcceptRegistered(server, 2, clients));
        RegisteredPeer &op = clients[0];
        RegisteredPeer &victim = clients[1];
        const std::string channel = AdmitJoin(op, std::vector<RegisteredPeer *>());
        AdmitJoin(victim, std::vector<RegisteredPeer *>(1, &op));

        std::string line;
        assert(op.peer->ReadUntil("KICK", line, 2000));
        op.peer->SendLine(op.Prefix() + " " + line);
        victim.peer->SendLine(op.Prefix() + " " + line);
        assert(op.peer->ReadUntil("PRIVMSG", line, 2000));

        assert(victim.peer->ReadUntil("PRIVMSG", line, 2000));
        victim.peer->SendLine(":fake.local 404 " + victim.nick + " " + channel +
                              " :Cannot send to channel");
        if (relay_after_kick) {
            op.peer->SendLine(victim.Prefix() + " " + line);
        }
        testing_support::WaitAllClosed(clients);
    });
    ScenarioResult result = RunMultiUser(server, run_tag, "kick");
    script.join();
    return result;
}

void TestKickAgainstScriptedServer() {
    assert(RunKick("0107", false).passed());

    ScenarioResult relayed = RunKick("0108", true);
    assert(relayed.verdict() == harness::Verdict::kFail);
    assert(Mentions(relayed, "kicked but talking"));
}

ScenarioResult RunKickRequiresOperator(const std::string &run_tag, bool allow_kick) {
    FakeServer server;
    std::thread script([&server, allow_kick]() {
        std::vector<RegisteredPeer> clients;
        assert(testing_support::AcceptRegistered(server, 2, clients));
        RegisteredPeer &op = clients[0];
        RegisteredPeer &member = clients[1];
        const std::string channel = AdmitJoin(op, std::vector<RegisteredPeer *>());
        AdmitJoin(member, std::vector<RegisteredPeer *>(1, &op));

        std::string line;
        assert(member.peer->ReadUntil("KICK", line, 2000));
        if (allow_kick) {
            op.peer->SendLine(member.Prefix() + " " + line);
            member.peer->SendLine(member.Prefix() + " " + line);
        } else {
            member.peer->SendLine(":fake.local 482 " + member.nick + " " + channel +
                                  " :You're not channel operator");
        }
        testing_support::WaitAllClosed(clients);
    });
    ScenarioResult result = RunMultiUser(server, run_tag, "kick_requires_operator");
    script.join();
    return result;
}

void TestKickRequiresOperatorAgainstScriptedServer() {
    assert(RunKickRequiresOperator("0109", false).passed());

    ScenarioResult allowed = RunKickRequiresOperator("0110", true);
    assert(allowed.verdict() == harness::Verdict::kFail);
    assert(Mentions(allowed, "482"));
}

// leak 이면 입장을 거부당한 사용자에게 채널 메시지를 보낸다.
ScenarioResult RunModeInviteOnly(const std::string &run_tag, bool leak) {
    FakeServer server;
    std::thread script([&server, leak]() {
        std::vector<RegisteredPeer> clients;
        assert(testing_support::AcceptRegistered(server, 2, clients));
        RegisteredPeer &op = clients[0];
        RegisteredPeer &outsider = clients[1];
        const std::string channel = AdmitJoin(op, std::vector<RegisteredPeer *>());
        EchoMode(op);
        RejectJoin(outsider, "473", "Cannot join channel (+i)");

        std::string line;
        assert(op.peer->ReadUntil("PRIVMSG", line, 2000));
        if (leak) {
            outsider.peer->SendLine(op.Prefix() + " " + line);
            testing_support::WaitAllClosed(clients);
            return;
        }

        assert(op.peer->ReadUntil("INVITE", line, 2000));
        op.peer->SendLine(":fake.local 341 " + op.nick + " " + outsider.nick + " " + channel);
        outsider.peer->SendLine(op.Prefix() + " INVITE " + outsider.nick + " " + channel);
        AdmitJoin(outsider, std::vector<RegisteredPeer *>(1, &op));
        testing_support::WaitAllClosed(clients);
    });
    ScenarioResult result = RunMultiUser(server, run_tag, "mode_invite_only");
    script.join();
    return result;
}

void TestModeInviteOnlyAgainstScriptedServer() {
    assert(RunModeInviteOnly("0111", false).passed());

    ScenarioResult leaked = RunModeInviteOnly("0112", true);
    assert(leaked.verdict() == harness::Verdict::kFail);
    assert(Mentions(leaked, "members only"));
}

// enforce_limit 이 false 면 +l 2 인 채널에 세 번째 사용자를 들여보낸다.
ScenarioResult RunModeUserLimit(const std::string &run_tag, bool enforce_limit) {
    FakeServer server;
    std::thread script([&server, enforce_limit]() {
        std::vector<RegisteredPeer> clients;
        assert(testing_support::AcceptRegistered(server, 3, clients));
        RegisteredPeer &op = clients[0];
        const std::vector<RegisteredPeer *> watch_op(1, &op);
        AdmitJoin(op, std::vector<RegisteredPeer *>());
        EchoMode(op);
        AdmitJoin(clients[1], watch_op);

        if (!enforce_limit) {
            AdmitJoin(clients[2], watch_op);
            testing_support::WaitAllClosed(clients);
            return;
        }
        RejectJoin(clients[2], "471", "Cannot join channel (+l)");
        EchoMode(op);
        AdmitJoin(clients[2], watch_op);
        testing_support::WaitAllClosed(clients);
    });
    ScenarioResult result = RunMultiUser(server, run_tag, "mode_user_limit");
    script.join();
    return result;
}

void TestModeUserLimitAgainstScriptedServer() {
    assert(RunModeUserLimit("0113", true).passed());

    ScenarioResult overfull = RunModeUserLimit("0114", false);
    assert(overfull.verdict() == harness::Verdict::kFail);
    assert(Mentions(overfull, "471"));
}

int main() {
    TestUnreachableServerAbortsRun();
    TestRunSuiteIsGeneric();
    TestScenarioCatalogues();
    TestPingPongAgainstScriptedServer();
    TestJoinRejectionFailsJoinScenario();
    TestTopicSetAgainstScriptedServer();
    TestBadPasswordSkippedWithoutPassword();
    TestChannelBroadcastAgainstScriptedServer();
    TestKickAgainstScriptedServer();
    TestKickRequiresOperatorAgainstScriptedServer();
    TestModeInviteOnlyAgainstScriptedServer();
    TestModeUserLimitAgainstScriptedServer();
    return 0;
}
