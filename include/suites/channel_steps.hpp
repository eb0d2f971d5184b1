/*
 * 설명: 두 스위트가 함께 쓰는 채널 단계(입장, 입장 거부 확인, 모드 설정)와 자주 쓰는 기대.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/runner_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include "client/expect.hpp"
#include "client/session.hpp"
#include "harness/context.hpp"

namespace suites {

client::Expectation JoinOf(const std::string &nick, const std::string &channel);
client::Expectation PartOf(const std::string &nick, const std::string &channel);
client::Expectation KickOf(const std::string &op, const std::string &channel,
                           const std::string &target);
client::Expectation ModeChange(const std::string &nick, const std::string &channel,
                               const std::string &flags);
// channel 에 대한 오류 숫자 응답 (<me> <channel> :text 형태)
client::Expectation ChannelError(const std::string &code, const std::string &channel);
// 353 의 이름 목록에 name(접두어 포함)이 있는지
client::Expectation NamesContain(const std::string &channel, const std::string &name);

// 자기 JOIN 과 366 까지 받는다. 오류 숫자 응답이면 ScenarioError.
void JoinChannel(harness::ScenarioContext &ctx, client::ClientSession &session,
                 const std::string &channel, const std::string &key = "");
// code 로 거부되어야 한다. 입장이 받아들여지면 ScenarioError.
void ExpectJoinRejected(harness::ScenarioContext &ctx, client::ClientSession &session,
                        const std::string &channel, const std::string &code,
                        const std::string &key = "");
// 운영자가 모드를 바꾸고 자신에게 돌아오는 MODE 를 확인한다.
void SetChannelMode(harness::ScenarioContext &ctx, client::ClientSession &op,
                    const std::string &channel, const std::string &flags,
                    const std::vector<std::string> &args = std::vector<std::string>());

}  // namespace suites
