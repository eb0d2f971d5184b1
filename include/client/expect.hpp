/*
 * 설명: 세션 수신 대기열 위의 기대(expectation) 조합기. 연결 간 순서가 보장되지 않으므로
 *       "바로 다음 메시지"가 아니라 시간 안에 "언젠가 도착"하는지를 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/expect_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "protocol/message.hpp"

namespace client {

class ClientSession;

typedef std::chrono::milliseconds Duration;

struct Expectation {
    std::string description;
    std::function<bool(const protocol::Message &)> matches;
};

namespace expect {

Expectation Command(const std::string &command);
// 전체 파라미터(trailing 포함)가 정확히 일치해야 한다.
Expectation Command(const std::string &command, const std::vector<std::string> &params);
Expectation Numeric(const std::string &code);
Expectation From(const std::string &nick);
// source 가 nick 이고 첫 파라미터가 target 인 모든 메시지
Expectation FromTo(const std::string &nick, const std::string &target);
Expectation Privmsg(const std::string &nick, const std::string &target, const std::string &text);
Expectation ParamEquals(std::size_t index, const std::string &value);
Expectation ParamContains(const std::string &text);

Expectation AllOf(const std::vector<Expectation> &parts);
Expectation AnyOf(const std::vector<Expectation> &parts);
Expectation Not(const Expectation &inner);

}  // namespace expect

// 각 기대가 서로 다른 메시지로, 순서와 무관하게, window 안에 만족되어야 한다.
std::vector<protocol::Message> ExpectAllWithin(ClientSession &session,
                                               const std::vector<Expectation> &all,
                                               Duration window);
// 가장 먼저 도착한 만족 메시지. matched_index 에 어떤 기대였는지 기록한다.
protocol::Message ExpectAnyWithin(ClientSession &session, const std::vector<Expectation> &any,
                                  Duration window, std::size_t *matched_index);
// window 동안 forbidden 에 해당하는 메시지가 하나도 오지 않아야 한다.
void ExpectSilence(ClientSession &session, const Expectation &forbidden, Duration window);

}  // namespace client
