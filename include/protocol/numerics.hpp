/*
 * 설명: 테스트 시나리오가 기대하는 RFC 1459/2812 숫자 응답 코드.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#pragma once

namespace protocol {
namespace numeric {

const char kWelcome[] = "001";
const char kChannelModeIs[] = "324";
const char kNoTopic[] = "331";
const char kTopic[] = "332";
const char kInviting[] = "341";
const char kNamReply[] = "353";
const char kEndOfNames[] = "366";
const char kEndOfMotd[] = "376";

const char kNoSuchNick[] = "401";
const char kNoSuchChannel[] = "403";
const char kCannotSendToChan[] = "404";
const char kNoMotd[] = "422";
const char kErroneusNickname[] = "432";
const char kNicknameInUse[] = "433";
const char kNickCollision[] = "436";
const char kUserNotInChannel[] = "441";
const char kNotOnChannel[] = "442";
const char kNeedMoreParams[] = "461";
const char kPasswdMismatch[] = "464";
const char kChannelIsFull[] = "471";
const char kInviteOnlyChan[] = "473";
const char kBannedFromChan[] = "474";
const char kBadChannelKey[] = "475";
const char kChanOpPrivsNeeded[] = "482";

}  // namespace numeric
}  // namespace protocol
