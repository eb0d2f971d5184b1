/*
 * 설명: INI 파일을 파싱해 테스터 설정을 생성하고 검증한다. 섹션마다 키 처리 함수를 둔다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include "utils/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
const char kWhitespace[] = " \t\r\n";

std::string Trim(const std::string &text) {
    std::size_t start = text.find_first_not_of(kWhitespace);
    if (start == std::string::npos) {
        return std::string();
    }
    std::size_t end = text.find_last_not_of(kWhitespace);
    return text.substr(start, end - start + 1);
}

std::string Lower(std::string text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        text[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    }
    return text;
}

// 0 이상 정수. allow_zero 가 false 면 0 도 거부한다.
bool ParseCount(const std::string &raw, bool allow_zero, std::size_t &out) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    char *end = NULL;
    unsigned long value = std::strtoul(raw.c_str(), &end, 10);
    if (*end != '\0' || (!allow_zero && value == 0)) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

// 각 처리 함수는 성공 시 빈 문자열, 실패 시 오류 내용을 돌려준다.
std::string ApplyServerKey(const std::string &key, const std::string &value,
                           config::Settings &out) {
    if (key == "host") {
        if (value.empty()) {
            return "server.host 누락";
        }
        out.host = value;
    } else if (key == "port") {
        if (!config::ParsePort(value, out.port)) {
            return "server.port 오류: " + value;
        }
    } else if (key == "password") {
        out.password = value;
    } else {
        return "알 수 없는 키 server." + key;
    }
    return std::string();
}

std::string ApplyLoggingKey(const std::string &key, const std::string &value,
                            config::Settings &out) {
    if (key == "file") {
        out.log_file = value;
        return std::string();
    }
    if (key != "level") {
        return "알 수 없는 키 logging." + key;
    }

    const config::LogLevel levels[] = {config::LogLevel::kDebug, config::LogLevel::kInfo,
                                       config::LogLevel::kWarn, config::LogLevel::kError};
    const std::string wanted = Lower(value);
    for (std::size_t i = 0; i < sizeof(levels) / sizeof(levels[0]); ++i) {
        if (config::LogLevelToString(levels[i]) == wanted) {
            out.log_level = levels[i];
            return std::string();
        }
    }
    return "logging.level 오류: " + value;
}

std::string ApplyTimeoutKey(const std::string &key, const std::string &value,
                            config::Settings &out) {
    std::size_t *target = NULL;
    if (key == "expect_ms") {
        target = &out.expect_timeout_ms;
    } else if (key == "registration_ms") {
        target = &out.registration_timeout_ms;
    } else if (key == "settle_ms") {
        target = &out.settle_ms;
    } else if (key == "quiet_ms") {
        target = &out.quiet_ms;
    } else if (key == "scenario_ms") {
        target = &out.scenario_timeout_ms;
    } else {
        return "알 수 없는 키 timeouts." + key;
    }
    // settle_ms 만 0 을 허용한다 (환영 메시지 정리 생략).
    if (!ParseCount(value, key == "settle_ms", *target)) {
        return "timeouts." + key + " 오류: " + value;
    }
    return std::string();
}

std::string ApplyLimitKey(const std::string &key, const std::string &value,
                          config::Settings &out) {
    std::size_t *target = NULL;
    if (key == "queue_capacity") {
        target = &out.queue_capacity;
    } else if (key == "parallel_scenarios") {
        target = &out.parallel_scenarios;
    } else {
        return "알 수 없는 키 limits." + key;
    }
    if (!ParseCount(value, false, *target)) {
        return "limits." + key + " 오류: " + value;
    }
    return std::string();
}

std::string LineError(const std::string &what, std::size_t line_no) {
    std::ostringstream oss;
    oss << what << " (" << line_no << ")";
    return oss.str();
}
}  // namespace

namespace config {

Settings::Settings()
    : host("127.0.0.1"),
      port(6667),
      log_level(LogLevel::kInfo),
      expect_timeout_ms(5000),
      registration_timeout_ms(10000),
      settle_ms(1000),
      quiet_ms(1000),
      scenario_timeout_ms(30000),
      queue_capacity(4096),
      parallel_scenarios(1) {}

bool ParsePort(const std::string &raw, int &out) {
    std::size_t value = 0;
    if (!ParseCount(raw, false, value) || value > 65535) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool LoadFromFile(const std::string &path, Settings &out, std::string &error) {
    out = Settings();
    if (path.empty()) {
        return true;
    }

    // 파일이 없으면 기본값으로 실행한다.
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return true;
    }

    std::string section;
    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(file, raw)) {
        ++line_no;
        const std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.size() < 3 || line[line.size() - 1] != ']') {
                error = LineError("잘못된 섹션 선언", line_no);
                return false;
            }
            section = Lower(Trim(line.substr(1, line.size() - 2)));
            if (section != "server" && section != "logging" && section != "timeouts" &&
                section != "limits") {
                error = LineError("알 수 없는 섹션 [" + section + "]", line_no);
                return false;
            }
            continue;
        }

        std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            error = LineError("키=값 형식 오류", line_no);
            return false;
        }
        if (section.empty()) {
            error = LineError("섹션 없음", line_no);
            return false;
        }

        const std::string key = Lower(Trim(line.substr(0, eq)));
        const std::string value = Trim(line.substr(eq + 1));
        std::string problem;
        if (section == "server") {
            problem = ApplyServerKey(key, value, out);
        } else if (section == "logging") {
            problem = ApplyLoggingKey(key, value, out);
        } else if (section == "timeouts") {
            problem = ApplyTimeoutKey(key, value, out);
        } else {
            problem = ApplyLimitKey(key, value, out);
        }
        if (!problem.empty()) {
            error = LineError(problem, line_no);
            return false;
        }
    }
    return true;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

}  // namespace config
