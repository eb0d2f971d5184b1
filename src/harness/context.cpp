/*
 * 설명: 시나리오 문맥의 세션 관리, 고유 이름 생성, 동시 단계 실행과 강제 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/orchestrator_test.cpp
 */
#include "harness/context.hpp"

#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <thread>

namespace harness {

NameGenerator::NameGenerator(const std::string &run_tag)
    : run_tag_(run_tag), nick_counter_(0), channel_counter_(0) {}

std::string NameGenerator::DefaultRunTag() {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << (std::time(NULL) % 10000);
    return oss.str();
}

std::string NameGenerator::Nick(const std::string &base) {
    std::ostringstream oss;
    oss << base << run_tag_ << "u" << ++nick_counter_;
    return oss.str();
}

std::string NameGenerator::Channel() {
    std::ostringstream oss;
    oss << "#t" << run_tag_ << "c" << ++channel_counter_;
    return oss.str();
}

ScenarioContext::ScenarioContext(const std::string &name, const config::Settings &settings,
                                 Logger &logger, NameGenerator &names,
                                 std::chrono::steady_clock::time_point deadline)
    : name_(name),
      settings_(settings),
      logger_(logger),
      names_(names),
      deadline_(deadline),
      aborted_(false) {}

ScenarioContext::~ScenarioContext() {
    std::vector<std::shared_ptr<client::ClientSession> > sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        sessions[i]->Close();
    }
}

std::shared_ptr<client::ClientSession> ScenarioContext::Track(const client::Identity &identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (aborted_) {
        throw ScenarioError(name_ + ": 중단된 시나리오에서 세션 생성 요청");
    }
    std::shared_ptr<client::ClientSession> session = std::make_shared<client::ClientSession>(
        identity, client::OptionsFromSettings(settings_), logger_);
    sessions_.push_back(session);
    return session;
}

client::Identity ScenarioContext::MakeIdentity(const std::string &nick_base) {
    client::Identity identity;
    identity.nick = UniqueNick(nick_base);
    identity.username = identity.nick;
    identity.realname = identity.nick + " conformance";
    return identity;
}

std::shared_ptr<client::ClientSession> ScenarioContext::NewConnectedSession(
    const client::Identity &identity) {
    std::shared_ptr<client::ClientSession> session = Track(identity);
    session->Open(settings_.host, settings_.port);
    return session;
}

std::shared_ptr<client::ClientSession> ScenarioContext::NewConnectedSession(
    const std::string &nick_base) {
    return NewConnectedSession(MakeIdentity(nick_base));
}

std::shared_ptr<client::ClientSession> ScenarioContext::NewSession(const std::string &nick_base) {
    std::shared_ptr<client::ClientSession> session = NewConnectedSession(nick_base);
    session->Register(settings_.password);
    return session;
}

std::string ScenarioContext::UniqueNick(const std::string &base) { return names_.Nick(base); }

std::string ScenarioContext::UniqueChannel() { return names_.Channel(); }

void ScenarioContext::Barrier(const std::string &label, std::size_t parties) {
    barriers_.Arrive(label, parties, deadline_);
}

void ScenarioContext::RunConcurrently(const std::vector<std::function<void()> > &steps) {
    std::mutex error_mutex;
    std::exception_ptr first_error;
    std::vector<std::thread> threads;

    try {
        for (std::size_t i = 0; i < steps.size(); ++i) {
            threads.push_back(std::thread([this, &steps, &error_mutex, &first_error, i]() {
                try {
                    steps[i]();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    barriers_.Abort("동시 실행 단계 실패");
                }
            }));
        }
    } catch (const std::system_error &ex) {
        barriers_.Abort(std::string("스레드 생성 실패: ") + ex.what());
        for (std::size_t i = 0; i < threads.size(); ++i) {
            threads[i].join();
        }
        throw;
    }

    for (std::size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void ScenarioContext::Check(bool condition, const std::string &message) {
    if (!condition) {
        throw ScenarioError(message);
    }
}

void ScenarioContext::Note(const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    notes_.push_back(text);
}

std::vector<std::string> ScenarioContext::notes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_;
}

client::Duration ScenarioContext::expect_timeout() const {
    return client::Duration(settings_.expect_timeout_ms);
}

client::Duration ScenarioContext::quiet_window() const {
    return client::Duration(settings_.quiet_ms);
}

void ScenarioContext::Abort(const std::string &reason) {
    std::vector<std::shared_ptr<client::ClientSession> > sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        sessions = sessions_;
    }
    barriers_.Abort(reason);
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        sessions[i]->Close();
    }
}

void ScenarioContext::TearDown() {
    std::vector<std::shared_ptr<client::ClientSession> > sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        sessions.swap(sessions_);
    }
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        sessions[i]->Disconnect("conformance scenario finished");
    }
}

}  // namespace harness
