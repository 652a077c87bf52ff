#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include "eqpp/binder.hpp"
#include "eqpp/compiled_system.hpp"
#include "eqpp/errors.hpp"
#include "eqpp/job.hpp"
#include "eqpp/notification_channel.hpp"
#include "eqpp/parser.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace eqpp_test {

inline eqpp::CompiledSystemPtr
compile_with(const std::string &source, const std::map<std::string, double> &parameters = {}) {
    eqpp::BindOptions options;
    options.parameters = parameters;
    return eqpp::compile_source(source, options);
}

inline eqpp::SystemSpec
bind_source(const std::string &source, const std::map<std::string, double> &parameters = {}) {
    eqpp::BindOptions options;
    options.parameters = parameters;
    return eqpp::bind(eqpp::parse(source), options);
}

// Runs `fn`, which must throw BindError, and returns the error for inspection.
template<typename Fn>
eqpp::BindError
expect_bind_error(Fn fn) {
    try {
        fn();
    } catch (const eqpp::BindError &e) {
        return e;
    }
    ADD_FAILURE() << "expected BindError";
    return eqpp::BindError(eqpp::BindErrorKind::UnsupportedConstruct, "", 0, "no error");
}

template<typename Fn>
eqpp::ParseError
expect_parse_error(Fn fn) {
    try {
        fn();
    } catch (const eqpp::ParseError &e) {
        return e;
    }
    ADD_FAILURE() << "expected ParseError";
    return eqpp::ParseError(eqpp::ParseErrorKind::EmptyInput, 0, "no error");
}

// Drains a subscription until its stream ends (or a generous timeout per event).
inline std::vector<eqpp::JobEvent>
collect_events(eqpp::Subscription &subscription, std::chrono::milliseconds per_event = std::chrono::seconds(30)) {
    std::vector<eqpp::JobEvent> events;
    while (true) {
        auto event = subscription.next_for(per_event);
        if (!event) { break; }
        events.push_back(std::move(*event));
    }
    return events;
}

/**
 * @brief Fresh directory under the system temp path, removed on destruction.
 */
class TempDirectory {
  public:
    TempDirectory() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() / ("eqpp_test_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }
    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    const std::filesystem::path &path() const { return path_; }

  private:
    std::filesystem::path path_;
};

} // namespace eqpp_test

#endif // TEST_UTILS_HPP
