#include "fieldsync/retry_policy.hpp"
#include "common/recording_waiter.hpp"
#include "common/test_check.hpp"
#include <iostream>
#include <stdexcept>

using namespace fieldsync;
using fieldsync::testing::RecordingWaiter;
using std::chrono::milliseconds;

static RetryConfig fast_config() {
    RetryConfig config;
    config.max_attempts = 3;
    config.base_delay = milliseconds(1000);
    config.max_delay = milliseconds(10000);
    config.backoff_factor = 2.0;
    config.attempt_timeout = milliseconds(15000);
    return config;
}

static void test_backoff_delay() {
    TEST_CHECK(backoff_delay(milliseconds(1000), 2.0, 0, milliseconds(10000)) == milliseconds(1000));
    TEST_CHECK(backoff_delay(milliseconds(1000), 2.0, 1, milliseconds(10000)) == milliseconds(2000));
    TEST_CHECK(backoff_delay(milliseconds(1000), 2.0, 3, milliseconds(10000)) == milliseconds(8000));
    TEST_CHECK(backoff_delay(milliseconds(1000), 2.0, 4, milliseconds(10000)) == milliseconds(10000));
    TEST_CHECK(backoff_delay(milliseconds(3000), 2.0, 5, milliseconds(60000)) == milliseconds(60000));
    TEST_CHECK(backoff_delay(milliseconds(500), 2.0, -1, milliseconds(10000)) == milliseconds(500));

    RetryConfig config = fast_config();
    TEST_CHECK(retry_delay(config, 1) == milliseconds(1000));
    TEST_CHECK(retry_delay(config, 2) == milliseconds(2000));
    std::cout << "Backoff delay test: OK\n";
}

static void test_succeeds_after_transient_failures() {
    RecordingWaiter waiter;
    int calls = 0;
    std::vector<int> numbers;

    int result = with_retry([&](const RetryAttempt& attempt) {
        ++calls;
        numbers.push_back(attempt.number);
        TEST_CHECK(attempt.timeout == milliseconds(15000));
        if (calls < 3) {
            throw SyncError(calls == 1 ? ErrorKind::Network : ErrorKind::Timeout, "flaky");
        }
        return 42;
    }, fast_config(), waiter);

    TEST_CHECK(result == 42);
    TEST_CHECK(calls == 3);
    TEST_CHECK((numbers == std::vector<int>{1, 2, 3}));
    auto delays = waiter.delays();
    TEST_CHECK(delays.size() == 2);
    TEST_CHECK(delays[0] == milliseconds(1000));
    TEST_CHECK(delays[1] == milliseconds(2000));
    std::cout << "Retry after transient failures test: OK\n";
}

static void test_non_retryable_fails_fast() {
    RecordingWaiter waiter;
    int calls = 0;
    bool thrown = false;
    try {
        with_retry([&](const RetryAttempt&) -> int {
            ++calls;
            throw SyncError(ErrorKind::Auth, "token expired", 401);
        }, fast_config(), waiter);
    } catch (const RetryError& e) {
        thrown = true;
        TEST_CHECK(e.attempts() == 1);
        TEST_CHECK(e.kind() == ErrorKind::Auth);
        TEST_CHECK(e.http_status() == 401);
    }
    TEST_CHECK(thrown);
    TEST_CHECK(calls == 1);
    TEST_CHECK(waiter.delays().empty());

    // Anything that is not a SyncError counts as Unknown and is not retried.
    calls = 0;
    thrown = false;
    try {
        with_retry([&](const RetryAttempt&) -> int {
            ++calls;
            throw std::runtime_error("bad payload");
        }, fast_config(), waiter);
    } catch (const RetryError& e) {
        thrown = true;
        TEST_CHECK(e.kind() == ErrorKind::Unknown);
    }
    TEST_CHECK(thrown);
    TEST_CHECK(calls == 1);
    std::cout << "Non-retryable failure test: OK\n";
}

static void test_exhausts_attempts() {
    RecordingWaiter waiter;
    int calls = 0;
    bool thrown = false;
    try {
        with_retry([&](const RetryAttempt&) -> int {
            ++calls;
            throw SyncError(ErrorKind::Server, "503", 503);
        }, fast_config(), waiter);
    } catch (const RetryError& e) {
        thrown = true;
        TEST_CHECK(e.attempts() == 3);
        TEST_CHECK(e.kind() == ErrorKind::Server);
        TEST_CHECK(std::string(e.what()).find("3 attempts") != std::string::npos);
    }
    TEST_CHECK(thrown);
    TEST_CHECK(calls == 3);
    TEST_CHECK(waiter.delays().size() == 2);
    std::cout << "Exhausted attempts test: OK\n";
}

static void test_custom_predicate() {
    RecordingWaiter waiter;
    RetryConfig config = fast_config();
    config.should_retry = [](const SyncError& e) { return e.kind() == ErrorKind::Validation; };

    int calls = 0;
    int result = with_retry([&](const RetryAttempt&) {
        if (++calls == 1) throw SyncError(ErrorKind::Validation, "conflict", 409);
        return 7;
    }, config, waiter);
    TEST_CHECK(result == 7);
    TEST_CHECK(calls == 2);
    std::cout << "Custom retry predicate test: OK\n";
}

static void test_cancellation() {
    RecordingWaiter waiter;
    waiter.set_on_wait([&]() { waiter.cancel(); });

    int calls = 0;
    bool cancelled = false;
    try {
        with_retry([&](const RetryAttempt&) -> int {
            ++calls;
            throw SyncError(ErrorKind::Network, "down");
        }, fast_config(), waiter);
    } catch (const OperationCancelled& e) {
        cancelled = true;
        TEST_CHECK(e.kind() == ErrorKind::Cancelled);
    }
    TEST_CHECK(cancelled);
    TEST_CHECK(calls == 1);

    // A cancelled waiter stops the sequence before the first attempt.
    calls = 0;
    cancelled = false;
    try {
        with_retry([&](const RetryAttempt&) { return ++calls; }, fast_config(), waiter);
    } catch (const OperationCancelled&) {
        cancelled = true;
    }
    TEST_CHECK(cancelled);
    TEST_CHECK(calls == 0);

    waiter.reset();
    waiter.set_on_wait(nullptr);
    TEST_CHECK(with_retry([&](const RetryAttempt&) { return ++calls; }, fast_config(), waiter) == 1);
    std::cout << "Retry cancellation test: OK\n";
}

static void test_steady_waiter() {
    SteadyWaiter waiter;
    TEST_CHECK(waiter.wait_for(milliseconds(1)));
    waiter.cancel();
    TEST_CHECK(waiter.cancelled());
    TEST_CHECK(!waiter.wait_for(milliseconds(10000)));
    waiter.reset();
    TEST_CHECK(!waiter.cancelled());
    std::cout << "Steady waiter test: OK\n";
}

static void test_http_classification() {
    TEST_CHECK(classify_http_status(408) == ErrorKind::Timeout);
    TEST_CHECK(classify_http_status(429) == ErrorKind::Server);
    TEST_CHECK(classify_http_status(500) == ErrorKind::Server);
    TEST_CHECK(classify_http_status(401) == ErrorKind::Auth);
    TEST_CHECK(classify_http_status(403) == ErrorKind::Auth);
    TEST_CHECK(classify_http_status(422) == ErrorKind::Validation);
    TEST_CHECK(default_should_retry(SyncError(ErrorKind::Timeout, "")));
    TEST_CHECK(!default_should_retry(SyncError(ErrorKind::Validation, "")));
    TEST_CHECK(!default_should_retry(OperationCancelled("")));
    std::cout << "HTTP status classification test: OK\n";
}

int main() {
    try {
        test_backoff_delay();
        test_succeeds_after_transient_failures();
        test_non_retryable_fails_fast();
        test_exhausts_attempts();
        test_custom_predicate();
        test_cancellation();
        test_steady_waiter();
        test_http_classification();
        std::cout << "Retry policy tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
