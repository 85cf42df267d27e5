#pragma once

#include "core/error.hpp"
#include "querier/query_session.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace logfanout {

namespace detail {

// Waits until pred holds, the session is cancelled, or its deadline passes.
// Returns pred() at wake-up.
template<typename Pred>
bool wait_until_done(std::condition_variable_any& cv, std::unique_lock<std::mutex>& lock,
                     const QuerySession& session, Pred pred) {
    if (session.deadline) {
        return cv.wait_until(lock, session.stop_token, *session.deadline, pred);
    }
    return cv.wait(lock, session.stop_token, pred);
}

inline Error interrupted_error(const QuerySession& session) {
    if (session.stop_token.stop_requested()) {
        return Error{ErrorCategory::CANCELLED, "query cancelled"};
    }
    return Error{ErrorCategory::DEADLINE_EXCEEDED, "query deadline exceeded"};
}

} // namespace detail

template<typename Job, typename R>
using JobFunction = std::function<Result<std::vector<R>>(const QuerySession&, const Job&)>;

/**
 * @brief Run fn once per job concurrently and concatenate results in job order
 *
 * One thread per job; parallelism is the job count. Fail-fast: the first
 * error stops the remaining jobs through the stop token of the session they
 * receive, and is returned without waiting for them. Session cancellation or
 * deadline does the same. No partial results are ever returned.
 */
template<typename Job, typename R>
[[nodiscard]] Result<std::vector<R>> for_each_job_merge_results(
    const QuerySession& session, std::vector<Job> jobs, JobFunction<Job, R> fn) {

    using Out = Result<std::vector<R>>;
    if (jobs.empty()) return Out::ok({});

    struct State {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::stop_source group;
        std::vector<Job> jobs;
        JobFunction<Job, R> fn;
        std::vector<std::optional<std::vector<R>>> results;
        size_t pending = 0;
        std::optional<Error> first_error;
    };

    auto state = std::make_shared<State>();
    state->jobs = std::move(jobs);
    state->fn = std::move(fn);
    state->results.resize(state->jobs.size());
    state->pending = state->jobs.size();

    QuerySession job_session = session;
    job_session.stop_token = state->group.get_token();

    for (size_t i = 0; i < state->jobs.size(); ++i) {
        std::thread([state, i, job_session] {
            auto result = state->fn(job_session, state->jobs[i]);

            std::lock_guard lock(state->mutex);
            if (result.is_ok()) {
                state->results[i] = std::move(result.value());
            } else if (!state->first_error) {
                state->first_error = result.to_error();
                state->group.request_stop();
            }
            --state->pending;
            state->cv.notify_all();
        }).detach();
    }

    std::unique_lock lock(state->mutex);
    const bool finished = detail::wait_until_done(state->cv, lock, session, [&] {
        return state->pending == 0 || state->first_error.has_value();
    });

    if (!finished) {
        state->group.request_stop();
        return Out::error(detail::interrupted_error(session));
    }
    if (state->first_error) {
        return Out::error(*state->first_error);
    }

    std::vector<R> merged;
    for (auto& partial : state->results) {
        if (!partial) continue;
        for (auto& item : *partial) {
            merged.push_back(std::move(item));
        }
    }
    return Out::ok(std::move(merged));
}

} // namespace logfanout
