/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with per-job cooperative cancellation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace task_dispatch {

/**
 * @brief Future plus the stop source wired into the job's stop_token.
 */
template <typename R>
struct CancellableJob {
    std::future<R> future;
    std::stop_source stop;

    void request_stop() { stop.request_stop(); }
    [[nodiscard]] bool ready() const {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 *
 * Shutting the pool down requests stop on every queued and running job;
 * jobs still queued at that point are abandoned and their futures report
 * a broken promise.
 *
 * A running job that ignores its stop request can be abandoned: its worker
 * is detached and replaced, so neither the pool's capacity nor its
 * destructor waits on it. Workers share the queue state through a
 * shared_ptr, which keeps a detached worker valid after the pool is gone.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token; the token belongs to this job alone.
    template <std::invocable<std::stop_token> F>
    CancellableJob<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /**
     * @brief Give up on the running job owning `job_stop`.
     *
     * The job keeps running on a detached thread; its result is still
     * delivered through its future if it ever finishes.
     * @return false if no running job owns that stop source.
     */
    bool abandon(const std::stop_source& job_stop);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t abandoned_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    struct Job {
        std::function<void()> body;
        std::stop_source stop;
    };

    struct Running {
        std::stop_source stop;
        size_t worker_id;
    };

    /// Queue state shared with the workers.
    struct State {
        std::queue<Job> queue;
        std::vector<Running> running;
        std::vector<size_t> retired;        ///< Workers to exit once their job returns
        std::mutex mutex;
        std::condition_variable_any cv;
        std::atomic<size_t> active{0};
        std::atomic<size_t> abandoned{0};
    };

    void enqueue(Job job);
    void spawn_worker();
    static void worker_loop(const std::shared_ptr<State>& state, size_t id, std::stop_token stop);

    std::shared_ptr<State> state_;
    std::map<size_t, std::jthread> workers_;
    size_t next_worker_id_ = 0;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue(Job{[p = std::move(promise), f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    }, std::stop_source{}});
    return future;
}

template <std::invocable<std::stop_token> F>
CancellableJob<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    std::stop_source source;

    CancellableJob<ReturnType> job{promise->get_future(), source};

    enqueue(Job{[p = std::move(promise), f = std::forward<F>(func), token = source.get_token()]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(token);
                p->set_value();
            } else {
                p->set_value(f(token));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    }, source});
    return job;
}

}  // namespace task_dispatch
