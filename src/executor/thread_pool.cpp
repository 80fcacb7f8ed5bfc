/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <algorithm>

namespace task_dispatch {

ThreadPool::ThreadPool(size_t num_threads)
    : state_(std::make_shared<State>()) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    for (size_t i = 0; i < num_threads; ++i) spawn_worker();
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(state_->mutex);
        for (auto& entry : state_->running) entry.stop.request_stop();
        while (!state_->queue.empty()) {
            state_->queue.front().stop.request_stop();
            state_->queue.pop();
        }
    }
    // Request stop on all jthreads first
    for (auto& [id, worker] : workers_) {
        worker.request_stop();
    }
    // Wake all threads so they can observe the stop request
    state_->cv.notify_all();
    // jthreads will auto-join in their destructors; abandoned ones are detached
}

void ThreadPool::spawn_worker() {
    auto id = next_worker_id_++;
    workers_.emplace(id, std::jthread([state = state_, id](std::stop_token stop) {
        worker_loop(state, id, stop);
    }));
}

void ThreadPool::enqueue(Job job) {
    {
        std::lock_guard lock(state_->mutex);
        state_->queue.push(std::move(job));
    }
    state_->cv.notify_one();
}

bool ThreadPool::abandon(const std::stop_source& job_stop) {
    size_t worker_id = 0;
    {
        std::lock_guard lock(state_->mutex);
        auto it = std::find_if(state_->running.begin(), state_->running.end(),
                               [&](const Running& r) { return r.stop == job_stop; });
        if (it == state_->running.end()) return false;

        worker_id = it->worker_id;
        it->stop.request_stop();
        state_->running.erase(it);
        state_->retired.push_back(worker_id);
        --state_->active;
        ++state_->abandoned;
    }

    auto worker = workers_.find(worker_id);
    if (worker != workers_.end()) {
        worker->second.detach();
        workers_.erase(worker);
    }
    spawn_worker();
    return true;
}

void ThreadPool::worker_loop(const std::shared_ptr<State>& state, size_t id, std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(state->mutex);
            state->cv.wait(lock, stop, [&state] { return !state->queue.empty(); });

            if (state->queue.empty()) continue;

            job = std::move(state->queue.front());
            state->queue.pop();
            state->running.push_back(Running{job.stop, id});
            ++state->active;
        }

        job.body();

        std::lock_guard lock(state->mutex);
        auto retired = std::find(state->retired.begin(), state->retired.end(), id);
        if (retired != state->retired.end()) {
            // Replaced while stuck; the new worker owns this slot now.
            state->retired.erase(retired);
            --state->abandoned;
            return;
        }
        --state->active;
        auto it = std::find_if(state->running.begin(), state->running.end(),
                               [id](const Running& r) { return r.worker_id == id; });
        if (it != state->running.end()) state->running.erase(it);
    }
}

size_t ThreadPool::active_count() const noexcept {
    return state_->active.load();
}

size_t ThreadPool::abandoned_count() const noexcept {
    return state_->abandoned.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(state_->mutex);
    return state_->queue.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace task_dispatch
