#include "worker_pool.hpp"

#include <exception>
#include <print>

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { run(st); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard lock(mu_);
        if (closed_) {
            std::println(stderr, "workers: pool is shut down, dropping job");
            return;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mu_);
        if (closed_ && workers_.empty()) return;
        closed_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
}

size_t WorkerPool::pending() const {
    std::lock_guard lock(mu_);
    return jobs_.size();
}

void WorkerPool::run(std::stop_token st) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(mu_);
            cv_.wait(lock, st, [this] { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) return; // closed (or stop requested) and drained
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            std::println(stderr, "workers: job threw: {}", e.what());
        }
    }
}
