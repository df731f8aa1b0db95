#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

// Runs blocking work (network stages, subprocesses, database writes) off the
// event loop thread.
class Executor {
public:
    virtual ~Executor() = default;
    virtual void submit(std::function<void()> job) = 0;
};

class WorkerPool : public Executor {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> job) override;

    // Finishes queued jobs, then joins the workers. Later submits are dropped.
    void shutdown();

    size_t pending() const;

private:
    void run(std::stop_token st);

    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> jobs_;
    bool closed_ = false;
    std::vector<std::jthread> workers_;
};
