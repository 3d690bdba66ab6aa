// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <mutex>
#include <queue>
#include <atomic>
#include <thread>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <functional>
#include <condition_variable>

namespace tapegrad {
namespace backend {
namespace cpu {

// Fixed-size worker pool over a single shared queue.
class ThreadPool {
public:
    explicit ThreadPool(unsigned nthreads = default_threads()) { resize(nthreads); }
    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    static unsigned default_threads() {
        unsigned hw = std::thread::hardware_concurrency();
        return hw ? hw : 4u;
    }

    unsigned size() const noexcept {
        return nworkers_.load(std::memory_order_acquire);
    }

    // Join current workers and start `nthreads` new ones.
    void resize(unsigned nthreads) {
        nthreads = std::max(1u, nthreads);
        shutdown();
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = false;
        }
        workers_.reserve(nthreads);
        for (unsigned i = 0; i < nthreads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
        nworkers_.store(static_cast<unsigned>(workers_.size()), std::memory_order_release);
    }

    void enqueue(std::function<void()> f) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) throw std::runtime_error("ThreadPool: enqueue() on stopped pool");
            q_.push(std::move(f));
        }
        cv_.notify_one();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
        {
            std::lock_guard<std::mutex> lk(m_);
            std::queue<std::function<void()>> empty;
            q_.swap(empty);
        }
        nworkers_.store(0u, std::memory_order_release);
    }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
                if (stop_ && q_.empty()) return;
                task = std::move(q_.front());
                q_.pop();
            }
            // TaskGroup wraps every task and captures its exception.
            task();
        }
    }

    std::mutex m_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> q_;
    std::vector<std::thread> workers_;
    std::atomic<unsigned> nworkers_{0};
    bool stop_ = false;
};

// Scoped group of tasks; wait() rethrows the first task exception.
// The destructor blocks until every task that was enqueued has finished.
class TaskGroup {
public:
    explicit TaskGroup(ThreadPool& pool) : pool_(pool) {}
    ~TaskGroup() { drain(); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    template<class Fn>
    void run(Fn&& fn) {
        {
            std::lock_guard<std::mutex> lk(m_);
            ++pending_;
        }
        try {
            pool_.enqueue([this, f = std::forward<Fn>(fn)]() mutable {
                std::exception_ptr err;
                try {
                    f();
                } catch (...) {
                    err = std::current_exception();
                }
                std::lock_guard<std::mutex> lk(m_);
                if (err && !ex_) ex_ = err;
                if (--pending_ == 0) cv_.notify_one();
            });
        } catch (...) {
            std::lock_guard<std::mutex> lk(m_);
            if (--pending_ == 0) cv_.notify_one();
            throw;
        }
    }

    void wait() {
        drain();
        std::lock_guard<std::mutex> lk(m_);
        if (ex_) std::rethrow_exception(ex_);
    }

private:
    void drain() noexcept {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&] { return pending_ == 0; });
    }

    ThreadPool& pool_;
    std::mutex m_;
    std::condition_variable cv_;
    std::size_t pending_ = 0;
    std::exception_ptr ex_;
};

// Process-wide CPU runtime: worker pool plus the serial/parallel cutoff.
struct Runtime {
    ThreadPool pool;
    std::atomic<std::size_t> grain{4096};

    static Runtime& instance() {
        static Runtime rt;
        return rt;
    }

    // 0 = hardware concurrency.
    void set_num_threads(unsigned n) {
        pool.resize(n == 0 ? ThreadPool::default_threads() : n);
    }

    void set_grain(std::size_t g) {
        grain.store(std::max<std::size_t>(1, g), std::memory_order_release);
    }
};

// Parallel for over [begin, end). fn(size_t b, size_t e) handles one chunk.
template <typename Fn>
inline void parallel_for(std::size_t begin, std::size_t end, Fn fn) {
    auto& rt = Runtime::instance();
    const std::size_t n = (end > begin) ? (end - begin) : 0;
    if (n == 0) return;

    const unsigned nt = std::max(1u, rt.pool.size());
    const std::size_t g = rt.grain.load(std::memory_order_acquire);

    if (n < g || nt == 1) {
        fn(begin, end);
        return;
    }

    const std::size_t chunk = std::max(g, (n + nt - 1) / nt);

    TaskGroup tg(rt.pool);
    for (std::size_t s = begin; s < end; s += chunk) {
        const std::size_t e = std::min(end, s + chunk);
        tg.run([=] { fn(s, e); });
    }
    tg.wait();
}

} // namespace cpu
} // namespace backend
} // namespace tapegrad
