#pragma once
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <future>
#include <string>
#include <vector>
#include "ModelFitter.hpp"

// Result of fitting and evaluating one K
struct SweepPoint {
    int k = 0;
    bool success = false;
    double perplexity = 0.0;
    std::string error;
    double elapsed_ms = 0.0;
};

// Bounded pool running fit + held-out perplexity per K.
// The matrices are read-only for the pool's lifetime; each task owns its model.
class SweepWorkerPool {
public:
    SweepWorkerPool(
        size_t num_threads,
        ModelFitter& fitter,
        const DocumentTermMatrix& train,
        const DocumentTermMatrix& test
    );

    ~SweepWorkerPool();

    // Queue one K. The future never carries an exception; failures come
    // back as a SweepPoint with success == false.
    std::future<SweepPoint> submit_k(int k);

    struct Stats {
        size_t active_workers = 0;
        size_t queue_size = 0;
        size_t completed_tasks = 0;
        size_t failed_tasks = 0;
    };
    Stats get_stats() const;

private:
    struct Task {
        int k;
        std::promise<SweepPoint> result;
    };

    void worker_thread();
    SweepPoint evaluate_k(int k);

    ModelFitter& fitter_;
    const DocumentTermMatrix& train_;
    const DocumentTermMatrix& test_;

    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> shutdown_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_{};
};
