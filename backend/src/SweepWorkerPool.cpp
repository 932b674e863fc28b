#include "SweepWorkerPool.hpp"
#include "errors.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>

SweepWorkerPool::SweepWorkerPool(
    size_t num_threads,
    ModelFitter& fitter,
    const DocumentTermMatrix& train,
    const DocumentTermMatrix& test
) : fitter_(fitter), train_(train), test_(test) {

    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&SweepWorkerPool::worker_thread, this);
    }

    stats_.active_workers = num_threads;

    std::cout << "[SweepWorkerPool] Started with " << num_threads << " workers\n";
}

SweepWorkerPool::~SweepWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<SweepPoint> SweepWorkerPool::submit_k(int k) {
    Task task;
    task.k = k;

    auto future = task.result.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));

        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.queue_size = task_queue_.size();
    }

    queue_cv_.notify_one();

    return future;
}

SweepWorkerPool::Stats SweepWorkerPool::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// Drains the queue before honouring shutdown so no promise is left unset
void SweepWorkerPool::worker_thread() {
    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_cv_.wait(lock, [this]() {
            return shutdown_ || !task_queue_.empty();
        });

        if (task_queue_.empty()) {
            if (shutdown_) break;
            continue;
        }

        Task task = std::move(task_queue_.front());
        task_queue_.pop();

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.queue_size = task_queue_.size();
        }

        lock.unlock();

        SweepPoint point = evaluate_k(task.k);

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            if (point.success) {
                stats_.completed_tasks++;
            } else {
                stats_.failed_tasks++;
            }
        }

        task.result.set_value(std::move(point));
    }
}

SweepPoint SweepWorkerPool::evaluate_k(int k) {
    auto start = std::chrono::steady_clock::now();

    SweepPoint point;
    point.k = k;

    try {
        auto model = fitter_.fit(train_, k);
        if (!model) {
            throw ExternalFitFailure(k, "fitter returned no model");
        }

        double score = fitter_.perplexity(*model, test_);
        if (!std::isfinite(score) || score < 0.0) {
            std::ostringstream msg;
            msg << "perplexity " << score << " is not a finite non-negative number";
            throw ExternalFitFailure(k, msg.str());
        }

        point.perplexity = score;
        point.success = true;
    } catch (const ExternalFitFailure& e) {
        point.error = e.reason();
    } catch (const std::exception& e) {
        point.error = e.what();
    }

    auto end = std::chrono::steady_clock::now();
    point.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::ostringstream line;
    if (point.success) {
        line << "[SweepWorkerPool] K=" << k << " perplexity=" << point.perplexity
             << " (" << static_cast<long long>(point.elapsed_ms) << "ms)\n";
        std::cout << line.str();
    } else {
        line << "[SweepWorkerPool] K=" << k << " failed: " << point.error << "\n";
        std::cerr << line.str();
    }
    return point;
}
