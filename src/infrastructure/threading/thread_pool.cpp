// EN: Implementation of the ThreadPool class. Fixed worker set draining a priority queue.
// FR: Implémentation de la classe ThreadPool. Ensemble fixe de workers vidant une queue prioritaire.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace CDO {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    if (config_.threads == 0) {
        config_.threads = std::max(2u, std::thread::hardware_concurrency());
    }

    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        workers_.reserve(config_.threads);
        for (size_t i = 0; i < config_.threads; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(config_.threads) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

size_t ThreadPool::size() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return workers_.size();
}

// EN: Push a task and track the peak queue size.
// FR: Ajoute une tâche et suit la taille maximale de la queue.
void ThreadPool::enqueue(detail::Task task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }
        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task.sequence = next_sequence_++;
        task_queue_.push(std::move(task));

        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }
    queue_condition_.notify_one();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

// EN: Graceful shutdown: stop accepting work, drain the queue, join workers.
// FR: Arrêt propre : refuse le travail, vide la queue, joint les workers.
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }
    queue_condition_.notify_all();
    joinWorkers();

    LOG_DEBUG("threadpool", "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

void ThreadPool::forceShutdown() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
        dropped = task_queue_.size();
        std::priority_queue<detail::Task> empty;
        task_queue_.swap(empty);
    }

    LOG_WARN("threadpool", "Forced shutdown dropped " + std::to_string(dropped) + " queued tasks");
    queue_condition_.notify_all();
    idle_condition_.notify_all();
    joinWorkers();
}

void ThreadPool::joinWorkers() {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats stats;
    stats.created_at = start_time_;
    stats.total_threads = size();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats.queued_tasks = task_queue_.size();
    }
    stats.active_threads = active_threads_.load();
    stats.idle_threads = stats.total_threads > stats.active_threads
                             ? stats.total_threads - stats.active_threads : 0;
    stats.completed_tasks = completed_tasks_.load();
    stats.failed_tasks = failed_tasks_.load();
    stats.peak_queue_size = peak_queue_size_.load();

    size_t finished = stats.completed_tasks + stats.failed_tasks;
    if (finished > 0) {
        stats.average_task_duration_ms = static_cast<double>(total_duration_ms_.load()) / finished;
    }
    stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);
    return stats;
}

// EN: Worker thread function.
// FR: Fonction du thread worker.
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> function;
        std::string name;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            function = task_queue_.top().function;
            name = task_queue_.top().name;
            task_queue_.pop();
            active_threads_++;
        }

        auto start = std::chrono::steady_clock::now();
        bool success = true;
        try {
            function();
        } catch (const std::exception& e) {
            success = false;
            LOG_ERROR("threadpool", "Task '" + name + "' failed: " + std::string(e.what()));
        }
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        total_duration_ms_ += static_cast<uint64_t>(duration.count());

        if (success) {
            completed_tasks_++;
        } else {
            failed_tasks_++;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

} // namespace CDO
