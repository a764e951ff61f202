// EN: Priority thread pool used to run job bodies off the scheduler thread.
// FR: Pool de threads à priorité utilisé pour exécuter les corps de jobs hors du thread d'ordonnancement.

#pragma once

#include <atomic>
#include <cstdint>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace CDO {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    double average_task_duration_ms = 0.0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool behavior and limits.
// FR: Configuration pour le comportement et les limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads (0 means hardware concurrency).
    // FR: Nombre de threads workers (0 signifie la concurrence matérielle).
    size_t threads = 0;

    // EN: Maximum number of tasks in the queue (0 means unbounded).
    // FR: Nombre maximum de tâches dans la queue (0 signifie illimité).
    size_t max_queue_size = 0;
};

namespace detail {
    // EN: Internal task wrapper with priority and metadata.
    // FR: Wrapper interne de tâche avec priorité et métadonnées.
    struct Task {
        std::function<void()> function;
        TaskPriority priority;
        uint64_t sequence;
        std::string name;

        Task(std::function<void()> f, TaskPriority p, uint64_t seq, std::string n = "")
            : function(std::move(f)), priority(p), sequence(seq), name(std::move(n)) {}

        // EN: Higher priority first, then FIFO within one priority.
        // FR: Priorité la plus haute d'abord, puis FIFO à priorité égale.
        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

// EN: Fixed-size thread pool with a priority queue.
// FR: Pool de threads de taille fixe avec queue prioritaire.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for queued tasks to complete and stops all threads.
    // FR: Destructeur - attend la fin des tâches en queue et arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // EN: Submit a task with specified priority and return a future.
    // FR: Soumet une tâche avec priorité spécifiée et retourne un future.
    template<typename F, typename... Args>
    auto submit(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task with priority for better debugging.
    // FR: Soumet une tâche nommée avec priorité pour un meilleur débogage.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued tasks to complete.
    // FR: Attend que toutes les tâches actuellement en queue se terminent.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully (queued tasks still run).
    // FR: Arrête le pool de threads proprement (les tâches en queue s'exécutent).
    void shutdown();

    // EN: Force shutdown immediately, dropping pending tasks.
    // FR: Force l'arrêt immédiatement, abandonnant les tâches en attente.
    void forceShutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }
    size_t size() const;

    ThreadPoolStats getStats() const;

private:
    void workerLoop();
    void joinWorkers();
    void enqueue(detail::Task task);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;
    mutable std::mutex threads_mutex_;

    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};
    std::atomic<uint64_t> total_duration_ms_{0};

    std::chrono::system_clock::time_point start_time_;
};

template<typename F, typename... Args>
auto ThreadPool::submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", priority, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> result = task->get_future();

    enqueue(detail::Task([task]() { (*task)(); }, priority, 0, name));
    return result;
}

} // namespace CDO
