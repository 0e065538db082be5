#ifndef BASALT_TASK_POOL_HPP
#define BASALT_TASK_POOL_HPP


#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * Fixed-size pool for CPU bound chunk work (tag encoding, compression, generation), kept apart
 * from the network workers so a slow chunk never stalls socket I/O.
 */
class TaskPool
{
public:
    using Task = std::function<void(std::stop_token)>;

    /**
     * @param worker_count 0 picks hardware_concurrency(), minimum 1.
     */
    explicit TaskPool(size_t worker_count);

    ~TaskPool();

    TaskPool(const TaskPool&) = delete;

    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * Queues a task.
     * @return false if the pool is shutting down and the task was dropped.
     */
    bool submit(Task task);

    /**
     * Runs every queued task, then joins the workers. Idempotent.
     */
    void shutdown();

    [[nodiscard]] inline size_t worker_count() const { return threads.size(); }

    [[nodiscard]] size_t queued_tasks() const;
private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> threads;
    std::queue<Task> tasks;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    bool stopping = false;
};


#endif //BASALT_TASK_POOL_HPP
