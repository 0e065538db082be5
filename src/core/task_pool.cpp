#include <exception>
#include "core/task_pool.hpp"
#include "loggerimpl.hpp"

TaskPool::TaskPool(size_t worker_count)
{
    if (worker_count == 0)
    {
        size_t hw = std::thread::hardware_concurrency();
        worker_count = hw == 0 ? 1 : hw;
    }

    threads.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i)
    {
        threads.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

TaskPool::~TaskPool()
{
    shutdown();
}

bool TaskPool::submit(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping)
        {
            return false;
        }
        tasks.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

void TaskPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping)
        {
            return;
        }
        stopping = true;
    }
    cv.notify_all();
    // joins every jthread once the queue has drained
    threads.clear();
}

size_t TaskPool::queued_tasks() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return tasks.size();
}

void TaskPool::worker_loop(std::stop_token stop)
{
    while (true)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, stop, [this]() { return stopping || !tasks.empty(); });

            if (tasks.empty())
            {
                // stopping with nothing left, or the thread itself was asked to stop
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }

        try
        {
            task(stop);
        }
        catch (const std::exception& e)
        {
            logger().err("Task pool job failed: %s", e.what());
        }
    }
}
