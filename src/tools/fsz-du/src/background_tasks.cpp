#include "background_tasks.hpp"

#include "fsz/logging.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fsz::du
{

BackgroundTasks::~BackgroundTasks()
{
    std::list<Worker> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex);
        remaining.swap(workers);
    }
    for (auto &worker : remaining)
    {
        if (worker.thread.joinable())
            worker.thread.join();
    }
}

void BackgroundTasks::submit(std::string label, std::function<void()> task)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (closed)
        throw std::runtime_error("background tasks are closed, refusing '" + label + "'");
    reapFinishedLocked();

    workers.emplace_back();
    Worker &worker = workers.back();
    worker.label = std::move(label);
    ++active;
    try
    {
        worker.thread = std::thread([this, &worker, task = std::move(task)] { run(worker, task); });
    }
    catch (const std::system_error &)
    {
        --active;
        workers.pop_back();
        throw;
    }
}

void BackgroundTasks::close()
{
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
}

void BackgroundTasks::waitIdle()
{
    std::unique_lock<std::mutex> lock(mutex);
    idle.wait(lock, [this] { return active == 0; });
    reapFinishedLocked();
}

std::size_t BackgroundTasks::activeCount() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return active;
}

void BackgroundTasks::run(Worker &worker, const std::function<void()> &task)
{
    log::logger()->debug("background task '{}' started", worker.label);
    try
    {
        task();
    }
    catch (const std::exception &ex)
    {
        log::logger()->error("background task '{}' failed: {}", worker.label, ex.what());
    }
    catch (...)
    {
        log::logger()->error("background task '{}' failed with an unknown exception", worker.label);
    }
    log::logger()->debug("background task '{}' finished", worker.label);

    std::lock_guard<std::mutex> lock(mutex);
    worker.finished = true;
    --active;
    idle.notify_all();
}

void BackgroundTasks::reapFinishedLocked()
{
    for (auto it = workers.begin(); it != workers.end();)
    {
        if (!it->finished)
        {
            ++it;
            continue;
        }
        if (it->thread.joinable())
            it->thread.join();
        it = workers.erase(it);
    }
}

} // namespace fsz::du
