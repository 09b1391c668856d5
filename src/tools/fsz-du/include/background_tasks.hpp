#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>

namespace fsz::du
{

// Fire-and-forget workers, one thread per submitted task. Finished threads are
// joined on the next submit(); the destructor joins whatever is left.
class BackgroundTasks
{
public:
    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks &) = delete;
    BackgroundTasks &operator=(const BackgroundTasks &) = delete;

    // Throws std::runtime_error once close() has been called.
    void submit(std::string label, std::function<void()> task);
    // Refuses further submissions; running tasks are unaffected.
    void close();
    void waitIdle();
    std::size_t activeCount() const;

private:
    struct Worker
    {
        std::string label;
        std::thread thread;
        bool finished = false;
    };

    void run(Worker &worker, const std::function<void()> &task);
    void reapFinishedLocked();

    mutable std::mutex mutex;
    std::condition_variable idle;
    std::list<Worker> workers;
    std::size_t active = 0;
    bool closed = false;
};

} // namespace fsz::du
