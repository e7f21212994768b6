#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace Session {

/**
 * @brief Closures posted from any thread, run on the control thread
 *
 * wakeFd() becomes readable whenever a task is posted or wake() is called,
 * so the control loop can poll() it next to the display connection.
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void post(std::function<void()> task);

    // Nudges the control loop without a task (new frame pending)
    void wake();

    // Runs everything posted so far, including tasks posted by those tasks
    std::size_t drain();

    int wakeFd() const { return m_eventFd; }

private:
    void acknowledge();

    int m_eventFd = -1;
    std::mutex m_mutex;
    std::deque<std::function<void()>> m_tasks;
};

} // namespace Session
