#include "TaskQueue.hpp"
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <system_error>

namespace Session {

TaskQueue::TaskQueue() {
    m_eventFd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (m_eventFd < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

TaskQueue::~TaskQueue() {
    if (m_eventFd >= 0) {
        close(m_eventFd);
    }
}

void TaskQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push_back(std::move(task));
    }
    wake();
}

void TaskQueue::wake() {
    const std::uint64_t one = 1;
    if (write(m_eventFd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one)) && errno != EAGAIN) {
        std::cerr << "[Session] Failed to wake control loop: " << strerror(errno) << std::endl;
    }
}

void TaskQueue::acknowledge() {
    std::uint64_t count = 0;
    // EAGAIN just means nobody woke us since the last read
    if (read(m_eventFd, &count, sizeof(count)) < 0 && errno != EAGAIN) {
        std::cerr << "[Session] Failed to read wake counter: " << strerror(errno) << std::endl;
    }
}

std::size_t TaskQueue::drain() {
    acknowledge();

    std::size_t ran = 0;
    for (;;) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_tasks.empty()) {
                break;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
        ++ran;
    }
    return ran;
}

} // namespace Session
