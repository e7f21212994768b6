#pragma once
#include <buffer.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>

namespace Capture {

/**
 * @brief Capacity-1, overwrite-latest hand-off between the delivery thread and the render thread
 *
 * Triple buffered: the producer owns one buffer, the consumer owns one, and
 * the third sits in the pending slot. Publishing swaps the producer's buffer
 * into the slot; an unconsumed frame already there is recycled and counted
 * as dropped. The producer never waits on the consumer.
 *
 * Single producer, single consumer.
 */
class FrameMailbox {
public:
    FrameMailbox();

    // Called on the producer thread after each publish. Set before delivery starts.
    void setWakeCallback(std::function<void()> wake);

    // Producer: copies the frame and makes it the newest pending frame
    void publish(const IMGBuffer::FrameView& frame);

    /**
     * @brief Consumer: takes the newest pending frame
     * @return nullptr when nothing new was published since the last take.
     *         The buffer stays valid until the next call.
     */
    const IMGBuffer::Buffer* takeLatest();

    bool hasPending() const;

    std::uint64_t publishedCount() const { return m_published.load(std::memory_order_relaxed); }
    std::uint64_t droppedCount() const { return m_dropped.load(std::memory_order_relaxed); }
    std::uint64_t takenCount() const { return m_taken.load(std::memory_order_relaxed); }

private:
    static constexpr int kFresh = 0x4;
    static constexpr int kIndexMask = 0x3;

    std::array<IMGBuffer::Buffer, 3> m_buffers;
    int m_writeIdx = 0;             // producer only
    int m_readIdx = 2;              // consumer only
    std::atomic<int> m_pending{1};  // buffer index | kFresh
    std::uint64_t m_sequence = 0;   // producer only

    std::function<void()> m_wake;

    std::atomic<std::uint64_t> m_published{0};
    std::atomic<std::uint64_t> m_dropped{0};
    std::atomic<std::uint64_t> m_taken{0};
};

} // namespace Capture
