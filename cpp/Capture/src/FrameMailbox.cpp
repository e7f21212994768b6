#include "FrameMailbox.hpp"

namespace Capture {

FrameMailbox::FrameMailbox() = default;

void FrameMailbox::setWakeCallback(std::function<void()> wake) {
    m_wake = std::move(wake);
}

void FrameMailbox::publish(const IMGBuffer::FrameView& frame) {
    // 1. Fill our private buffer
    m_buffers[m_writeIdx].assign(frame, ++m_sequence);

    // 2. Swap it into the pending slot. 'release' publishes the pixels with the index.
    int old = m_pending.exchange(m_writeIdx | kFresh, std::memory_order_acq_rel);

    // 3. Whatever was pending becomes our next write target
    if (old & kFresh) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
    }
    m_writeIdx = old & kIndexMask;
    m_published.fetch_add(1, std::memory_order_relaxed);

    if (m_wake) {
        m_wake();
    }
}

const IMGBuffer::Buffer* FrameMailbox::takeLatest() {
    if (!(m_pending.load(std::memory_order_acquire) & kFresh)) {
        return nullptr;
    }

    // 'acquire' so we see the pixels written before the producer's exchange
    int old = m_pending.exchange(m_readIdx, std::memory_order_acq_rel);
    m_readIdx = old & kIndexMask;
    m_taken.fetch_add(1, std::memory_order_relaxed);
    return &m_buffers[m_readIdx];
}

bool FrameMailbox::hasPending() const {
    return (m_pending.load(std::memory_order_acquire) & kFresh) != 0;
}

} // namespace Capture
