#include "buffer.hpp"
#include <cstring>
#include <stdexcept>

namespace IMGBuffer {

Buffer::Buffer(std::size_t width, std::size_t height) {
    resize(width, height);
}

void Buffer::resize(std::size_t width, std::size_t height) {
    m_width = width;
    m_height = height;
    m_stride = width * 4; // 32-bit interleaved

    m_data.resize(m_stride * m_height);
}

void Buffer::assign(const FrameView& frame, std::uint64_t sequence) {
    if (!frame.data || frame.stride < frame.width * 4) {
        throw std::invalid_argument("FrameView stride is smaller than its row size");
    }

    if (frame.width != m_width || frame.height != m_height) {
        resize(frame.width, frame.height);
    }
    m_format = frame.format;
    m_sequence = sequence;

    if (frame.stride == m_stride) {
        std::memcpy(m_data.data(), frame.data, m_stride * m_height);
        return;
    }

    for (std::size_t row = 0; row < m_height; ++row) {
        std::memcpy(m_data.data() + row * m_stride, frame.data + row * frame.stride, m_stride);
    }
}

std::size_t Buffer::width() const noexcept {
    return m_width;
}

std::size_t Buffer::height() const noexcept {
    return m_height;
}

std::size_t Buffer::stride() const noexcept {
    return m_stride;
}

PixelFormat Buffer::format() const noexcept {
    return m_format;
}

std::uint64_t Buffer::sequence() const noexcept {
    return m_sequence;
}

std::uint8_t* Buffer::data() noexcept {
    return m_data.data();
}

const std::uint8_t* Buffer::data() const noexcept {
    return m_data.data();
}

} // namespace IMGBuffer
