#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace IMGBuffer {

enum class PixelFormat {
    BGRA8, // 32-bit interleaved, little-endian ARGB words (X11 ZPixmap, WL_SHM_FORMAT_ARGB8888)
    RGBA8
};

/**
 * @brief Non-owning view of a frame as delivered by a capture provider
 *
 * Only valid for the duration of the delivery callback.
 */
struct FrameView {
    const std::uint8_t* data = nullptr;
    std::size_t width = 0;
    std::size_t height = 0;
    std::size_t stride = 0; // bytes per row, >= width * 4
    PixelFormat format = PixelFormat::BGRA8;
};

/**
 * @brief Retained copy of a frame, packed rows (stride == width * 4)
 */
class Buffer {
public:
    Buffer() = default;
    Buffer(std::size_t width, std::size_t height);

    void resize(std::size_t width, std::size_t height);

    // Copies a provider frame row by row, dropping any row padding
    void assign(const FrameView& frame, std::uint64_t sequence);

    std::size_t width() const noexcept;
    std::size_t height() const noexcept;
    std::size_t stride() const noexcept;
    PixelFormat format() const noexcept;
    std::uint64_t sequence() const noexcept;

    std::uint8_t* data() noexcept;
    const std::uint8_t* data() const noexcept;

private:
    std::size_t m_width{};
    std::size_t m_height{};
    std::size_t m_stride{};
    PixelFormat m_format{PixelFormat::BGRA8};
    std::uint64_t m_sequence{};
    std::vector<std::uint8_t> m_data;
};

} // namespace IMGBuffer
