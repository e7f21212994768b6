#pragma once
#include <Geometry.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace Selection {

enum class SelectorState {
    Idle,
    Dragging,
    Completed,
    Cancelled
};

/**
 * @brief Even-odd overlay path: the whole overlay with the selection punched out
 *
 * Everything inside bounds but outside hole is dimmed.
 */
struct HoleMask {
    PixelMath::LogicalRect bounds; // overlay, ScreenLocal
    PixelMath::LogicalRect hole;   // selection, ScreenLocal

    // The dimmed area as up to four disjoint rects (below, above, left, right of the hole)
    std::vector<PixelMath::LogicalRect> dimmedRects() const;
};

/**
 * @brief Drag gesture tracker for a full-screen overlay bound to one display
 *
 * Points are ScreenLocal logical coordinates of that display. A completed
 * selection is snapped to the display's pixel grid and reported in Global
 * space. Only one selector is open at a time; constructing a new one closes
 * the previous without a result.
 */
class RegionSelector {
public:
    using FeedbackCallback = std::function<void(const HoleMask&)>;
    using CompletionCallback = std::function<void(const std::optional<PixelMath::LogicalRect>&)>;

    // Both sides of a drag must exceed this many logical units
    static constexpr double kMinSelectionSize = 10.0;

    explicit RegionSelector(const PixelMath::Display& display);
    ~RegionSelector();

    RegionSelector(const RegionSelector&) = delete;
    RegionSelector& operator=(const RegionSelector&) = delete;

    void setFeedbackCallback(FeedbackCallback callback);
    void setCompletionCallback(CompletionCallback callback);

    void pointerDown(const PixelMath::LogicalPoint& p);
    void pointerMove(const PixelMath::LogicalPoint& p);
    void pointerUp(const PixelMath::LogicalPoint& p);

    // Escape / programmatic close: finishes with no result
    void cancel();

    SelectorState state() const { return m_state; }
    const PixelMath::Display& display() const { return m_display; }
    const HoleMask& mask() const { return m_mask; }
    bool isFinished() const { return m_state == SelectorState::Completed || m_state == SelectorState::Cancelled; }

    // Finished without a result because the drag was below kMinSelectionSize
    bool wasDegenerate() const { return m_degenerate; }

    static RegionSelector* openInstance() { return s_open; }

private:
    void finish(const std::optional<PixelMath::LogicalRect>& result);
    void close();

    PixelMath::Display m_display;
    SelectorState m_state = SelectorState::Idle;
    bool m_degenerate = false;
    PixelMath::LogicalPoint m_anchor;
    HoleMask m_mask;

    FeedbackCallback m_feedback;
    CompletionCallback m_completion;

    static RegionSelector* s_open;
};

} // namespace Selection
