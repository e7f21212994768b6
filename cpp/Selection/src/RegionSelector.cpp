#include "RegionSelector.hpp"
#include <PixelMath.hpp>
#include <algorithm>
#include <iostream>

namespace Selection {

RegionSelector* RegionSelector::s_open = nullptr;

std::vector<PixelMath::LogicalRect> HoleMask::dimmedRects() const {
    using PixelMath::LogicalRect;

    // Clip the hole to the overlay
    const double hx0 = std::clamp(hole.x, bounds.x, bounds.maxX());
    const double hx1 = std::clamp(hole.maxX(), bounds.x, bounds.maxX());
    const double hy0 = std::clamp(hole.y, bounds.y, bounds.maxY());
    const double hy1 = std::clamp(hole.maxY(), bounds.y, bounds.maxY());

    if (hx1 <= hx0 || hy1 <= hy0) {
        return {bounds};
    }

    std::vector<LogicalRect> rects;
    auto add = [&](double x, double y, double w, double h) {
        if (w > 0.0 && h > 0.0) {
            rects.push_back(LogicalRect{x, y, w, h, bounds.space});
        }
    };

    add(bounds.x, bounds.y, bounds.width, hy0 - bounds.y); // below
    add(bounds.x, hy1, bounds.width, bounds.maxY() - hy1); // above
    add(bounds.x, hy0, hx0 - bounds.x, hy1 - hy0);         // left
    add(hx1, hy0, bounds.maxX() - hx1, hy1 - hy0);         // right
    return rects;
}

RegionSelector::RegionSelector(const PixelMath::Display& display)
    : m_display(display) {
    if (s_open) {
        std::cout << "[Selection] Closing previous selection overlay" << std::endl;
        s_open->close();
    }
    s_open = this;

    m_mask.bounds = PixelMath::LogicalRect{0.0, 0.0, display.frame.width, display.frame.height,
                                           PixelMath::CoordSpace::ScreenLocal};
    m_mask.hole = PixelMath::LogicalRect{};
}

RegionSelector::~RegionSelector() {
    if (s_open == this) {
        s_open = nullptr;
    }
}

void RegionSelector::setFeedbackCallback(FeedbackCallback callback) {
    m_feedback = std::move(callback);
}

void RegionSelector::setCompletionCallback(CompletionCallback callback) {
    m_completion = std::move(callback);
}

void RegionSelector::pointerDown(const PixelMath::LogicalPoint& p) {
    if (isFinished()) {
        return;
    }
    m_anchor = p;
    m_state = SelectorState::Dragging;
    m_mask.hole = PixelMath::spanning(p, p);
}

void RegionSelector::pointerMove(const PixelMath::LogicalPoint& p) {
    if (m_state != SelectorState::Dragging) {
        return;
    }
    m_mask.hole = PixelMath::spanning(m_anchor, p);
    if (m_feedback) {
        m_feedback(m_mask);
    }
}

void RegionSelector::pointerUp(const PixelMath::LogicalPoint& p) {
    if (isFinished()) {
        return;
    }
    if (m_state != SelectorState::Dragging) {
        finish(std::nullopt);
        return;
    }

    const PixelMath::LogicalRect rect = PixelMath::spanning(m_anchor, p);
    if (rect.width <= kMinSelectionSize || rect.height <= kMinSelectionSize) {
        std::cout << "[Selection] Selection " << rect.width << "x" << rect.height
                  << " is too small, discarded" << std::endl;
        m_degenerate = true;
        finish(std::nullopt);
        return;
    }

    const PixelMath::LogicalRect snapped = PixelMath::snapToPixelGrid(rect, m_display.scale);
    m_mask.hole = snapped;
    finish(PixelMath::toGlobal(snapped, m_display));
}

void RegionSelector::cancel() {
    if (isFinished()) {
        return;
    }
    std::cout << "[Selection] Selection cancelled" << std::endl;
    finish(std::nullopt);
}

void RegionSelector::finish(const std::optional<PixelMath::LogicalRect>& result) {
    m_state = result ? SelectorState::Completed : SelectorState::Cancelled;
    if (s_open == this) {
        s_open = nullptr;
    }
    if (result) {
        std::cout << "[Selection] Selected " << PixelMath::toString(*result) << " on display '"
                  << m_display.name << "'" << std::endl;
    }

    // The callback may destroy this selector
    CompletionCallback completion = m_completion;
    if (completion) {
        completion(result);
    }
}

void RegionSelector::close() {
    if (!isFinished()) {
        m_state = SelectorState::Cancelled;
    }
    m_completion = nullptr;
    m_feedback = nullptr;
    if (s_open == this) {
        s_open = nullptr;
    }
}

} // namespace Selection
