#include "Pinboard/Editor/Interaction/DragModeEngine.h"

#include <algorithm>

namespace Pinboard::Ui::Interaction
{
    int DragModeEngine::decode(const DragHitRequest& request) noexcept
    {
        constexpr int n = kResizeBorder;
        const auto x = request.point.x;
        const auto y = request.point.y;
        const auto w = request.itemSize.x;
        const auto h = request.itemSize.y;

        if (x < 0 || x >= w || y < 0 || y >= h)
            return DragMode::none;

        auto mode = DragMode::none;
        if (request.canResize)
        {
            if (x < n)
            {
                mode = DragMode::left;
                if (y < n)
                    mode = DragMode::topLeft;
                else if (y >= h - n)
                    mode = DragMode::bottomLeft;
            }
            else if (x >= w - n)
            {
                mode = DragMode::right;
                if (y < n)
                    mode = DragMode::topRight;
                else if (y >= h - n)
                    mode = DragMode::bottomRight;
            }
            else if (y < n)
            {
                mode = DragMode::top;
            }
            else if (y >= h - n)
            {
                mode = DragMode::bottom;
            }
        }

        if (mode == DragMode::none && request.canMove)
        {
            if (y < request.titleBarTop || y >= h - request.titleBarBottom)
                mode = DragMode::move;
        }

        return mode;
    }

    juce::MouseCursor::StandardCursorType DragModeEngine::cursorFor(int mode) noexcept
    {
        switch (mode)
        {
            case DragMode::left:
            case DragMode::right:
                return juce::MouseCursor::LeftRightResizeCursor;
            case DragMode::top:
            case DragMode::bottom:
                return juce::MouseCursor::UpDownResizeCursor;
            case DragMode::topLeft:
                return juce::MouseCursor::TopLeftCornerResizeCursor;
            case DragMode::bottomRight:
                return juce::MouseCursor::BottomRightCornerResizeCursor;
            case DragMode::topRight:
                return juce::MouseCursor::TopRightCornerResizeCursor;
            case DragMode::bottomLeft:
                return juce::MouseCursor::BottomLeftCornerResizeCursor;
            default:
                break;
        }

        return juce::MouseCursor::NormalCursor;
    }

    bool DragModeEngine::isResizeMode(int mode) noexcept
    {
        return mode != DragMode::none && mode != DragMode::move;
    }

    juce::Rectangle<int> DragModeEngine::apply(int mode,
                                               juce::Rectangle<int> startBounds,
                                               juce::Point<int> delta,
                                               const SnapEngine& snap) noexcept
    {
        auto x = startBounds.getX();
        auto y = startBounds.getY();
        auto w = startBounds.getWidth();
        auto h = startBounds.getHeight();
        auto dx = delta.x;
        auto dy = delta.y;

        // Axes no edge of this mode follows stay put.
        if ((mode & (DragMode::xPosition | DragMode::width)) == 0)
            dx = 0;
        if ((mode & (DragMode::yPosition | DragMode::height)) == 0)
            dy = 0;

        if ((mode & DragMode::xPosition) != 0)
        {
            const auto snapped = snap.snapX(x, dx);
            if ((mode & DragMode::width) != 0)
            {
                x += snapped;
                w -= snapped;
            }
            else if (snapped == dx)
            {
                // Left edge did not snap; give the right edge a chance.
                x += snap.snapX(x + w, dx);
            }
            else
            {
                x += snapped;
            }
        }
        else if ((mode & DragMode::width) != 0)
        {
            w += snap.snapX(x + w, dx);
        }

        if ((mode & DragMode::yPosition) != 0)
        {
            const auto snapped = snap.snapY(y, dy);
            if ((mode & DragMode::height) != 0)
            {
                y += snapped;
                h -= snapped;
            }
            else if (snapped == dy)
            {
                y += snap.snapY(y + h, dy);
            }
            else
            {
                y += snapped;
            }
        }
        else if ((mode & DragMode::height) != 0)
        {
            h += snap.snapY(y + h, dy);
        }

        const auto minWidth = std::min(kMinItemExtent, startBounds.getWidth());
        if (w < minWidth)
        {
            if ((mode & DragMode::xPosition) != 0)
                x = startBounds.getRight() - minWidth;
            w = minWidth;
        }

        const auto minHeight = std::min(kMinItemExtent, startBounds.getHeight());
        if (h < minHeight)
        {
            if ((mode & DragMode::yPosition) != 0)
                y = startBounds.getBottom() - minHeight;
            h = minHeight;
        }

        return { x, y, w, h };
    }
}
