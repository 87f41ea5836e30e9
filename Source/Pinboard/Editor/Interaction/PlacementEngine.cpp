#include "Pinboard/Editor/Interaction/PlacementEngine.h"

#include <algorithm>

namespace Pinboard::Ui::Interaction
{
    namespace
    {
        int resolveExtent(float requested, int best, int canvasExtent) noexcept
        {
            if (requested <= 0.0f)
                return best;
            if (requested <= 1.0f)
                return static_cast<int>(requested * static_cast<float>(canvasExtent));
            return static_cast<int>(requested);
        }

        int resolveCoordinate(float requested, int canvasExtent) noexcept
        {
            if (requested <= 1.0f)
                return static_cast<int>(requested * static_cast<float>(canvasExtent));
            return static_cast<int>(requested);
        }
    }

    juce::Point<int> PlacementEngine::resolveSize(juce::Point<float> requested,
                                                  juce::Point<int> best,
                                                  juce::Point<int> canvasSize) const noexcept
    {
        return { resolveExtent(requested.x, best.x, canvasSize.x),
                 resolveExtent(requested.y, best.y, canvasSize.y) };
    }

    juce::Rectangle<int> PlacementEngine::resolveBounds(const PlacementRequest& request,
                                                        const std::vector<juce::Rectangle<int>>& existing) const
    {
        const auto size = resolveSize(request.requestedSize, request.bestSize, request.canvasSize);
        const auto rx = request.requestedPosition.x;
        const auto ry = request.requestedPosition.y;

        // x stays "unresolved" (<= 0) until y decides between flow placement and the left edge.
        auto xUnresolved = rx <= 0.0f;
        auto x = 0;
        if (!xUnresolved)
            x = resolveCoordinate(rx, request.canvasSize.x);
        else if (ry > 0.0f)
            xUnresolved = false;

        auto y = 0;
        if (ry <= 0.0f)
        {
            if (xUnresolved || x <= 0)
            {
                const auto flow = initialPositionFor(size, request.canvasSize, existing);
                x = flow.x;
                y = flow.y;
            }
        }
        else
        {
            y = resolveCoordinate(ry, request.canvasSize.y);
        }

        return { x, y, size.x, size.y };
    }

    juce::Point<int> PlacementEngine::initialPositionFor(juce::Point<int> size,
                                                         juce::Point<int> canvasSize,
                                                         const std::vector<juce::Rectangle<int>>& existing) const noexcept
    {
        auto xMax = 0;
        auto yMax = 0;
        auto yNext = 0;

        for (const auto& bounds : existing)
        {
            if (bounds.getY() > yMax)
            {
                xMax = bounds.getRight();
                yMax = bounds.getY();
                yNext = bounds.getBottom();
            }
            else if (bounds.getY() == yMax)
            {
                xMax = std::max(xMax, bounds.getRight());
                yNext = std::max(yNext, bounds.getBottom());
            }
        }

        if (xMax + size.x > canvasSize.x)
            return { 0, yNext };

        return { xMax, yMax };
    }

    GuideLines PlacementEngine::guideLines(juce::Point<int> canvasSize,
                                           const std::vector<juce::Rectangle<int>>& items,
                                           std::optional<size_t> skipIndex) const
    {
        GuideLines lines;
        lines.vertical = { 0, canvasSize.x - 1 };
        lines.horizontal = { 0, canvasSize.y - 1 };

        for (size_t i = 0; i < items.size(); ++i)
        {
            if (skipIndex.has_value() && *skipIndex == i)
                continue;

            const auto& bounds = items[i];
            lines.vertical.insert(bounds.getX());
            lines.vertical.insert(bounds.getRight());
            lines.horizontal.insert(bounds.getY());
            lines.horizontal.insert(bounds.getBottom());
        }

        return lines;
    }

    juce::Point<int> PlacementEngine::contentExtent(const std::vector<juce::Rectangle<int>>& items) const noexcept
    {
        juce::Point<int> extent;
        for (const auto& bounds : items)
        {
            extent.x = std::max(extent.x, bounds.getRight());
            extent.y = std::max(extent.y, bounds.getBottom());
        }

        return extent;
    }

    juce::Point<int> PlacementEngine::bestItemSize(juce::Point<int> viewSize,
                                                   const juce::BorderSize<int>& insets) const noexcept
    {
        return { viewSize.x + insets.getLeftAndRight(), viewSize.y + insets.getTopAndBottom() };
    }
}
