#pragma once

#include "Pinboard/Editor/Interaction/SnapEngine.h"
#include <JuceHeader.h>
#include <optional>
#include <vector>

namespace Pinboard::Ui::Interaction
{
    struct PlacementRequest
    {
        juce::Point<float> requestedSize;       // adapter size
        juce::Point<float> requestedPosition;   // adapter position
        juce::Point<int> bestSize;
        juce::Point<int> canvasSize;
    };

    class PlacementEngine
    {
    public:
        // Per axis: <= 0 uses the best size, (0, 1] is a fraction of the canvas, > 1 is absolute.
        juce::Point<int> resolveSize(juce::Point<float> requested,
                                     juce::Point<int> best,
                                     juce::Point<int> canvasSize) const noexcept;

        // Initial bounds for a new item, given the bounds of the items already on the canvas
        // in list order.
        juce::Rectangle<int> resolveBounds(const PlacementRequest& request,
                                           const std::vector<juce::Rectangle<int>>& existing) const;

        // Flow placement: next to the last row of items, wrapping below it when the row is full.
        juce::Point<int> initialPositionFor(juce::Point<int> size,
                                            juce::Point<int> canvasSize,
                                            const std::vector<juce::Rectangle<int>>& existing) const noexcept;

        // Canvas border plus every item edge, except for the item at skipIndex.
        GuideLines guideLines(juce::Point<int> canvasSize,
                              const std::vector<juce::Rectangle<int>>& items,
                              std::optional<size_t> skipIndex = std::nullopt) const;

        juce::Point<int> contentExtent(const std::vector<juce::Rectangle<int>>& items) const noexcept;

        // Size of an item whose view prefers viewSize, framed by a theme with the given insets.
        juce::Point<int> bestItemSize(juce::Point<int> viewSize, const juce::BorderSize<int>& insets) const noexcept;
    };
}
