#pragma once

#include "Pinboard/Editor/Interaction/SnapEngine.h"
#include "Pinboard/Public/Types.h"
#include <JuceHeader.h>

namespace Pinboard::Ui::Interaction
{
    // Width of the band along each item edge that starts a resize.
    inline constexpr int kResizeBorder = 4;

    struct DragHitRequest
    {
        juce::Point<int> point;         // item-local
        juce::Point<int> itemSize;
        bool canResize = true;
        bool canMove = true;
        int titleBarTop = 0;            // height of the top title band
        int titleBarBottom = 0;         // height of the bottom title band
    };

    class DragModeEngine
    {
    public:
        // Which DragMode a left-button press at request.point would start.
        static int decode(const DragHitRequest& request) noexcept;

        static juce::MouseCursor::StandardCursorType cursorFor(int mode) noexcept;

        static bool isResizeMode(int mode) noexcept;

        // New bounds of an item dragged by delta from startBounds in the given mode.
        static juce::Rectangle<int> apply(int mode,
                                          juce::Rectangle<int> startBounds,
                                          juce::Point<int> delta,
                                          const SnapEngine& snap) noexcept;
    };
}
