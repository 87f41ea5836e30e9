#pragma once

#include <JuceHeader.h>
#include <optional>
#include <vector>

namespace Pinboard::Ui::Canvas
{
    enum class TitleBarButton
    {
        close,
        minimize,
        drag,
        clone
    };

    juce::String titleBarButtonToKey(TitleBarButton button);

    struct TitleBarRequest
    {
        int fontHeight = 0;
        juce::Point<int> itemSize;
        juce::BorderSize<int> insets;
        juce::Point<int> offset;
        juce::Point<int> buttonSize { 12, 12 };

        bool showClose = false;
        bool showMinimize = true;
        bool showDrag = false;
        bool showClone = false;
    };

    struct TitleBarPlacement
    {
        TitleBarButton button = TitleBarButton::close;
        juce::Rectangle<int> bounds;
    };

    struct TitleBarLayout
    {
        bool onTop = true;
        juce::Rectangle<int> title;
        std::vector<TitleBarPlacement> buttons; // right to left

        std::optional<juce::Rectangle<int>> boundsOf(TitleBarButton button) const noexcept;
        std::optional<TitleBarButton> buttonAt(juce::Point<int> point) const noexcept;
    };

    // Places the title and the title bar buttons. Returns nothing when the text does not fit into
    // either the top or the bottom title bar.
    std::optional<TitleBarLayout> computeTitleBarLayout(const TitleBarRequest& request);
}
