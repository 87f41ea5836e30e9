#pragma once

#include "Pinboard/Editor/Canvas/TitleBarLayout.h"
#include "Pinboard/Editor/Interaction/SnapEngine.h"
#include "Pinboard/Public/Types.h"
#include "Pinboard/Theme/ItemTheme.h"
#include <JuceHeader.h>
#include <optional>

namespace Pinboard::Ui::Canvas
{
    struct ItemPaintState
    {
        juce::String title;
        bool minimized = false;
        std::optional<TitleBarButton> pressedButton;
    };

    class CanvasRenderer
    {
    public:
        static juce::FontOptions titleFont();

        void paintBackground(juce::Graphics& g, juce::Rectangle<int> bounds) const;
        void paintGrid(juce::Graphics& g, juce::Rectangle<int> bounds, const GridInfo& grid) const;
        void paintGuides(juce::Graphics& g,
                         juce::Rectangle<int> bounds,
                         const GuideInfo& guide,
                         const Interaction::GuideLines& lines) const;

        void paintItem(juce::Graphics& g,
                       juce::Rectangle<int> bounds,
                       const ItemTheme& theme,
                       const std::optional<TitleBarLayout>& layout,
                       const ItemPaintState& state) const;

        void paintButtonGlyph(juce::Graphics& g,
                              TitleBarButton button,
                              juce::Rectangle<float> area,
                              bool minimized,
                              juce::Colour colour) const;

    private:
        void drawStyledLine(juce::Graphics& g, juce::Line<float> line, LineStyle style) const;
    };
}
