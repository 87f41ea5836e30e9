#include "Pinboard/Editor/Canvas/CanvasRenderer.h"

namespace Pinboard::Ui::Canvas
{
    juce::FontOptions CanvasRenderer::titleFont()
    {
        return juce::FontOptions(13.0f);
    }

    void CanvasRenderer::paintBackground(juce::Graphics& g, juce::Rectangle<int> bounds) const
    {
        g.setColour(juce::Colour::fromRGB(18, 20, 25));
        g.fillRect(bounds);
    }

    void CanvasRenderer::paintGrid(juce::Graphics& g, juce::Rectangle<int> bounds, const GridInfo& grid) const
    {
        const auto safeGrid = clamped(grid);
        const auto size = safeGrid.size;
        const auto offset = safeGrid.offset % size;
        const auto width = static_cast<float>(bounds.getWidth());
        const auto height = static_cast<float>(bounds.getHeight());

        g.setColour(safeGrid.colour);
        for (int x = offset; x < bounds.getWidth(); x += size)
            drawStyledLine(g, { static_cast<float>(x), 0.0f, static_cast<float>(x), height }, safeGrid.style);
        for (int y = offset; y < bounds.getHeight(); y += size)
            drawStyledLine(g, { 0.0f, static_cast<float>(y), width, static_cast<float>(y) }, safeGrid.style);
    }

    void CanvasRenderer::paintGuides(juce::Graphics& g,
                                     juce::Rectangle<int> bounds,
                                     const GuideInfo& guide,
                                     const Interaction::GuideLines& lines) const
    {
        const auto width = static_cast<float>(bounds.getWidth());
        const auto height = static_cast<float>(bounds.getHeight());

        g.setColour(guide.colour);
        for (const auto x : lines.vertical)
            drawStyledLine(g, { static_cast<float>(x), 0.0f, static_cast<float>(x), height }, guide.style);
        for (const auto y : lines.horizontal)
            drawStyledLine(g, { 0.0f, static_cast<float>(y), width, static_cast<float>(y) }, guide.style);
    }

    void CanvasRenderer::paintItem(juce::Graphics& g,
                                   juce::Rectangle<int> bounds,
                                   const ItemTheme& theme,
                                   const std::optional<TitleBarLayout>& layout,
                                   const ItemPaintState& state) const
    {
        const auto area = bounds.toFloat().reduced(0.5f);
        const auto& insets = theme.insets;

        g.setColour(theme.fill);
        g.fillRoundedRectangle(area, theme.cornerSize);

        g.saveState();
        g.reduceClipRegion(bounds);
        g.setColour(theme.titleBar);
        if (insets.getTop() > 0)
            g.fillRect(bounds.withHeight(insets.getTop()));
        if (insets.getBottom() > 0 && !state.minimized)
            g.fillRect(bounds.withTop(bounds.getBottom() - insets.getBottom()));
        g.restoreState();

        g.setColour(theme.border);
        g.drawRoundedRectangle(area, theme.cornerSize, 1.0f);

        if (!layout.has_value())
            return;

        const auto title = state.title.trim();
        if (title.isNotEmpty() && !layout->title.isEmpty())
        {
            g.setColour(theme.text);
            g.setFont(titleFont());
            g.drawText(title, layout->title, juce::Justification::centredLeft, true);
        }

        for (const auto& placement : layout->buttons)
        {
            const auto pressed = state.pressedButton.has_value() && *state.pressedButton == placement.button;
            paintButtonGlyph(g,
                             placement.button,
                             placement.bounds.toFloat(),
                             state.minimized,
                             pressed ? theme.border : theme.text.withAlpha(0.85f));
        }
    }

    void CanvasRenderer::paintButtonGlyph(juce::Graphics& g,
                                          TitleBarButton button,
                                          juce::Rectangle<float> area,
                                          bool minimized,
                                          juce::Colour colour) const
    {
        const auto glyph = area.reduced(2.0f);
        juce::Path path;

        switch (button)
        {
            case TitleBarButton::close:
                path.startNewSubPath(glyph.getTopLeft());
                path.lineTo(glyph.getBottomRight());
                path.startNewSubPath(glyph.getTopRight());
                path.lineTo(glyph.getBottomLeft());
                break;

            case TitleBarButton::minimize:
                if (minimized)
                {
                    path.addRectangle(glyph);
                }
                else
                {
                    path.startNewSubPath(glyph.getBottomLeft());
                    path.lineTo(glyph.getBottomRight());
                }
                break;

            case TitleBarButton::drag:
                path.startNewSubPath(glyph.getCentreX(), glyph.getY());
                path.lineTo(glyph.getCentreX(), glyph.getBottom());
                path.startNewSubPath(glyph.getX(), glyph.getCentreY());
                path.lineTo(glyph.getRight(), glyph.getCentreY());
                break;

            case TitleBarButton::clone:
            {
                const auto half = glyph.getWidth() * 0.6f;
                path.addRectangle(glyph.getX(), glyph.getY(), half, half);
                path.addRectangle(glyph.getRight() - half, glyph.getBottom() - half, half, half);
                break;
            }
        }

        g.setColour(colour);
        g.strokePath(path, juce::PathStrokeType(1.4f));
    }

    void CanvasRenderer::drawStyledLine(juce::Graphics& g, juce::Line<float> line, LineStyle style) const
    {
        static constexpr float dashPattern[] { 6.0f, 4.0f };
        static constexpr float dotPattern[] { 1.0f, 3.0f };

        switch (style)
        {
            case LineStyle::dash:
                g.drawDashedLine(line, dashPattern, 2, 1.0f);
                return;
            case LineStyle::dot:
                g.drawDashedLine(line, dotPattern, 2, 1.0f);
                return;
            case LineStyle::solid:
                break;
        }

        g.drawLine(line, 1.0f);
    }
}
