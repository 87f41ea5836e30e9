#include "Pinboard/Editor/Canvas/TitleBarLayout.h"

namespace Pinboard::Ui::Canvas
{
    namespace
    {
        int floorDiv(int value, int divisor) noexcept
        {
            const auto quotient = value / divisor;
            const auto remainder = value % divisor;
            return (remainder != 0 && ((remainder < 0) != (divisor < 0))) ? quotient - 1 : quotient;
        }
    }

    juce::String titleBarButtonToKey(TitleBarButton button)
    {
        switch (button)
        {
            case TitleBarButton::close: return "close";
            case TitleBarButton::minimize: return "minimize";
            case TitleBarButton::drag: return "drag";
            case TitleBarButton::clone: return "clone";
        }

        return {};
    }

    std::optional<juce::Rectangle<int>> TitleBarLayout::boundsOf(TitleBarButton button) const noexcept
    {
        for (const auto& placement : buttons)
        {
            if (placement.button == button)
                return placement.bounds;
        }

        return std::nullopt;
    }

    std::optional<TitleBarButton> TitleBarLayout::buttonAt(juce::Point<int> point) const noexcept
    {
        for (const auto& placement : buttons)
        {
            if (placement.bounds.contains(point))
                return placement.button;
        }

        return std::nullopt;
    }

    std::optional<TitleBarLayout> computeTitleBarLayout(const TitleBarRequest& request)
    {
        const auto textHeight = request.fontHeight + 4;
        const auto top = request.insets.getTop();
        const auto bottom = request.insets.getBottom();
        if (textHeight > top && textHeight > bottom)
            return std::nullopt;

        const auto ox = request.offset.x;
        const auto oy = request.offset.y;
        const auto w = request.itemSize.x;
        const auto h = request.itemSize.y;

        TitleBarLayout layout;
        int textY = 0;
        int anchorY = 0;
        if (textHeight <= top)
        {
            textY = oy + floorDiv(top - textHeight + 4, 2);
            anchorY = 2 * oy + top;
        }
        else
        {
            layout.onTop = false;
            textY = oy + h - floorDiv(bottom + textHeight + 4, 2);
            anchorY = 2 * (oy + h) - bottom;
        }

        const auto left = ox + request.insets.getLeft();
        auto right = ox + w - request.insets.getRight();

        const auto place = [&layout, &right, &request, anchorY](TitleBarButton button)
        {
            const auto x = right - request.buttonSize.x;
            layout.buttons.push_back({ button,
                                       { x,
                                         floorDiv(anchorY - request.buttonSize.y, 2),
                                         request.buttonSize.x,
                                         request.buttonSize.y } });
            right = x - 2;
        };

        if (request.showClose)
            place(TitleBarButton::close);
        if (request.showMinimize)
            place(TitleBarButton::minimize);
        if (request.showDrag)
            place(TitleBarButton::drag);
        if (request.showClone)
            place(TitleBarButton::clone);

        layout.title = { left, textY, right - left, textHeight - 4 };
        return layout;
    }
}
