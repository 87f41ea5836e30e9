#pragma once

#include <JuceHeader.h>

namespace Pinboard
{
    // Everything a list canvas asks an adapter about an item, plus the notifications it sends.
    enum class CanvasAttribute
    {
        themeActive,
        themeInactive,
        themeHover,
        title,
        uniqueId,
        canMove,
        canResize,
        canDrop,
        canDelete,
        canClose,
        canDrag,
        drag,
        canClone,
        clone,
        view,
        viewModel,
        size,
        position,
        tooltip,

        closed,
        activated,
        deactivated
    };

    inline bool isNotification(CanvasAttribute attribute) noexcept
    {
        return attribute == CanvasAttribute::closed
            || attribute == CanvasAttribute::activated
            || attribute == CanvasAttribute::deactivated;
    }

    inline juce::String canvasAttributeToKey(CanvasAttribute attribute)
    {
        switch (attribute)
        {
            case CanvasAttribute::themeActive: return "theme_active";
            case CanvasAttribute::themeInactive: return "theme_inactive";
            case CanvasAttribute::themeHover: return "theme_hover";
            case CanvasAttribute::title: return "title";
            case CanvasAttribute::uniqueId: return "unique_id";
            case CanvasAttribute::canMove: return "can_move";
            case CanvasAttribute::canResize: return "can_resize";
            case CanvasAttribute::canDrop: return "can_drop";
            case CanvasAttribute::canDelete: return "can_delete";
            case CanvasAttribute::canClose: return "can_close";
            case CanvasAttribute::canDrag: return "can_drag";
            case CanvasAttribute::drag: return "drag";
            case CanvasAttribute::canClone: return "can_clone";
            case CanvasAttribute::clone: return "clone";
            case CanvasAttribute::view: return "view";
            case CanvasAttribute::viewModel: return "view_model";
            case CanvasAttribute::size: return "size";
            case CanvasAttribute::position: return "position";
            case CanvasAttribute::tooltip: return "tooltip";
            case CanvasAttribute::closed: return "closed";
            case CanvasAttribute::activated: return "activated";
            case CanvasAttribute::deactivated: return "deactivated";
        }

        return {};
    }

    // Cache key fragment: notifications are "set_", everything else is "get_".
    inline juce::String handlerNameFor(CanvasAttribute attribute)
    {
        return (isNotification(attribute) ? "set_" : "get_") + canvasAttributeToKey(attribute);
    }

    inline juce::var pointToVar(juce::Point<float> point)
    {
        juce::Array<juce::var> pair;
        pair.add(point.x);
        pair.add(point.y);
        return juce::var(pair);
    }

    inline juce::Point<float> pointFromVar(const juce::var& value)
    {
        const auto* pair = value.getArray();
        if (pair == nullptr || pair->size() != 2)
            return {};

        return { static_cast<float>(static_cast<double>((*pair)[0])),
                 static_cast<float>(static_cast<double>((*pair)[1])) };
    }
}
