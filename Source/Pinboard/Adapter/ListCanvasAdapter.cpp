#include "Pinboard/Adapter/ListCanvasAdapter.h"

namespace Pinboard
{
    namespace
    {
        juce::String typeHandlerKey(const juce::String& typeName, CanvasAttribute attribute)
        {
            return typeName + "_" + canvasAttributeToKey(attribute);
        }
    }

    void ListCanvasAdapter::setSubAdapters(std::vector<std::shared_ptr<ListCanvasSubAdapter>> adapters)
    {
        delegates = std::move(adapters);
        flushCache();
    }

    void ListCanvasAdapter::addSubAdapter(std::shared_ptr<ListCanvasSubAdapter> adapter)
    {
        if (adapter == nullptr)
            return;

        delegates.push_back(std::move(adapter));
        flushCache();
    }

    const std::vector<std::shared_ptr<ListCanvasSubAdapter>>& ListCanvasAdapter::subAdapters() const noexcept
    {
        return delegates;
    }

    void ListCanvasAdapter::registerTypeHandler(const juce::String& typeName,
                                                CanvasAttribute attribute,
                                                Handler handler)
    {
        if (typeName.isEmpty() || handler == nullptr)
        {
            DBG("[Pinboard][Adapter] ignoring type handler without type name or callback");
            return;
        }

        typeHandlers[typeHandlerKey(typeName, attribute)] = std::move(handler);
        flushCache();
    }

    void ListCanvasAdapter::flushCache() noexcept
    {
        cache.clear();
    }

    int ListCanvasAdapter::cachedHandlerCount() const noexcept
    {
        return static_cast<int>(cache.size());
    }

    juce::var ListCanvasAdapter::resultFor(CanvasAttribute attribute, CanvasObject* item, CanvasObject* drop)
    {
        const auto notification = isNotification(attribute);

        if (auto* provider = dynamic_cast<ListCanvasItemProvider*>(item))
        {
            if (notification)
            {
                if (provider->canvasNotification(attribute))
                    return {};
            }
            else if (auto answer = provider->canvasAttribute(attribute, drop))
            {
                return *answer;
            }
        }

        const AdapterContext context { item, drop };
        const auto typeName = item != nullptr ? item->typeName() : juce::String(kCanvasTypeName);
        const auto key = typeName + ":" + handlerNameFor(attribute);

        if (const auto cached = cache.find(key); cached != cache.end())
            return cached->second(context);

        Handler handler;
        for (const auto& delegate : delegates)
        {
            if (!delegate->accepts(context) || !delegate->supports(attribute))
                continue;

            handler = [delegate, attribute, notification](const AdapterContext& current) -> juce::var
            {
                if (notification)
                {
                    delegate->notify(attribute, current);
                    return {};
                }

                return delegate->get(attribute, current);
            };

            if (delegate->isCacheable())
                break;

            return handler(context);
        }

        if (handler == nullptr && item != nullptr)
            handler = findTypeHandler(*item, attribute);

        if (handler == nullptr)
            handler = makeGenericHandler(attribute);

        cache[key] = handler;
        return handler(context);
    }

    ListCanvasAdapter::Handler ListCanvasAdapter::findTypeHandler(const CanvasObject& item,
                                                                  CanvasAttribute attribute) const
    {
        for (const auto& typeName : item.typeChain())
        {
            if (const auto it = typeHandlers.find(typeHandlerKey(typeName, attribute)); it != typeHandlers.end())
                return it->second;
        }

        return {};
    }

    ListCanvasAdapter::Handler ListCanvasAdapter::makeGenericHandler(CanvasAttribute attribute)
    {
        if (isNotification(attribute))
        {
            return [this, attribute](const AdapterContext& context) -> juce::var
            {
                genericNotification(attribute, context);
                return {};
            };
        }

        return [this, attribute](const AdapterContext& context)
        {
            return genericValue(attribute, context);
        };
    }

    juce::var ListCanvasAdapter::genericValue(CanvasAttribute attribute, const AdapterContext& context)
    {
        juce::ignoreUnused(context);
        const auto& d = defaultValues;

        switch (attribute)
        {
            case CanvasAttribute::themeActive: return d.themeActive;
            case CanvasAttribute::themeInactive: return d.themeInactive;
            case CanvasAttribute::themeHover: return d.themeHover;
            case CanvasAttribute::title: return d.title;
            case CanvasAttribute::uniqueId: return d.uniqueId;
            case CanvasAttribute::canMove: return d.canMove;
            case CanvasAttribute::canResize: return d.canResize;
            case CanvasAttribute::canDrop: return d.canDrop;
            case CanvasAttribute::canDelete: return d.canDelete;
            case CanvasAttribute::canClose: return closeBehaviourToVar(d.canClose);
            case CanvasAttribute::canDrag: return d.canDrag;
            case CanvasAttribute::canClone: return d.canClone;
            case CanvasAttribute::view: return d.view;
            case CanvasAttribute::size: return pointToVar(d.size);
            case CanvasAttribute::position: return pointToVar(d.position);
            case CanvasAttribute::tooltip: return d.tooltip;
            case CanvasAttribute::drag:
            case CanvasAttribute::clone:
            case CanvasAttribute::viewModel:
            case CanvasAttribute::closed:
            case CanvasAttribute::activated:
            case CanvasAttribute::deactivated:
                break;
        }

        return {};
    }

    void ListCanvasAdapter::genericNotification(CanvasAttribute attribute, const AdapterContext& context)
    {
        if (onNotification != nullptr)
            onNotification(attribute, context.item);
    }

    juce::String ListCanvasAdapter::getThemeActive(CanvasObject& item)
    {
        return resultFor(CanvasAttribute::themeActive, &item).toString();
    }

    juce::String ListCanvasAdapter::getThemeInactive(CanvasObject& item)
    {
        const auto inactive = resultFor(CanvasAttribute::themeInactive, &item).toString();
        return inactive.isNotEmpty() ? inactive : getThemeActive(item);
    }

    juce::String ListCanvasAdapter::getThemeHover(CanvasObject& item)
    {
        const auto hover = resultFor(CanvasAttribute::themeHover, &item).toString();
        return hover.isNotEmpty() ? hover : getThemeInactive(item);
    }

    juce::String ListCanvasAdapter::getThemeFor(CanvasObject& item, ItemState state)
    {
        switch (state)
        {
            case ItemState::active: return getThemeActive(item);
            case ItemState::hover: return getThemeHover(item);
            case ItemState::inactive: return getThemeInactive(item);
        }

        return getThemeInactive(item);
    }

    juce::String ListCanvasAdapter::getTitle(CanvasObject& item)
    {
        return resultFor(CanvasAttribute::title, &item).toString();
    }

    juce::String ListCanvasAdapter::getUniqueId(CanvasObject& item)
    {
        return resultFor(CanvasAttribute::uniqueId, &item).toString();
    }

    bool ListCanvasAdapter::getCanMove(CanvasObject& item)
    {
        return static_cast<bool>(resultFor(CanvasAttribute::canMove, &item));
    }

    bool ListCanvasAdapter::getCanResize(CanvasObject& item)
    {
        return static_cast<bool>(resultFor(CanvasAttribute::canResize, &item));
    }

    bool ListCanvasAdapter::getCanDrop(CanvasObject* item, CanvasObject* drop)
    {
        return static_cast<bool>(resultFor(CanvasAttribute::canDrop, item, drop));
    }

    bool ListCanvasAdapter::getCanDelete(CanvasObject& item)
    {
        return static_cast<bool>(resultFor(CanvasAttribute::canDelete, &item));
    }

    CloseBehaviour ListCanvasAdapter::getCanClose(CanvasObject& item)
    {
        return closeBehaviourFromVar(resultFor(CanvasAttribute::canClose, &item));
    }

    bool ListCanvasAdapter::getCanDrag(CanvasObject& item)
    {
        return static_cast<bool>(resultFor(CanvasAttribute::canDrag, &item));
    }

    CanvasObject::Ptr ListCanvasAdapter::getDrag(CanvasObject& item)
    {
        return objectFromVar(resultFor(CanvasAttribute::drag, &item));
    }

    bool ListCanvasAdapter::getCanClone(CanvasObject& item)
    {
        return static_cast<bool>(resultFor(CanvasAttribute::canClone, &item));
    }

    CanvasObject::Ptr ListCanvasAdapter::getClone(CanvasObject& item)
    {
        return objectFromVar(resultFor(CanvasAttribute::clone, &item));
    }

    juce::String ListCanvasAdapter::getView(CanvasObject& item)
    {
        return resultFor(CanvasAttribute::view, &item).toString();
    }

    CanvasObject::Ptr ListCanvasAdapter::getViewModel(CanvasObject& item)
    {
        return objectFromVar(resultFor(CanvasAttribute::viewModel, &item));
    }

    juce::Point<float> ListCanvasAdapter::getSize(CanvasObject& item)
    {
        return pointFromVar(resultFor(CanvasAttribute::size, &item));
    }

    juce::Point<float> ListCanvasAdapter::getPosition(CanvasObject& item)
    {
        return pointFromVar(resultFor(CanvasAttribute::position, &item));
    }

    juce::String ListCanvasAdapter::getTooltip(CanvasObject& item)
    {
        return resultFor(CanvasAttribute::tooltip, &item).toString();
    }

    void ListCanvasAdapter::setClosed(CanvasObject& item)
    {
        resultFor(CanvasAttribute::closed, &item);
    }

    void ListCanvasAdapter::setActivated(CanvasObject& item)
    {
        resultFor(CanvasAttribute::activated, &item);
    }

    void ListCanvasAdapter::setDeactivated(CanvasObject& item)
    {
        resultFor(CanvasAttribute::deactivated, &item);
    }

    void ListCanvasAdapter::setStatus(const juce::String& text)
    {
        if (statusText == text)
            return;

        statusText = text;
        if (onStatusChanged != nullptr)
            onStatusChanged(statusText);
    }

    const juce::String& ListCanvasAdapter::status() const noexcept
    {
        return statusText;
    }

    void ListCanvasAdapter::setStatusChangedCallback(std::function<void(const juce::String&)> callback, const void* owner)
    {
        onStatusChanged = std::move(callback);
        statusCallbackOwner = onStatusChanged != nullptr ? owner : nullptr;
    }

    void ListCanvasAdapter::clearStatusChangedCallback(const void* owner)
    {
        if (statusCallbackOwner != owner)
            return;

        onStatusChanged = nullptr;
        statusCallbackOwner = nullptr;
    }

    void ListCanvasAdapter::setNotificationCallback(std::function<void(CanvasAttribute, CanvasObject*)> callback)
    {
        onNotification = std::move(callback);
    }
}
