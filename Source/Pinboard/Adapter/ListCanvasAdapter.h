#pragma once

#include "Pinboard/Adapter/CanvasAttribute.h"
#include "Pinboard/Adapter/ListCanvasSubAdapter.h"
#include "Pinboard/Public/CanvasObject.h"
#include "Pinboard/Public/Types.h"
#include <JuceHeader.h>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace Pinboard
{
    inline juce::var closeBehaviourToVar(CloseBehaviour behaviour)
    {
        switch (behaviour)
        {
            case CloseBehaviour::allowed: return true;
            case CloseBehaviour::denied: return false;
            case CloseBehaviour::modified: return "modified";
        }

        return true;
    }

    // Booleans and numbers map to allowed/denied. Void, "modified" and unknown text count as modified.
    inline CloseBehaviour closeBehaviourFromVar(const juce::var& value)
    {
        if (value.isBool() || value.isInt() || value.isInt64() || value.isDouble())
            return static_cast<bool>(value) ? CloseBehaviour::allowed : CloseBehaviour::denied;

        if (value.isString())
        {
            const auto key = value.toString().trim();
            if (key == "allowed")
                return CloseBehaviour::allowed;
            if (key == "denied")
                return CloseBehaviour::denied;
        }

        return CloseBehaviour::modified;
    }

    /*
        Supplies per-item behaviour to a list canvas.

        Every query is resolved in this order:
          1. the item itself, when it implements ListCanvasItemProvider and answers the attribute;
          2. a cached handler for (item type, attribute);
          3. the first sub-adapter that accepts the item and supports the attribute;
          4. a handler registered for one of the item's types (most-derived first);
          5. genericValue() / genericNotification().
        Handlers found in steps 3 (cacheable sub-adapters only), 4 and 5 are cached per item type.
    */
    class ListCanvasAdapter
    {
    public:
        using Handler = std::function<juce::var(const AdapterContext&)>;

        struct Defaults
        {
            juce::String themeActive { "default_active" };
            juce::String themeInactive { "default_inactive" };
            juce::String themeHover { "default_hover" };
            juce::String title;
            juce::String uniqueId;
            bool canMove = true;
            bool canResize = true;
            bool canDrop = false;
            bool canDelete = false;
            CloseBehaviour canClose = CloseBehaviour::allowed;
            bool canDrag = false;
            bool canClone = true;
            juce::String view;
            juce::Point<float> size;
            juce::Point<float> position;
            juce::String tooltip;
        };

        static constexpr const char* kCanvasTypeName = "<canvas>";

        ListCanvasAdapter() = default;
        virtual ~ListCanvasAdapter() = default;

        ListCanvasAdapter(const ListCanvasAdapter&) = delete;
        ListCanvasAdapter& operator=(const ListCanvasAdapter&) = delete;

        Defaults& defaults() noexcept { return defaultValues; }
        const Defaults& defaults() const noexcept { return defaultValues; }

        void setSubAdapters(std::vector<std::shared_ptr<ListCanvasSubAdapter>> adapters);
        void addSubAdapter(std::shared_ptr<ListCanvasSubAdapter> adapter);
        const std::vector<std::shared_ptr<ListCanvasSubAdapter>>& subAdapters() const noexcept;

        // Registers a handler used for items whose type chain contains typeName.
        void registerTypeHandler(const juce::String& typeName, CanvasAttribute attribute, Handler handler);

        void flushCache() noexcept;
        int cachedHandlerCount() const noexcept;

        juce::String getThemeActive(CanvasObject& item);
        juce::String getThemeInactive(CanvasObject& item);
        juce::String getThemeHover(CanvasObject& item);
        juce::String getThemeFor(CanvasObject& item, ItemState state);
        juce::String getTitle(CanvasObject& item);
        juce::String getUniqueId(CanvasObject& item);
        bool getCanMove(CanvasObject& item);
        bool getCanResize(CanvasObject& item);
        bool getCanDrop(CanvasObject* item, CanvasObject* drop);
        bool getCanDelete(CanvasObject& item);
        CloseBehaviour getCanClose(CanvasObject& item);
        bool getCanDrag(CanvasObject& item);
        CanvasObject::Ptr getDrag(CanvasObject& item);
        bool getCanClone(CanvasObject& item);
        CanvasObject::Ptr getClone(CanvasObject& item);
        juce::String getView(CanvasObject& item);
        CanvasObject::Ptr getViewModel(CanvasObject& item);
        juce::Point<float> getSize(CanvasObject& item);
        juce::Point<float> getPosition(CanvasObject& item);
        juce::String getTooltip(CanvasObject& item);

        void setClosed(CanvasObject& item);
        void setActivated(CanvasObject& item);
        void setDeactivated(CanvasObject& item);

        // Raw lookup, exposed for attributes that have no typed getter in a subclass.
        juce::var resultFor(CanvasAttribute attribute, CanvasObject* item, CanvasObject* drop = nullptr);

        // Text for the canvas status line.
        void setStatus(const juce::String& text);
        const juce::String& status() const noexcept;
        // One callback at a time; the latest owner replaces the previous one.
        void setStatusChangedCallback(std::function<void(const juce::String&)> callback, const void* owner = nullptr);
        // Removes the callback only if owner installed it.
        void clearStatusChangedCallback(const void* owner);

        // Invoked by the base genericNotification() for closed/activated/deactivated.
        void setNotificationCallback(std::function<void(CanvasAttribute, CanvasObject*)> callback);

    protected:
        virtual juce::var genericValue(CanvasAttribute attribute, const AdapterContext& context);
        virtual void genericNotification(CanvasAttribute attribute, const AdapterContext& context);

    private:
        Handler findTypeHandler(const CanvasObject& item, CanvasAttribute attribute) const;
        Handler makeGenericHandler(CanvasAttribute attribute);

        Defaults defaultValues;
        std::vector<std::shared_ptr<ListCanvasSubAdapter>> delegates;
        std::map<juce::String, Handler> typeHandlers;
        std::map<juce::String, Handler> cache;
        juce::String statusText;
        std::function<void(const juce::String&)> onStatusChanged;
        const void* statusCallbackOwner = nullptr;
        std::function<void(CanvasAttribute, CanvasObject*)> onNotification;
    };
}
