#pragma once

#include "Pinboard/Public/CanvasObject.h"
#include <JuceHeader.h>
#include <functional>
#include <map>

namespace Pinboard
{
    struct AdapterContext
    {
        // nullptr means the canvas itself (only used for canDrop).
        CanvasObject* item = nullptr;
        CanvasObject* drop = nullptr;
    };

    // A delegate a ListCanvasAdapter consults before its own handlers.
    class ListCanvasSubAdapter
    {
    public:
        virtual ~ListCanvasSubAdapter() = default;

        // Whether this sub-adapter knows how to handle the item in the context.
        virtual bool accepts(const AdapterContext& context) const
        {
            juce::ignoreUnused(context);
            return true;
        }

        // True when accepts() depends only on the type of the item, so the chosen handler can be
        // cached per type.
        virtual bool isCacheable() const { return true; }

        virtual bool supports(CanvasAttribute attribute) const = 0;
        virtual juce::var get(CanvasAttribute attribute, const AdapterContext& context) = 0;
        virtual void notify(CanvasAttribute attribute, const AdapterContext& context)
        {
            juce::ignoreUnused(attribute, context);
        }
    };

    // Sub-adapter built from per-attribute callbacks, optionally restricted to item types.
    class LambdaSubAdapter : public ListCanvasSubAdapter
    {
    public:
        using Getter = std::function<juce::var(const AdapterContext&)>;
        using Notifier = std::function<void(const AdapterContext&)>;

        LambdaSubAdapter& forTypes(juce::StringArray typeNamesIn)
        {
            typeNames = std::move(typeNamesIn);
            return *this;
        }

        LambdaSubAdapter& cacheable(bool shouldCache)
        {
            cacheableFlag = shouldCache;
            return *this;
        }

        LambdaSubAdapter& acceptWhen(std::function<bool(const AdapterContext&)> predicate)
        {
            acceptPredicate = std::move(predicate);
            return *this;
        }

        LambdaSubAdapter& on(CanvasAttribute attribute, Getter getter)
        {
            getters[attribute] = std::move(getter);
            return *this;
        }

        LambdaSubAdapter& onNotify(CanvasAttribute attribute, Notifier notifier)
        {
            notifiers[attribute] = std::move(notifier);
            return *this;
        }

        bool accepts(const AdapterContext& context) const override
        {
            if (acceptPredicate != nullptr && !acceptPredicate(context))
                return false;

            if (typeNames.isEmpty())
                return true;

            if (context.item == nullptr)
                return false;

            for (const auto& name : context.item->typeChain())
            {
                if (typeNames.contains(name))
                    return true;
            }

            return false;
        }

        bool isCacheable() const override { return cacheableFlag; }

        bool supports(CanvasAttribute attribute) const override
        {
            return getters.count(attribute) > 0 || notifiers.count(attribute) > 0;
        }

        juce::var get(CanvasAttribute attribute, const AdapterContext& context) override
        {
            const auto it = getters.find(attribute);
            return it == getters.end() ? juce::var() : it->second(context);
        }

        void notify(CanvasAttribute attribute, const AdapterContext& context) override
        {
            if (const auto it = notifiers.find(attribute); it != notifiers.end())
                it->second(context);
        }

    private:
        juce::StringArray typeNames;
        bool cacheableFlag = true;
        std::function<bool(const AdapterContext&)> acceptPredicate;
        std::map<CanvasAttribute, Getter> getters;
        std::map<CanvasAttribute, Notifier> notifiers;
    };
}
