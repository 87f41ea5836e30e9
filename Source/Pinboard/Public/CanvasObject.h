#pragma once

#include "Pinboard/Adapter/CanvasAttribute.h"
#include <JuceHeader.h>
#include <memory>
#include <optional>

namespace Pinboard
{
    // An application object shown as one item on a list canvas.
    class CanvasObject : public juce::ReferenceCountedObject
    {
    public:
        using Ptr = juce::ReferenceCountedObjectPtr<CanvasObject>;

        ~CanvasObject() override = default;

        // Most-derived type name, used for adapter handler lookup and default titles.
        virtual juce::String typeName() const = 0;

        // Type names from most-derived to least-derived. Defaults to just typeName().
        virtual juce::StringArray typeChain() const
        {
            return { typeName() };
        }

        // Creates the component that represents this object inside its canvas item.
        // viewName selects one of several views when the object offers more than one.
        virtual std::unique_ptr<juce::Component> createView(const juce::String& viewName) = 0;

        virtual juce::Rectangle<int> preferredViewSize() const
        {
            return { 0, 0, 200, 120 };
        }
    };

    // Implemented by objects that answer canvas attributes themselves instead of leaving it to the
    // adapter. Any attribute the object does not answer falls through to the adapter.
    class ListCanvasItemProvider
    {
    public:
        virtual ~ListCanvasItemProvider() = default;

        virtual std::optional<juce::var> canvasAttribute(CanvasAttribute attribute, const CanvasObject* drop)
        {
            juce::ignoreUnused(attribute, drop);
            return std::nullopt;
        }

        // Returns true when the notification has been handled.
        virtual bool canvasNotification(CanvasAttribute attribute)
        {
            juce::ignoreUnused(attribute);
            return false;
        }
    };

    inline juce::var objectToVar(const CanvasObject::Ptr& object)
    {
        return juce::var(object.get());
    }

    inline CanvasObject::Ptr objectFromVar(const juce::var& value)
    {
        return dynamic_cast<CanvasObject*>(value.getObject());
    }

    // "PersonRecord" -> "Person Record", "snap_info" -> "Snap Info".
    inline juce::String userNameFor(const juce::String& typeName)
    {
        juce::String result;
        juce::juce_wchar previous = 0;

        for (auto ptr = typeName.getCharPointer(); !ptr.isEmpty();)
        {
            auto c = ptr.getAndAdvance();
            if (c == '_')
            {
                if (result.isNotEmpty() && !result.endsWithChar(' '))
                    result << ' ';
                previous = c;
                continue;
            }

            const auto startsWord = result.isEmpty() || result.endsWithChar(' ');
            if (!startsWord && juce::CharacterFunctions::isUpperCase(c)
                && juce::CharacterFunctions::isLowerCase(previous))
            {
                result << ' ';
            }

            if (result.isEmpty() || result.endsWithChar(' '))
                c = juce::CharacterFunctions::toUpperCase(c);

            result << juce::String::charToString(c);
            previous = c;
        }

        return result.trim();
    }
}
