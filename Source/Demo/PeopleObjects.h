#pragma once

#include "Pinboard/Pinboard.h"
#include <JuceHeader.h>
#include <memory>

namespace PinboardDemo
{
    class Person : public Pinboard::CanvasObject,
                   public Pinboard::ListCanvasItemProvider,
                   public juce::ChangeBroadcaster
    {
    public:
        using Ptr = juce::ReferenceCountedObjectPtr<Person>;

        Person(juce::String idIn, juce::String nameIn, juce::String emailIn);

        juce::String typeName() const override { return "Person"; }
        std::unique_ptr<juce::Component> createView(const juce::String& viewName) override;
        juce::Rectangle<int> preferredViewSize() const override { return { 0, 0, 220, 96 }; }

        std::optional<juce::var> canvasAttribute(Pinboard::CanvasAttribute attribute,
                                                 const Pinboard::CanvasObject* drop) override;

        const juce::String& id() const noexcept { return uniqueId; }
        const juce::String& name() const noexcept { return personName; }
        const juce::String& email() const noexcept { return personEmail; }
        const juce::StringArray& notes() const noexcept { return attachedNotes; }
        bool isModified() const noexcept { return modified; }

        void setName(const juce::String& nameIn);
        void setEmail(const juce::String& emailIn);
        void attachNote(const juce::String& text);

    private:
        juce::String uniqueId;
        juce::String personName;
        juce::String personEmail;
        juce::StringArray attachedNotes;
        bool modified = false;
    };

    class Note : public Pinboard::CanvasObject
    {
    public:
        using Ptr = juce::ReferenceCountedObjectPtr<Note>;

        Note(juce::String idIn, juce::String textIn);

        juce::String typeName() const override { return "Note"; }
        std::unique_ptr<juce::Component> createView(const juce::String& viewName) override;

        const juce::String& id() const noexcept { return uniqueId; }
        const juce::String& text() const noexcept { return noteText; }
        void setText(const juce::String& textIn) { noteText = textIn; }

    private:
        juce::String uniqueId;
        juce::String noteText;
    };

    // Adapter rules for notes: titled by their first line, draggable onto people.
    std::shared_ptr<Pinboard::ListCanvasSubAdapter> makeNoteSubAdapter();

    // A few people and notes to start from.
    Pinboard::CanvasObjects makeSampleObjects();
}
