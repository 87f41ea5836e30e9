#include "Demo/PeopleObjects.h"

namespace PinboardDemo
{
    namespace
    {
        juce::String newId()
        {
            return juce::Uuid().toDashedString();
        }

        void refreshOwningItem(juce::Component& view)
        {
            if (auto* item = view.findParentComponentOfClass<Pinboard::Ui::Canvas::ListCanvasItem>())
                item->refresh();
        }

        class PersonView : public juce::Component,
                           private juce::ChangeListener
        {
        public:
            explicit PersonView(Person::Ptr personIn)
                : person(std::move(personIn))
            {
                for (auto* editor : { &nameEditor, &emailEditor })
                {
                    editor->setColour(juce::TextEditor::backgroundColourId, juce::Colour::fromRGB(30, 35, 43));
                    editor->setColour(juce::TextEditor::outlineColourId, juce::Colour::fromRGB(56, 64, 78));
                    addAndMakeVisible(*editor);
                }

                nameEditor.setTextToShowWhenEmpty("Name", juce::Colours::grey);
                emailEditor.setTextToShowWhenEmpty("Email", juce::Colours::grey);
                nameEditor.setText(person->name(), false);
                emailEditor.setText(person->email(), false);

                nameEditor.onTextChange = [this]
                {
                    person->setName(nameEditor.getText());
                    refreshOwningItem(*this);
                };
                emailEditor.onTextChange = [this]
                {
                    person->setEmail(emailEditor.getText());
                    refreshOwningItem(*this);
                };

                notesLabel.setColour(juce::Label::textColourId, juce::Colour::fromRGB(150, 158, 172));
                addAndMakeVisible(notesLabel);
                updateNotes();
                person->addChangeListener(this);
            }

            ~PersonView() override
            {
                person->removeChangeListener(this);
            }

            void updateNotes()
            {
                const auto count = person->notes().size();
                notesLabel.setText(count == 0 ? juce::String("No notes")
                                              : juce::String(count) + (count == 1 ? " note" : " notes"),
                                   juce::dontSendNotification);
                notesLabel.setTooltip(person->notes().joinIntoString("\n"));
            }

            void paint(juce::Graphics& g) override
            {
                g.fillAll(juce::Colour::fromRGB(24, 28, 34));
            }

            void resized() override
            {
                auto area = getLocalBounds().reduced(6);
                nameEditor.setBounds(area.removeFromTop(24));
                area.removeFromTop(4);
                emailEditor.setBounds(area.removeFromTop(24));
                area.removeFromTop(4);
                notesLabel.setBounds(area.removeFromTop(20));
            }

        private:
            void changeListenerCallback(juce::ChangeBroadcaster*) override
            {
                updateNotes();
                refreshOwningItem(*this);
            }

            Person::Ptr person;
            juce::TextEditor nameEditor;
            juce::TextEditor emailEditor;
            juce::Label notesLabel;
        };

        class NoteView : public juce::Component
        {
        public:
            explicit NoteView(Note::Ptr noteIn)
                : note(std::move(noteIn))
            {
                editor.setMultiLine(true);
                editor.setReturnKeyStartsNewLine(true);
                editor.setColour(juce::TextEditor::backgroundColourId, juce::Colour::fromRGB(58, 52, 30));
                editor.setColour(juce::TextEditor::textColourId, juce::Colour::fromRGB(240, 228, 180));
                editor.setText(note->text(), false);
                editor.onTextChange = [this]
                {
                    note->setText(editor.getText());
                    refreshOwningItem(*this);
                };
                addAndMakeVisible(editor);
            }

            void resized() override
            {
                editor.setBounds(getLocalBounds());
            }

        private:
            Note::Ptr note;
            juce::TextEditor editor;
        };

        juce::String firstLineOf(const juce::String& text)
        {
            const auto line = text.upToFirstOccurrenceOf("\n", false, false).trim();
            return line.isNotEmpty() ? line : juce::String("Note");
        }
    }

    Person::Person(juce::String idIn, juce::String nameIn, juce::String emailIn)
        : uniqueId(std::move(idIn)),
          personName(std::move(nameIn)),
          personEmail(std::move(emailIn))
    {
    }

    std::unique_ptr<juce::Component> Person::createView(const juce::String&)
    {
        return std::make_unique<PersonView>(Person::Ptr(this));
    }

    std::optional<juce::var> Person::canvasAttribute(Pinboard::CanvasAttribute attribute,
                                                     const Pinboard::CanvasObject* drop)
    {
        using Pinboard::CanvasAttribute;

        switch (attribute)
        {
            case CanvasAttribute::title:
                return juce::var(personName.isNotEmpty() ? personName : juce::String("Unnamed"));
            case CanvasAttribute::uniqueId:
                return juce::var(uniqueId);
            case CanvasAttribute::tooltip:
                return juce::var(personEmail);
            case CanvasAttribute::canDelete:
            case CanvasAttribute::canDrag:
                return juce::var(true);
            case CanvasAttribute::canClose:
                return modified ? Pinboard::closeBehaviourToVar(Pinboard::CloseBehaviour::modified)
                                : Pinboard::closeBehaviourToVar(Pinboard::CloseBehaviour::allowed);
            case CanvasAttribute::canDrop:
                return juce::var(dynamic_cast<const Note*>(drop) != nullptr);
            case CanvasAttribute::clone:
            {
                Person::Ptr copy = new Person(newId(), personName + " (copy)", personEmail);
                return Pinboard::objectToVar(copy);
            }
            default:
                return std::nullopt;
        }
    }

    void Person::setName(const juce::String& nameIn)
    {
        personName = nameIn;
        modified = true;
    }

    void Person::setEmail(const juce::String& emailIn)
    {
        personEmail = emailIn;
        modified = true;
    }

    void Person::attachNote(const juce::String& text)
    {
        attachedNotes.add(text);
        modified = true;
        sendChangeMessage();
    }

    Note::Note(juce::String idIn, juce::String textIn)
        : uniqueId(std::move(idIn)),
          noteText(std::move(textIn))
    {
    }

    std::unique_ptr<juce::Component> Note::createView(const juce::String&)
    {
        return std::make_unique<NoteView>(Note::Ptr(this));
    }

    std::shared_ptr<Pinboard::ListCanvasSubAdapter> makeNoteSubAdapter()
    {
        using Pinboard::AdapterContext;
        using Pinboard::CanvasAttribute;

        auto adapter = std::make_shared<Pinboard::LambdaSubAdapter>();
        adapter->forTypes({ "Note" })
            .on(CanvasAttribute::title, [](const AdapterContext& context)
                {
                    return juce::var(firstLineOf(static_cast<Note*>(context.item)->text()));
                })
            .on(CanvasAttribute::uniqueId, [](const AdapterContext& context)
                {
                    return juce::var(static_cast<Note*>(context.item)->id());
                })
            .on(CanvasAttribute::tooltip, [](const AdapterContext& context)
                {
                    return juce::var(static_cast<Note*>(context.item)->text());
                })
            .on(CanvasAttribute::canDelete, [](const AdapterContext&) { return juce::var(true); })
            .on(CanvasAttribute::canDrag, [](const AdapterContext&) { return juce::var(true); })
            .on(CanvasAttribute::themeActive, [](const AdapterContext&) { return juce::var("note_active"); })
            .on(CanvasAttribute::themeInactive, [](const AdapterContext&) { return juce::var("note_inactive"); })
            .on(CanvasAttribute::clone, [](const AdapterContext& context)
                {
                    Note::Ptr copy = new Note(newId(), static_cast<Note*>(context.item)->text());
                    return Pinboard::objectToVar(copy);
                });
        return adapter;
    }

    Pinboard::CanvasObjects makeSampleObjects()
    {
        return {
            new Person("person-ada", "Ada Lovelace", "ada@example.org"),
            new Person("person-alan", "Alan Turing", "alan@example.org"),
            new Note("note-welcome", "Welcome\nDrag notes onto people to attach them."),
            new Person("person-grace", "Grace Hopper", "grace@example.org")
        };
    }
}
