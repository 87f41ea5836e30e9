#include "MainComponent.h"
#include "Demo/PeopleObjects.h"

namespace
{
    constexpr int kSettingsPanelWidth = 280;

    Pinboard::ItemTheme makeNoteTheme (const char* name, juce::Colour titleBar, juce::Colour border)
    {
        Pinboard::ItemTheme theme;
        theme.name = name;
        theme.fill = juce::Colour::fromRGB (58, 52, 30);
        theme.titleBar = titleBar;
        theme.border = border;
        theme.text = juce::Colour::fromRGB (250, 240, 200);
        theme.insets = { 20, 4, 4, 4 };
        theme.offset = { 0, 2 };
        return theme;
    }
}

//==============================================================================
MainComponent::MainComponent()
{
    themes.registerTheme (makeNoteTheme ("note_active", juce::Colour::fromRGB (150, 120, 30), juce::Colour::fromRGB (230, 190, 70)));
    themes.registerTheme (makeNoteTheme ("note_inactive", juce::Colour::fromRGB (96, 84, 40), juce::Colour::fromRGB (130, 116, 60)));

    objects.setAll (PinboardDemo::makeSampleObjects());

    pinboardEditor = Pinboard::createEditor (makeEditorSettings(), objects);
    pinboardEditor->setDropOnItemHandler ([this] (Pinboard::CanvasObject::Ptr target, Pinboard::CanvasObject::Ptr dropped)
                                          {
                                              return attachDroppedNote (std::move (target), std::move (dropped));
                                          });
    addAndMakeVisible (*pinboardEditor);

    settingsPanel.setSettings (pinboardEditor->canvas().settings());
    settingsPanel.setSettingsChangedCallback ([this] (const Pinboard::CanvasSettings& settings)
                                              {
                                                  pinboardEditor->canvas().setSettings (settings);
                                              });
    addAndMakeVisible (settingsPanel);

    setSize (1100, 720);
    restoreSession();
}

MainComponent::~MainComponent()
{
    persistSession();
    pinboardEditor = nullptr;
}

//==============================================================================
void MainComponent::paint (juce::Graphics& g)
{
    g.fillAll (getLookAndFeel().findColour (juce::ResizableWindow::backgroundColourId));
}

void MainComponent::resized()
{
    auto area = getLocalBounds();
    settingsPanel.setBounds (area.removeFromRight (kSettingsPanelWidth));

    if (pinboardEditor != nullptr)
        pinboardEditor->setBounds (area);
}

Pinboard::ListCanvasEditorSettings MainComponent::makeEditorSettings()
{
    auto adapter = std::make_shared<Pinboard::ListCanvasAdapter>();
    adapter->addSubAdapter (PinboardDemo::makeNoteSubAdapter());
    adapter->defaults().canDelete = true;

    Pinboard::ListCanvasEditorSettings settings;
    settings.adapter = adapter;
    settings.themes = &themes;
    settings.canvas.grid.visible = Pinboard::VisibilityMode::drag;
    settings.canvas.guide.visible = Pinboard::VisibilityMode::drag;
    settings.scrollable = true;
    settings.addTypes = {
        { "Person", [] { return Pinboard::CanvasObject::Ptr (new PinboardDemo::Person (juce::Uuid().toDashedString(), {}, {})); } },
        { "Note", [] { return Pinboard::CanvasObject::Ptr (new PinboardDemo::Note (juce::Uuid().toDashedString(), "New note")); } }
    };
    return settings;
}

bool MainComponent::attachDroppedNote (Pinboard::CanvasObject::Ptr target, Pinboard::CanvasObject::Ptr dropped)
{
    auto* person = dynamic_cast<PinboardDemo::Person*> (target.get());
    auto* note = dynamic_cast<PinboardDemo::Note*> (dropped.get());
    if (person == nullptr || note == nullptr)
        return false;

    person->attachNote (note->text());
    pinboardEditor->adapter().setStatus ("Attached a note to " + person->name() + ".");
    return true;
}

juce::File MainComponent::sessionDirectory()
{
    auto dir = juce::File::getSpecialLocation (juce::File::userApplicationDataDirectory)
                   .getChildFile ("Pinboard");
    if (! dir.exists())
    {
        const auto result = dir.createDirectory();
        if (result.failed())
            DBG ("[Pinboard] Session directory unavailable: " + result.getErrorMessage());
    }

    return dir;
}

void MainComponent::restoreSession()
{
    const auto dir = sessionDirectory();

    const auto settingsFile = dir.getChildFile ("settings.json");
    if (settingsFile.existsAsFile())
    {
        auto settings = pinboardEditor->canvas().settings();
        const auto result = Pinboard::Serialization::loadSettingsFromFile (settingsFile, settings);
        if (result.failed())
        {
            DBG ("[Pinboard] Settings restore failed: " + result.getErrorMessage());
        }
        else
        {
            pinboardEditor->canvas().setSettings (settings);
            settingsPanel.setSettings (settings);
        }
    }

    const auto layoutFile = dir.getChildFile ("layout.json");
    if (layoutFile.existsAsFile())
    {
        Pinboard::Serialization::CanvasLayout layout;
        const auto result = Pinboard::Serialization::loadLayoutFromFile (layoutFile, layout);
        if (result.failed())
            DBG ("[Pinboard] Layout restore failed: " + result.getErrorMessage());
        else
            pinboardEditor->canvas().applyLayout (layout);
    }
}

void MainComponent::persistSession() const
{
    if (pinboardEditor == nullptr)
        return;

    const auto dir = sessionDirectory();

    const auto settingsResult = Pinboard::Serialization::saveSettingsToFile (dir.getChildFile ("settings.json"),
                                                                            pinboardEditor->canvas().settings());
    if (settingsResult.failed())
        DBG ("[Pinboard] Settings save failed: " + settingsResult.getErrorMessage());

    const auto layoutResult = Pinboard::Serialization::saveLayoutToFile (dir.getChildFile ("layout.json"),
                                                                        pinboardEditor->canvas().captureLayout());
    if (layoutResult.failed())
        DBG ("[Pinboard] Layout save failed: " + layoutResult.getErrorMessage());
}
