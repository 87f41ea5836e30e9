#pragma once

#include <JuceHeader.h>
#include "Pinboard/Pinboard.h"

//==============================================================================
/*
    Hosts a people-and-notes pinboard next to a panel editing the canvas settings.
*/
class MainComponent  : public juce::Component
{
public:
    //==============================================================================
    MainComponent();
    ~MainComponent() override;

    //==============================================================================
    void paint (juce::Graphics&) override;
    void resized() override;

private:
    //==============================================================================
    Pinboard::ListCanvasEditorSettings makeEditorSettings();
    bool attachDroppedNote(Pinboard::CanvasObject::Ptr target, Pinboard::CanvasObject::Ptr dropped);

    void restoreSession();
    void persistSession() const;
    static juce::File sessionDirectory();

    Pinboard::ThemeRegistry themes;
    Pinboard::CanvasObjectList objects;
    std::unique_ptr<Pinboard::ListCanvasEditor> pinboardEditor;
    Pinboard::Ui::Panels::CanvasSettingsPanel settingsPanel;
    juce::TooltipWindow tooltipWindow { this };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (MainComponent)
};
