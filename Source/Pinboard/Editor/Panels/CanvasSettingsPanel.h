#pragma once

#include "Pinboard/Public/Types.h"
#include <JuceHeader.h>
#include <functional>

namespace Pinboard::Ui::Panels
{
    // Edits the snap, grid and guide settings of a canvas.
    class CanvasSettingsPanel : public juce::Component
    {
    public:
        CanvasSettingsPanel();

        void setSettings(const CanvasSettings& settingsIn);
        const CanvasSettings& settings() const noexcept;

        void setSettingsChangedCallback(std::function<void(const CanvasSettings&)> callback);

        void paint(juce::Graphics& g) override;
        void resized() override;

    private:
        void syncUiFromSettings();
        void applySettingsFromUi();
        void notifySettingsChanged() const;

        CanvasSettings canvasSettings;
        std::function<void(const CanvasSettings&)> onSettingsChanged;

        juce::Label snapLabel;
        juce::Slider snapDistanceSlider;

        juce::Label gridLabel;
        juce::ComboBox gridVisibleBox;
        juce::ComboBox gridStyleBox;
        juce::ToggleButton gridSnapToggle { "Snap to grid" };
        juce::Label gridSizeLabel;
        juce::Slider gridSizeSlider;
        juce::Label gridOffsetLabel;
        juce::Slider gridOffsetSlider;

        juce::Label guideLabel;
        juce::ComboBox guideVisibleBox;
        juce::ComboBox guideStyleBox;
        juce::ToggleButton guideSnapToggle { "Snap to guides" };
    };
}
