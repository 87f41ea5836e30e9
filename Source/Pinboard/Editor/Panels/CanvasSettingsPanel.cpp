#include "Pinboard/Editor/Panels/CanvasSettingsPanel.h"

namespace Pinboard::Ui::Panels
{
    namespace
    {
        // ComboBox ids are enum ordinals + 1.
        int comboIdFor(VisibilityMode mode) noexcept { return static_cast<int>(mode) + 1; }
        int comboIdFor(LineStyle style) noexcept { return static_cast<int>(style) + 1; }

        VisibilityMode visibilityFromCombo(const juce::ComboBox& box) noexcept
        {
            return static_cast<VisibilityMode>(juce::jlimit(0, 2, box.getSelectedId() - 1));
        }

        LineStyle lineStyleFromCombo(const juce::ComboBox& box) noexcept
        {
            return static_cast<LineStyle>(juce::jlimit(0, 2, box.getSelectedId() - 1));
        }

        void configureVisibilityBox(juce::ComboBox& box)
        {
            box.addItem("Never", comboIdFor(VisibilityMode::never));
            box.addItem("Always", comboIdFor(VisibilityMode::always));
            box.addItem("While dragging", comboIdFor(VisibilityMode::drag));
        }

        void configureStyleBox(juce::ComboBox& box)
        {
            box.addItem("Solid", comboIdFor(LineStyle::solid));
            box.addItem("Dash", comboIdFor(LineStyle::dash));
            box.addItem("Dot", comboIdFor(LineStyle::dot));
        }
    }

    CanvasSettingsPanel::CanvasSettingsPanel()
    {
        for (auto* component : std::initializer_list<juce::Component*> {
                 &snapLabel, &snapDistanceSlider,
                 &gridLabel, &gridVisibleBox, &gridStyleBox, &gridSnapToggle,
                 &gridSizeLabel, &gridSizeSlider, &gridOffsetLabel, &gridOffsetSlider,
                 &guideLabel, &guideVisibleBox, &guideStyleBox, &guideSnapToggle })
        {
            addAndMakeVisible(*component);
        }

        for (auto* label : { &snapLabel, &gridLabel, &gridSizeLabel, &gridOffsetLabel, &guideLabel })
        {
            label->setColour(juce::Label::textColourId, juce::Colour::fromRGB(178, 186, 200));
            label->setJustificationType(juce::Justification::centredLeft);
        }

        snapLabel.setText("Snap", juce::dontSendNotification);
        gridLabel.setText("Grid", juce::dontSendNotification);
        gridSizeLabel.setText("Size", juce::dontSendNotification);
        gridOffsetLabel.setText("Offset", juce::dontSendNotification);
        guideLabel.setText("Guides", juce::dontSendNotification);

        snapDistanceSlider.setTooltip("The magnetic snap distance for edge snapping while dragging");
        gridVisibleBox.setTooltip("Specifies when grid lines are visible");
        guideVisibleBox.setTooltip("Specifies when guide lines are visible");
        gridSizeSlider.setTooltip("Specifies the size of each grid cell in pixels");
        gridOffsetSlider.setTooltip("Specifies the offset of the grid from the canvas origin");

        auto configureSlider = [](juce::Slider& slider, double min, double max)
        {
            slider.setSliderStyle(juce::Slider::LinearBar);
            slider.setTextBoxStyle(juce::Slider::TextBoxRight, false, 44, 20);
            slider.setRange(min, max, 1.0);
        };

        configureSlider(snapDistanceSlider, SnapInfo::kMinDistance, SnapInfo::kMaxDistance);
        configureSlider(gridSizeSlider, GridInfo::kMinSize, GridInfo::kMaxSize);
        configureSlider(gridOffsetSlider, GridInfo::kMinOffset, GridInfo::kMaxOffset);

        configureVisibilityBox(gridVisibleBox);
        configureVisibilityBox(guideVisibleBox);
        configureStyleBox(gridStyleBox);
        configureStyleBox(guideStyleBox);

        for (auto* toggle : { &gridSnapToggle, &guideSnapToggle })
            toggle->setClickingTogglesState(true);

        const auto onUiChanged = [this]
        {
            applySettingsFromUi();
        };

        snapDistanceSlider.onValueChange = onUiChanged;
        gridSizeSlider.onValueChange = onUiChanged;
        gridOffsetSlider.onValueChange = onUiChanged;
        gridVisibleBox.onChange = onUiChanged;
        gridStyleBox.onChange = onUiChanged;
        guideVisibleBox.onChange = onUiChanged;
        guideStyleBox.onChange = onUiChanged;
        gridSnapToggle.onClick = onUiChanged;
        guideSnapToggle.onClick = onUiChanged;

        syncUiFromSettings();
    }

    void CanvasSettingsPanel::setSettings(const CanvasSettings& settingsIn)
    {
        canvasSettings = settingsIn;
        canvasSettings.snap = clamped(canvasSettings.snap);
        canvasSettings.grid = clamped(canvasSettings.grid);
        syncUiFromSettings();
        repaint();
    }

    const CanvasSettings& CanvasSettingsPanel::settings() const noexcept
    {
        return canvasSettings;
    }

    void CanvasSettingsPanel::setSettingsChangedCallback(std::function<void(const CanvasSettings&)> callback)
    {
        onSettingsChanged = std::move(callback);
    }

    void CanvasSettingsPanel::paint(juce::Graphics& g)
    {
        g.fillAll(juce::Colour::fromRGB(24, 28, 34));
        g.setColour(juce::Colour::fromRGB(40, 46, 56));
        g.drawRect(getLocalBounds(), 1);
        g.setColour(juce::Colour::fromRGB(184, 189, 200));
        g.setFont(juce::FontOptions(12.0f));
        g.drawText("Canvas", getLocalBounds().reduced(8), juce::Justification::topLeft, true);
    }

    void CanvasSettingsPanel::resized()
    {
        auto area = getLocalBounds().reduced(8);
        area.removeFromTop(22);

        constexpr int kLabelWidth = 52;
        constexpr int kRowHeight = 24;
        const auto nextRow = [&area]
        {
            auto row = area.removeFromTop(kRowHeight);
            area.removeFromTop(4);
            return row;
        };

        auto snapRow = nextRow();
        snapLabel.setBounds(snapRow.removeFromLeft(kLabelWidth));
        snapDistanceSlider.setBounds(snapRow);

        area.removeFromTop(6);
        auto gridRow = nextRow();
        gridLabel.setBounds(gridRow.removeFromLeft(kLabelWidth));
        gridVisibleBox.setBounds(gridRow.removeFromLeft(gridRow.getWidth() / 2).withTrimmedRight(4));
        gridStyleBox.setBounds(gridRow);

        auto gridSnapRow = nextRow();
        gridSnapRow.removeFromLeft(kLabelWidth);
        gridSnapToggle.setBounds(gridSnapRow);

        auto sizeRow = nextRow();
        gridSizeLabel.setBounds(sizeRow.removeFromLeft(kLabelWidth));
        gridSizeSlider.setBounds(sizeRow);

        auto offsetRow = nextRow();
        gridOffsetLabel.setBounds(offsetRow.removeFromLeft(kLabelWidth));
        gridOffsetSlider.setBounds(offsetRow);

        area.removeFromTop(6);
        auto guideRow = nextRow();
        guideLabel.setBounds(guideRow.removeFromLeft(kLabelWidth));
        guideVisibleBox.setBounds(guideRow.removeFromLeft(guideRow.getWidth() / 2).withTrimmedRight(4));
        guideStyleBox.setBounds(guideRow);

        auto guideSnapRow = nextRow();
        guideSnapRow.removeFromLeft(kLabelWidth);
        guideSnapToggle.setBounds(guideSnapRow);
    }

    void CanvasSettingsPanel::syncUiFromSettings()
    {
        snapDistanceSlider.setValue(canvasSettings.snap.distance, juce::dontSendNotification);

        const auto& grid = canvasSettings.grid;
        gridVisibleBox.setSelectedId(comboIdFor(grid.visible), juce::dontSendNotification);
        gridStyleBox.setSelectedId(comboIdFor(grid.style), juce::dontSendNotification);
        gridSnapToggle.setToggleState(grid.snapping, juce::dontSendNotification);
        gridSizeSlider.setValue(grid.size, juce::dontSendNotification);
        gridOffsetSlider.setValue(grid.offset, juce::dontSendNotification);

        const auto& guide = canvasSettings.guide;
        guideVisibleBox.setSelectedId(comboIdFor(guide.visible), juce::dontSendNotification);
        guideStyleBox.setSelectedId(comboIdFor(guide.style), juce::dontSendNotification);
        guideSnapToggle.setToggleState(guide.snapping, juce::dontSendNotification);
    }

    void CanvasSettingsPanel::applySettingsFromUi()
    {
        canvasSettings.snap.distance = juce::roundToInt(snapDistanceSlider.getValue());

        auto& grid = canvasSettings.grid;
        grid.visible = visibilityFromCombo(gridVisibleBox);
        grid.style = lineStyleFromCombo(gridStyleBox);
        grid.snapping = gridSnapToggle.getToggleState();
        grid.size = juce::roundToInt(gridSizeSlider.getValue());
        grid.offset = juce::roundToInt(gridOffsetSlider.getValue());

        auto& guide = canvasSettings.guide;
        guide.visible = visibilityFromCombo(guideVisibleBox);
        guide.style = lineStyleFromCombo(guideStyleBox);
        guide.snapping = guideSnapToggle.getToggleState();

        canvasSettings.snap = clamped(canvasSettings.snap);
        canvasSettings.grid = clamped(canvasSettings.grid);
        notifySettingsChanged();
        repaint();
    }

    void CanvasSettingsPanel::notifySettingsChanged() const
    {
        if (onSettingsChanged != nullptr)
            onSettingsChanged(canvasSettings);
    }
}
