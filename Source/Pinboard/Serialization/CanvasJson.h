#pragma once

#include "Pinboard/Public/Types.h"
#include <JuceHeader.h>
#include <vector>

namespace Pinboard::Serialization
{
    // Saved placement of one canvas item, keyed by the adapter's unique id.
    struct ItemLayout
    {
        juce::String uniqueId;
        juce::Rectangle<int> bounds;
        bool minimized = false;
    };

    using CanvasLayout = std::vector<ItemLayout>;

    juce::String visibilityModeToKey(VisibilityMode mode);
    juce::String lineStyleToKey(LineStyle style);

    juce::var settingsToVar(const CanvasSettings& settings);
    juce::Result settingsFromVar(const juce::var& value, CanvasSettings& settingsOut);

    juce::Result serializeSettingsToJsonString(const CanvasSettings& settings, juce::String& jsonOut);
    juce::Result parseSettingsFromJsonString(const juce::String& json, CanvasSettings& settingsOut);
    juce::Result saveSettingsToFile(const juce::File& file, const CanvasSettings& settings);
    juce::Result loadSettingsFromFile(const juce::File& file, CanvasSettings& settingsOut);

    juce::Result serializeLayoutToJsonString(const CanvasLayout& layout, juce::String& jsonOut);
    juce::Result parseLayoutFromJsonString(const juce::String& json, CanvasLayout& layoutOut);
    juce::Result saveLayoutToFile(const juce::File& file, const CanvasLayout& layout);
    juce::Result loadLayoutFromFile(const juce::File& file, CanvasLayout& layoutOut);
}
