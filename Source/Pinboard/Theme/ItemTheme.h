#pragma once

#include <JuceHeader.h>
#include <vector>

namespace Pinboard
{
    struct ItemTheme
    {
        juce::String name;
        juce::Colour fill { juce::Colour::fromRGB(44, 49, 60) };
        juce::Colour border { juce::Colour::fromRGB(95, 101, 114) };
        juce::Colour titleBar { juce::Colour::fromRGB(58, 64, 78) };
        juce::Colour text { juce::Colour::fromRGB(228, 232, 238) };

        // Title bar heights (top/bottom) and side margins around the embedded view.
        juce::BorderSize<int> insets { 22, 4, 4, 4 };
        juce::Point<int> offset;
        float cornerSize = 5.0f;
    };

    class ThemeRegistry
    {
    public:
        static constexpr const char* kDefaultActive = "default_active";
        static constexpr const char* kDefaultInactive = "default_inactive";
        static constexpr const char* kDefaultHover = "default_hover";

        ThemeRegistry();

        // Adds or replaces a theme. Themes without a name are rejected.
        bool registerTheme(ItemTheme theme);

        const ItemTheme* find(const juce::String& name) const noexcept;

        // Unknown names resolve to the default inactive theme. The reference is only valid until the
        // next registerTheme(); callers that keep a theme copy it.
        const ItemTheme& resolve(const juce::String& name) const;

        const std::vector<ItemTheme>& all() const noexcept { return themes; }

    private:
        std::vector<ItemTheme> themes;
    };

    const ThemeRegistry& defaultThemeRegistry();
}
