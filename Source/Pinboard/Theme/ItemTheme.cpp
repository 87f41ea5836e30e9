#include "Pinboard/Theme/ItemTheme.h"

#include <algorithm>

namespace Pinboard
{
    namespace
    {
        ItemTheme makeDefaultTheme(const char* name, juce::Colour titleBar, juce::Colour border)
        {
            ItemTheme theme;
            theme.name = name;
            theme.titleBar = titleBar;
            theme.border = border;
            theme.offset = { 0, 2 };
            return theme;
        }

        void warnUnknownThemeOnce(const juce::String& name)
        {
            static juce::StringArray warnedNames;
            if (warnedNames.contains(name))
                return;

            warnedNames.add(name);
            DBG("[Pinboard][Theme] unknown theme '" + name + "', using " + ThemeRegistry::kDefaultInactive);
        }
    }

    ThemeRegistry::ThemeRegistry()
    {
        registerTheme(makeDefaultTheme(kDefaultActive,
                                       juce::Colour::fromRGB(52, 92, 150),
                                       juce::Colour::fromRGB(78, 156, 255)));
        registerTheme(makeDefaultTheme(kDefaultInactive,
                                       juce::Colour::fromRGB(58, 64, 78),
                                       juce::Colour::fromRGB(95, 101, 114)));
        registerTheme(makeDefaultTheme(kDefaultHover,
                                       juce::Colour::fromRGB(66, 74, 92),
                                       juce::Colour::fromRGB(130, 138, 155)));
    }

    bool ThemeRegistry::registerTheme(ItemTheme theme)
    {
        theme.name = theme.name.trim();
        if (theme.name.isEmpty())
            return false;

        const auto it = std::find_if(themes.begin(),
                                     themes.end(),
                                     [&theme](const ItemTheme& existing)
                                     {
                                         return existing.name == theme.name;
                                     });
        if (it != themes.end())
            *it = std::move(theme);
        else
            themes.push_back(std::move(theme));

        return true;
    }

    const ItemTheme* ThemeRegistry::find(const juce::String& name) const noexcept
    {
        const auto it = std::find_if(themes.begin(),
                                     themes.end(),
                                     [&name](const ItemTheme& theme)
                                     {
                                         return theme.name == name;
                                     });
        return it == themes.end() ? nullptr : &(*it);
    }

    const ItemTheme& ThemeRegistry::resolve(const juce::String& name) const
    {
        if (const auto* theme = find(name))
            return *theme;

        if (name.isNotEmpty())
            warnUnknownThemeOnce(name);

        return *find(kDefaultInactive);
    }

    const ThemeRegistry& defaultThemeRegistry()
    {
        static const ThemeRegistry registry;
        return registry;
    }
}
