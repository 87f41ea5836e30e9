#include "Pinboard/Serialization/CanvasJson.h"

#include <limits>
#include <memory>
#include <optional>
#include <utility>

namespace Pinboard::Serialization
{
    namespace
    {
        constexpr int kSettingsVersion = 1;
        constexpr int kLayoutVersion = 1;

        bool isNumericVar(const juce::var& value) noexcept
        {
            return value.isInt() || value.isInt64() || value.isDouble();
        }

        std::optional<VisibilityMode> visibilityModeFromKey(const juce::String& key)
        {
            const auto normalized = key.trim();
            if (normalized == "never") return VisibilityMode::never;
            if (normalized == "always") return VisibilityMode::always;
            if (normalized == "drag") return VisibilityMode::drag;
            return std::nullopt;
        }

        std::optional<LineStyle> lineStyleFromKey(const juce::String& key)
        {
            const auto normalized = key.trim();
            if (normalized == "solid") return LineStyle::solid;
            if (normalized == "dash") return LineStyle::dash;
            if (normalized == "dot") return LineStyle::dot;
            return std::nullopt;
        }

        std::optional<juce::Colour> colourFromKey(const juce::String& key)
        {
            const auto text = key.trim().removeCharacters("#");
            if ((text.length() != 6 && text.length() != 8) || !text.containsOnly("0123456789abcdefABCDEF"))
                return std::nullopt;

            return juce::Colour::fromString(text.length() == 6 ? "ff" + text : text);
        }

        const juce::NamedValueSet* objectProps(const juce::var& value)
        {
            if (auto* object = value.getDynamicObject())
                return &object->getProperties();
            return nullptr;
        }

        juce::Result readInt(const juce::NamedValueSet& props,
                             const juce::Identifier& key,
                             const juce::String& context,
                             int& valueOut)
        {
            if (!props.contains(key))
                return juce::Result::ok();

            const auto& value = props[key];
            if (!isNumericVar(value))
                return juce::Result::fail(context + "." + key.toString() + " must be numeric");

            // Out-of-range numbers saturate so the later range clamp sees them.
            valueOut = static_cast<int>(juce::jlimit(static_cast<double>(std::numeric_limits<int>::min()),
                                                     static_cast<double>(std::numeric_limits<int>::max()),
                                                     static_cast<double>(value)));
            return juce::Result::ok();
        }

        juce::Result readBool(const juce::NamedValueSet& props,
                              const juce::Identifier& key,
                              const juce::String& context,
                              bool& valueOut)
        {
            if (!props.contains(key))
                return juce::Result::ok();

            const auto& value = props[key];
            if (!value.isBool())
                return juce::Result::fail(context + "." + key.toString() + " must be bool");

            valueOut = static_cast<bool>(value);
            return juce::Result::ok();
        }

        juce::Result readLineAppearance(const juce::NamedValueSet& props,
                                        const juce::String& context,
                                        VisibilityMode& visibleOut,
                                        bool& snappingOut,
                                        juce::Colour& colourOut,
                                        LineStyle& styleOut)
        {
            if (props.contains("visible"))
            {
                const auto mode = visibilityModeFromKey(props["visible"].toString());
                if (!mode.has_value())
                    return juce::Result::fail(context + ".visible is unknown: " + props["visible"].toString());
                visibleOut = *mode;
            }

            if (const auto result = readBool(props, "snapping", context, snappingOut); result.failed())
                return result;

            if (props.contains("colour"))
            {
                const auto colour = colourFromKey(props["colour"].toString());
                if (!colour.has_value())
                    return juce::Result::fail(context + ".colour must be a hex ARGB string");
                colourOut = *colour;
            }

            if (props.contains("style"))
            {
                const auto style = lineStyleFromKey(props["style"].toString());
                if (!style.has_value())
                    return juce::Result::fail(context + ".style is unknown: " + props["style"].toString());
                styleOut = *style;
            }

            return juce::Result::ok();
        }

        juce::var serializeGrid(const GridInfo& grid)
        {
            auto object = std::make_unique<juce::DynamicObject>();
            object->setProperty("visible", visibilityModeToKey(grid.visible));
            object->setProperty("snapping", grid.snapping);
            object->setProperty("colour", grid.colour.toString());
            object->setProperty("style", lineStyleToKey(grid.style));
            object->setProperty("size", grid.size);
            object->setProperty("offset", grid.offset);
            return juce::var(object.release());
        }

        juce::var serializeGuide(const GuideInfo& guide)
        {
            auto object = std::make_unique<juce::DynamicObject>();
            object->setProperty("visible", visibilityModeToKey(guide.visible));
            object->setProperty("snapping", guide.snapping);
            object->setProperty("colour", guide.colour.toString());
            object->setProperty("style", lineStyleToKey(guide.style));
            return juce::var(object.release());
        }

        juce::Result parseFromJson(const juce::String& json, juce::var& rootOut)
        {
            const auto parseResult = juce::JSON::parse(json, rootOut);
            if (parseResult.failed())
                return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

            if (rootOut.getDynamicObject() == nullptr)
                return juce::Result::fail("Root must be object");

            return juce::Result::ok();
        }

        juce::Result loadText(const juce::File& file, juce::String& textOut)
        {
            if (!file.existsAsFile())
                return juce::Result::fail("File not found: " + file.getFullPathName());

            textOut = file.loadFileAsString();
            return juce::Result::ok();
        }

        juce::Result writeText(const juce::File& file, const juce::String& text)
        {
            if (!file.replaceWithText(text))
                return juce::Result::fail("Failed to write JSON file: " + file.getFullPathName());

            return juce::Result::ok();
        }
    }

    juce::String visibilityModeToKey(VisibilityMode mode)
    {
        switch (mode)
        {
            case VisibilityMode::never: return "never";
            case VisibilityMode::always: return "always";
            case VisibilityMode::drag: return "drag";
        }

        return "never";
    }

    juce::String lineStyleToKey(LineStyle style)
    {
        switch (style)
        {
            case LineStyle::solid: return "solid";
            case LineStyle::dash: return "dash";
            case LineStyle::dot: return "dot";
        }

        return "solid";
    }

    juce::var settingsToVar(const CanvasSettings& settings)
    {
        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("version", kSettingsVersion);

        auto snap = std::make_unique<juce::DynamicObject>();
        snap->setProperty("distance", settings.snap.distance);
        root->setProperty("snap", juce::var(snap.release()));
        root->setProperty("grid", serializeGrid(settings.grid));
        root->setProperty("guide", serializeGuide(settings.guide));

        juce::Array<juce::var> operations;
        for (const auto operation : kAllCanvasOperations)
        {
            if (settings.operations.contains(operation))
                operations.add(canvasOperationToKey(operation));
        }
        root->setProperty("operations", juce::var(operations));

        return juce::var(root.release());
    }

    juce::Result settingsFromVar(const juce::var& value, CanvasSettings& settingsOut)
    {
        const auto* rootProps = objectProps(value);
        if (rootProps == nullptr)
            return juce::Result::fail("Settings must be object");

        CanvasSettings next;

        if (rootProps->contains("snap"))
        {
            const auto* props = objectProps((*rootProps)["snap"]);
            if (props == nullptr)
                return juce::Result::fail("snap must be object");
            if (const auto result = readInt(*props, "distance", "snap", next.snap.distance); result.failed())
                return result;
        }

        if (rootProps->contains("grid"))
        {
            const auto* props = objectProps((*rootProps)["grid"]);
            if (props == nullptr)
                return juce::Result::fail("grid must be object");

            auto& grid = next.grid;
            if (const auto result = readLineAppearance(*props, "grid", grid.visible, grid.snapping, grid.colour, grid.style);
                result.failed())
                return result;
            if (const auto result = readInt(*props, "size", "grid", grid.size); result.failed())
                return result;
            if (const auto result = readInt(*props, "offset", "grid", grid.offset); result.failed())
                return result;
        }

        if (rootProps->contains("guide"))
        {
            const auto* props = objectProps((*rootProps)["guide"]);
            if (props == nullptr)
                return juce::Result::fail("guide must be object");

            auto& guide = next.guide;
            if (const auto result = readLineAppearance(*props, "guide", guide.visible, guide.snapping, guide.colour, guide.style);
                result.failed())
                return result;
        }

        if (rootProps->contains("operations"))
        {
            const auto* array = (*rootProps)["operations"].getArray();
            if (array == nullptr)
                return juce::Result::fail("operations must be array");

            next.operations = CanvasOperations::none();
            for (const auto& entry : *array)
            {
                const auto operation = canvasOperationFromKey(entry.toString());
                if (!operation.has_value())
                    return juce::Result::fail("operations contains unknown operation: " + entry.toString());
                next.operations.insert(*operation);
            }
        }

        next.snap = clamped(next.snap);
        next.grid = clamped(next.grid);
        settingsOut = next;
        return juce::Result::ok();
    }

    juce::Result serializeSettingsToJsonString(const CanvasSettings& settings, juce::String& jsonOut)
    {
        jsonOut = juce::JSON::toString(settingsToVar(settings), false);
        return juce::Result::ok();
    }

    juce::Result parseSettingsFromJsonString(const juce::String& json, CanvasSettings& settingsOut)
    {
        juce::var root;
        if (const auto result = parseFromJson(json, root); result.failed())
            return result;

        return settingsFromVar(root, settingsOut);
    }

    juce::Result saveSettingsToFile(const juce::File& file, const CanvasSettings& settings)
    {
        juce::String json;
        if (const auto result = serializeSettingsToJsonString(settings, json); result.failed())
            return result;

        return writeText(file, json);
    }

    juce::Result loadSettingsFromFile(const juce::File& file, CanvasSettings& settingsOut)
    {
        juce::String text;
        if (const auto result = loadText(file, text); result.failed())
            return result;

        return parseSettingsFromJsonString(text, settingsOut);
    }

    juce::Result serializeLayoutToJsonString(const CanvasLayout& layout, juce::String& jsonOut)
    {
        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("version", kLayoutVersion);

        juce::Array<juce::var> items;
        for (const auto& entry : layout)
        {
            if (entry.uniqueId.isEmpty())
                return juce::Result::fail("layout item requires a unique id");

            auto item = std::make_unique<juce::DynamicObject>();
            item->setProperty("id", entry.uniqueId);
            item->setProperty("x", entry.bounds.getX());
            item->setProperty("y", entry.bounds.getY());
            item->setProperty("w", entry.bounds.getWidth());
            item->setProperty("h", entry.bounds.getHeight());
            item->setProperty("minimized", entry.minimized);
            items.add(juce::var(item.release()));
        }
        root->setProperty("items", juce::var(items));

        jsonOut = juce::JSON::toString(juce::var(root.release()), false);
        return juce::Result::ok();
    }

    juce::Result parseLayoutFromJsonString(const juce::String& json, CanvasLayout& layoutOut)
    {
        juce::var root;
        if (const auto result = parseFromJson(json, root); result.failed())
            return result;

        const auto& rootProps = root.getDynamicObject()->getProperties();
        if (!rootProps.contains("items"))
            return juce::Result::fail("Layout requires items");

        const auto* array = rootProps["items"].getArray();
        if (array == nullptr)
            return juce::Result::fail("items must be array");

        CanvasLayout next;
        next.reserve(static_cast<size_t>(array->size()));
        for (const auto& itemValue : *array)
        {
            const auto* props = objectProps(itemValue);
            if (props == nullptr)
                return juce::Result::fail("layout item must be object");

            if (!props->contains("id") || !props->contains("x") || !props->contains("y")
                || !props->contains("w") || !props->contains("h"))
                return juce::Result::fail("layout item requires id/x/y/w/h");

            ItemLayout entry;
            entry.uniqueId = (*props)["id"].toString();
            if (entry.uniqueId.isEmpty())
                return juce::Result::fail("layout item id must not be empty");

            int x = 0;
            int y = 0;
            int w = 0;
            int h = 0;
            for (const auto& [key, target] : { std::pair<const char*, int*> { "x", &x },
                                               std::pair<const char*, int*> { "y", &y },
                                               std::pair<const char*, int*> { "w", &w },
                                               std::pair<const char*, int*> { "h", &h } })
            {
                if (const auto result = readInt(*props, key, "layout item", *target); result.failed())
                    return result;
            }

            if (w <= 0 || h <= 0)
                return juce::Result::fail("layout item '" + entry.uniqueId + "' has an empty size");

            entry.bounds = { x, y, w, h };
            if (const auto result = readBool(*props, "minimized", "layout item", entry.minimized); result.failed())
                return result;

            next.push_back(std::move(entry));
        }

        layoutOut = std::move(next);
        return juce::Result::ok();
    }

    juce::Result saveLayoutToFile(const juce::File& file, const CanvasLayout& layout)
    {
        juce::String json;
        if (const auto result = serializeLayoutToJsonString(layout, json); result.failed())
            return result;

        return writeText(file, json);
    }

    juce::Result loadLayoutFromFile(const juce::File& file, CanvasLayout& layoutOut)
    {
        juce::String text;
        if (const auto result = loadText(file, text); result.failed())
            return result;

        return parseLayoutFromJsonString(text, layoutOut);
    }
}
