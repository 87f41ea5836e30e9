#pragma once

#include <JuceHeader.h>
#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <optional>

namespace Pinboard
{
    enum class VisibilityMode
    {
        never,
        always,
        drag
    };

    enum class LineStyle
    {
        solid,
        dash,
        dot
    };

    enum class ItemState
    {
        inactive,
        hover,
        active
    };

    enum class CanvasState
    {
        normal,
        dragging
    };

    enum class CloseBehaviour
    {
        allowed,
        denied,
        modified
    };

    struct SnapInfo
    {
        static constexpr int kMinDistance = 0;
        static constexpr int kMaxDistance = 10;

        // Magnetic snap distance in pixels; 0 turns snapping off.
        int distance = 0;
    };

    struct GuideInfo
    {
        VisibilityMode visible = VisibilityMode::never;
        bool snapping = true;
        juce::Colour colour { 0xffc8c8c8 };
        LineStyle style = LineStyle::solid;
    };

    struct GridInfo
    {
        static constexpr int kMinSize = 5;
        static constexpr int kMaxSize = 200;
        static constexpr int kMinOffset = 0;
        static constexpr int kMaxOffset = 200;

        VisibilityMode visible = VisibilityMode::never;
        bool snapping = true;
        juce::Colour colour { 0xffc8c8c8 };
        LineStyle style = LineStyle::solid;
        int size = 50;
        int offset = 0;
    };

    inline SnapInfo clamped(SnapInfo info) noexcept
    {
        info.distance = juce::jlimit(SnapInfo::kMinDistance, SnapInfo::kMaxDistance, info.distance);
        return info;
    }

    inline GridInfo clamped(GridInfo info) noexcept
    {
        info.size = juce::jlimit(GridInfo::kMinSize, GridInfo::kMaxSize, info.size);
        info.offset = juce::jlimit(GridInfo::kMinOffset, GridInfo::kMaxOffset, info.offset);
        return info;
    }

    enum class CanvasOperation
    {
        move,
        size,
        add,
        clone,
        drag,
        drop,
        load,
        save,
        close,
        clear,
        minimize,
        status,
        tooltip
    };

    inline constexpr CanvasOperation kAllCanvasOperations[] {
        CanvasOperation::move,  CanvasOperation::size,  CanvasOperation::add,
        CanvasOperation::clone, CanvasOperation::drag,  CanvasOperation::drop,
        CanvasOperation::load,  CanvasOperation::save,  CanvasOperation::close,
        CanvasOperation::clear, CanvasOperation::minimize, CanvasOperation::status,
        CanvasOperation::tooltip
    };

    inline juce::String canvasOperationToKey(CanvasOperation operation)
    {
        switch (operation)
        {
            case CanvasOperation::move: return "move";
            case CanvasOperation::size: return "size";
            case CanvasOperation::add: return "add";
            case CanvasOperation::clone: return "clone";
            case CanvasOperation::drag: return "drag";
            case CanvasOperation::drop: return "drop";
            case CanvasOperation::load: return "load";
            case CanvasOperation::save: return "save";
            case CanvasOperation::close: return "close";
            case CanvasOperation::clear: return "clear";
            case CanvasOperation::minimize: return "minimize";
            case CanvasOperation::status: return "status";
            case CanvasOperation::tooltip: return "tooltip";
        }

        return {};
    }

    inline std::optional<CanvasOperation> canvasOperationFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        for (const auto operation : kAllCanvasOperations)
        {
            if (canvasOperationToKey(operation) == normalized)
                return operation;
        }

        return std::nullopt;
    }

    // Set of operations a canvas allows. Defaults to every operation.
    class CanvasOperations
    {
    public:
        CanvasOperations() noexcept
        {
            for (const auto operation : kAllCanvasOperations)
                insert(operation);
        }

        CanvasOperations(std::initializer_list<CanvasOperation> operations) noexcept
        {
            for (const auto operation : operations)
                insert(operation);
        }

        static CanvasOperations none() noexcept
        {
            CanvasOperations operations;
            operations.bits = 0;
            return operations;
        }

        bool contains(CanvasOperation operation) const noexcept
        {
            return (bits & maskFor(operation)) != 0;
        }

        void insert(CanvasOperation operation) noexcept { bits |= maskFor(operation); }
        void erase(CanvasOperation operation) noexcept { bits &= ~maskFor(operation); }
        bool empty() const noexcept { return bits == 0; }

        bool operator==(const CanvasOperations& other) const noexcept { return bits == other.bits; }
        bool operator!=(const CanvasOperations& other) const noexcept { return bits != other.bits; }

    private:
        static std::uint32_t maskFor(CanvasOperation operation) noexcept
        {
            return 1u << static_cast<std::uint32_t>(operation);
        }

        std::uint32_t bits = 0;
    };

    struct CanvasSettings
    {
        SnapInfo snap;
        GridInfo grid;
        GuideInfo guide;
        CanvasOperations operations;
    };

    // Bit flags describing which edges of an item follow the pointer while dragging.
    namespace DragMode
    {
        inline constexpr int none = 0;
        inline constexpr int width = 0x01;
        inline constexpr int height = 0x02;
        inline constexpr int xPosition = 0x04;
        inline constexpr int yPosition = 0x08;

        inline constexpr int right = width;
        inline constexpr int bottom = height;
        inline constexpr int bottomRight = width | height;
        inline constexpr int left = xPosition | width;
        inline constexpr int bottomLeft = xPosition | width | height;
        inline constexpr int top = yPosition | height;
        inline constexpr int topRight = yPosition | width | height;
        inline constexpr int move = xPosition | yPosition;
        inline constexpr int topLeft = xPosition | yPosition | width | height;
    }

    inline constexpr int kMinItemExtent = 24;
}
