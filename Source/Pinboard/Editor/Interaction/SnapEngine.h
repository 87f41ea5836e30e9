#pragma once

#include "Pinboard/Public/Types.h"
#include <JuceHeader.h>
#include <set>

namespace Pinboard::Ui::Interaction
{
    // Alignment lines derived from the canvas border and other items' edges.
    struct GuideLines
    {
        std::set<int> vertical;   // x coordinates
        std::set<int> horizontal; // y coordinates

        bool empty() const noexcept { return vertical.empty() && horizontal.empty(); }
    };

    struct SnapSettings
    {
        int distance = 0;
        bool gridSnapping = true;
        int gridSize = 50;
        int gridOffset = 0;
        bool guideSnapping = true;
    };

    inline SnapSettings makeSnapSettings(const SnapInfo& snap, const GridInfo& grid, const GuideInfo& guide) noexcept
    {
        const auto safeSnap = clamped(snap);
        const auto safeGrid = clamped(grid);

        SnapSettings settings;
        settings.distance = safeSnap.distance;
        settings.gridSnapping = safeGrid.snapping;
        settings.gridSize = safeGrid.size;
        settings.gridOffset = safeGrid.offset;
        settings.guideSnapping = guide.snapping;
        return settings;
    }

    class SnapEngine
    {
    public:
        SnapEngine() = default;
        SnapEngine(SnapSettings settingsIn, GuideLines guidesIn);

        void setSettings(SnapSettings settingsIn) noexcept;
        const SnapSettings& settings() const noexcept;

        void setGuides(GuideLines guidesIn);
        const GuideLines& guides() const noexcept;
        void clearGuides() noexcept;

        bool isEnabled() const noexcept;

        // Return the adjusted delta that moves coordinate x (or y) by roughly dx (dy) while pulling
        // the result onto a grid line or guide line within the snap distance.
        int snapX(int x, int dx) const noexcept;
        int snapY(int y, int dy) const noexcept;

    private:
        int snapAxis(int origin, int delta, const std::set<int>& guideCoordinates) const noexcept;

        SnapSettings snapSettings;
        GuideLines guideLines;
    };
}
