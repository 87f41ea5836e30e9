#include "Pinboard/Editor/Interaction/SnapEngine.h"

#include <cstdlib>

namespace Pinboard::Ui::Interaction
{
    namespace
    {
        int floorDiv(int value, int divisor) noexcept
        {
            const auto quotient = value / divisor;
            const auto remainder = value % divisor;
            return (remainder != 0 && ((remainder < 0) != (divisor < 0))) ? quotient - 1 : quotient;
        }
    }

    SnapEngine::SnapEngine(SnapSettings settingsIn, GuideLines guidesIn)
        : snapSettings(settingsIn),
          guideLines(std::move(guidesIn))
    {
    }

    void SnapEngine::setSettings(SnapSettings settingsIn) noexcept
    {
        snapSettings = settingsIn;
    }

    const SnapSettings& SnapEngine::settings() const noexcept
    {
        return snapSettings;
    }

    void SnapEngine::setGuides(GuideLines guidesIn)
    {
        guideLines = std::move(guidesIn);
    }

    const GuideLines& SnapEngine::guides() const noexcept
    {
        return guideLines;
    }

    void SnapEngine::clearGuides() noexcept
    {
        guideLines.vertical.clear();
        guideLines.horizontal.clear();
    }

    bool SnapEngine::isEnabled() const noexcept
    {
        return snapSettings.distance > 0;
    }

    int SnapEngine::snapX(int x, int dx) const noexcept
    {
        return snapAxis(x, dx, guideLines.vertical);
    }

    int SnapEngine::snapY(int y, int dy) const noexcept
    {
        return snapAxis(y, dy, guideLines.horizontal);
    }

    int SnapEngine::snapAxis(int origin, int delta, const std::set<int>& guideCoordinates) const noexcept
    {
        auto snap = snapSettings.distance;
        if (snap <= 0)
            return delta;

        const auto target = origin + delta;

        if (snapSettings.gridSnapping && snapSettings.gridSize > 0)
        {
            // Nearest grid line at or before the target, then the one after it.
            auto gridLine = floorDiv(target - snapSettings.gridOffset, snapSettings.gridSize) * snapSettings.gridSize
                          + snapSettings.gridOffset;
            if (std::abs(target - gridLine) <= snap)
                return gridLine - origin;

            gridLine += snapSettings.gridSize;
            if (std::abs(target - gridLine) <= snap)
                return gridLine - origin;
        }

        if (snapSettings.guideSnapping)
        {
            for (const auto guide : guideCoordinates)
            {
                const auto distance = std::abs(target - guide);
                if (distance <= snap)
                {
                    snap = distance;
                    delta = guide - origin;
                }
            }
        }

        return delta;
    }
}
