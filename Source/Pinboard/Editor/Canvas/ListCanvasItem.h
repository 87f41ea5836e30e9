#pragma once

#include "Pinboard/Editor/Canvas/CanvasRenderer.h"
#include "Pinboard/Editor/Canvas/TitleBarLayout.h"
#include "Pinboard/Public/CanvasObject.h"
#include "Pinboard/Public/Types.h"
#include "Pinboard/Theme/ItemTheme.h"
#include <JuceHeader.h>
#include <memory>
#include <optional>

namespace Pinboard::Ui::Canvas
{
    class ListCanvas;

    // A themed, title-barred panel hosting the view of one canvas object.
    class ListCanvasItem : public juce::Component,
                           public juce::SettableTooltipClient
    {
    public:
        ListCanvasItem(ListCanvas& canvasIn, CanvasObject::Ptr objectIn);
        ~ListCanvasItem() override;

        CanvasObject& object() const noexcept;
        CanvasObject::Ptr objectPtr() const noexcept;
        CanvasObject::Ptr viewModel() const noexcept;
        juce::Component* view() const noexcept;

        const juce::String& title() const noexcept;
        ItemState state() const noexcept;
        void setState(ItemState nextState);
        const ItemTheme& theme() const noexcept;

        bool isMinimized() const noexcept;
        void setMinimized(bool shouldBeMinimized);
        // Bounds the item has (or will have again) when not minimized.
        juce::Rectangle<int> expandedBounds() const noexcept;

        const std::optional<TitleBarLayout>& titleBarLayout() const noexcept;

        // Preferred view size framed by the theme insets.
        juce::Point<int> bestSize() const;

        // Drag mode a left press at the item-local point would start, honouring the adapter and
        // the canvas operations.
        int dragModeAt(juce::Point<int> localPoint) const;
        int currentDragMode() const noexcept;

        // Pointer handling, item-local coordinates.
        void handlePointerMove(juce::Point<int> localPoint);
        void handlePointerExit();
        void handleLeftDown(juce::Point<int> localPoint);
        void handleLeftUp(juce::Point<int> localPoint);
        void handleViewClicked();

        bool pressButton(TitleBarButton button);

        // Re-reads title, theme and tooltip from the adapter and lays out the title bar.
        void refresh();

        void paint(juce::Graphics& g) override;
        void resized() override;
        void mouseMove(const juce::MouseEvent& event) override;
        void mouseEnter(const juce::MouseEvent& event) override;
        void mouseExit(const juce::MouseEvent& event) override;
        void mouseDown(const juce::MouseEvent& event) override;
        void mouseDrag(const juce::MouseEvent& event) override;
        void mouseUp(const juce::MouseEvent& event) override;

    private:
        void applyTheme(const juce::String& themeName);
        void updateLayout();
        void updateCursor(juce::Point<int> localPoint);
        void layoutView();
        int collapsedHeight() const noexcept;
        bool isFromView(const juce::MouseEvent& event) const noexcept;

        ListCanvas& canvas;
        CanvasObject::Ptr item;
        CanvasObject::Ptr model;
        std::unique_ptr<juce::Component> viewComponent;
        juce::String itemTitle;
        ItemState itemState = ItemState::inactive;
        // Copied from the registry, which may grow or replace themes while items are alive.
        ItemTheme itemTheme;
        std::optional<TitleBarLayout> layout;
        bool minimized = false;
        int restoredHeight = 0;
        int dragMode = DragMode::none;
        std::optional<TitleBarButton> pressedButton;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ListCanvasItem)
    };
}
