#include "Pinboard/Editor/Canvas/ListCanvasItem.h"

#include "Pinboard/Editor/Canvas/ListCanvas.h"
#include "Pinboard/Editor/Interaction/DragModeEngine.h"

#include <algorithm>

namespace Pinboard::Ui::Canvas
{
    namespace
    {
        constexpr int kDragOutThreshold = 3;

        int titleFontHeight()
        {
            return juce::roundToInt(juce::Font(CanvasRenderer::titleFont()).getHeight());
        }
    }

    ListCanvasItem::ListCanvasItem(ListCanvas& canvasIn, CanvasObject::Ptr objectIn)
        : canvas(canvasIn),
          item(std::move(objectIn))
    {
        auto& adapter = canvas.adapter();

        itemTheme = canvas.themes().resolve(adapter.getThemeInactive(*item));

        itemTitle = adapter.getTitle(*item);
        if (itemTitle.isEmpty())
            itemTitle = userNameFor(item->typeName());

        model = adapter.getViewModel(*item);
        if (model == nullptr)
            model = item;

        viewComponent = model->createView(adapter.getView(*item));
        if (viewComponent != nullptr)
        {
            addAndMakeVisible(*viewComponent);
            viewComponent->addMouseListener(this, true);
        }

        if (canvas.isOperationAllowed(CanvasOperation::tooltip))
            setTooltip(adapter.getTooltip(*item));

        const auto best = bestSize();
        setSize(best.x, best.y);
    }

    ListCanvasItem::~ListCanvasItem()
    {
        if (viewComponent != nullptr)
            viewComponent->removeMouseListener(this);
    }

    CanvasObject& ListCanvasItem::object() const noexcept
    {
        return *item;
    }

    CanvasObject::Ptr ListCanvasItem::objectPtr() const noexcept
    {
        return item;
    }

    CanvasObject::Ptr ListCanvasItem::viewModel() const noexcept
    {
        return model;
    }

    juce::Component* ListCanvasItem::view() const noexcept
    {
        return viewComponent.get();
    }

    const juce::String& ListCanvasItem::title() const noexcept
    {
        return itemTitle;
    }

    ItemState ListCanvasItem::state() const noexcept
    {
        return itemState;
    }

    void ListCanvasItem::setState(ItemState nextState)
    {
        if (itemState == nextState)
            return;

        itemState = nextState;
        applyTheme(canvas.adapter().getThemeFor(*item, itemState));

        if (itemState == ItemState::active)
            toFront(false);

        repaint();
    }

    const ItemTheme& ListCanvasItem::theme() const noexcept
    {
        return itemTheme;
    }

    bool ListCanvasItem::isMinimized() const noexcept
    {
        return minimized;
    }

    void ListCanvasItem::setMinimized(bool shouldBeMinimized)
    {
        if (minimized == shouldBeMinimized)
            return;

        if (shouldBeMinimized)
        {
            restoredHeight = getHeight();
            minimized = true;
            if (viewComponent != nullptr)
                viewComponent->setVisible(false);
            setSize(getWidth(), collapsedHeight());
        }
        else
        {
            minimized = false;
            if (viewComponent != nullptr)
                viewComponent->setVisible(true);
            setSize(getWidth(), std::max(restoredHeight, collapsedHeight()));
        }

        updateLayout();
        repaint();
    }

    juce::Rectangle<int> ListCanvasItem::expandedBounds() const noexcept
    {
        return minimized ? getBounds().withHeight(restoredHeight) : getBounds();
    }

    const std::optional<TitleBarLayout>& ListCanvasItem::titleBarLayout() const noexcept
    {
        return layout;
    }

    juce::Point<int> ListCanvasItem::bestSize() const
    {
        const auto preferred = model->preferredViewSize();
        return Interaction::PlacementEngine().bestItemSize({ preferred.getWidth(), preferred.getHeight() },
                                                           itemTheme.insets);
    }

    int ListCanvasItem::dragModeAt(juce::Point<int> localPoint) const
    {
        auto& adapter = canvas.adapter();

        Interaction::DragHitRequest request;
        request.point = localPoint;
        request.itemSize = { getWidth(), getHeight() };
        request.canResize = !minimized
                         && canvas.isOperationAllowed(CanvasOperation::size)
                         && adapter.getCanResize(*item);
        request.canMove = canvas.isOperationAllowed(CanvasOperation::move)
                       && adapter.getCanMove(*item);
        request.titleBarTop = itemTheme.insets.getTop();
        request.titleBarBottom = itemTheme.insets.getBottom();
        return Interaction::DragModeEngine::decode(request);
    }

    int ListCanvasItem::currentDragMode() const noexcept
    {
        return dragMode;
    }

    void ListCanvasItem::handlePointerMove(juce::Point<int> localPoint)
    {
        switch (itemState)
        {
            case ItemState::inactive:
                setState(ItemState::hover);
                break;

            case ItemState::hover:
                if (!getLocalBounds().contains(localPoint))
                {
                    setState(ItemState::inactive);
                    return;
                }
                break;

            case ItemState::active:
                break;
        }

        updateCursor(localPoint);
    }

    void ListCanvasItem::handlePointerExit()
    {
        if (itemState == ItemState::hover)
            setState(ItemState::inactive);

        if (dragMode == DragMode::none)
            setMouseCursor(juce::MouseCursor::NormalCursor);
    }

    void ListCanvasItem::handleLeftDown(juce::Point<int> localPoint)
    {
        if (itemState != ItemState::active)
            canvas.activate(this);

        if (layout.has_value())
        {
            if (const auto button = layout->buttonAt(localPoint))
            {
                pressedButton = button;
                repaint();
                return;
            }
        }

        dragMode = dragModeAt(localPoint);
        setMouseCursor(Interaction::DragModeEngine::cursorFor(dragMode));

        if (dragMode != DragMode::none)
            canvas.beginDrag(*this, dragMode, localPoint + getPosition());
    }

    void ListCanvasItem::handleLeftUp(juce::Point<int> localPoint)
    {
        if (pressedButton.has_value())
        {
            const auto button = *pressedButton;
            pressedButton.reset();
            repaint();

            if (layout.has_value() && layout->buttonAt(localPoint) == button)
            {
                // The press may close this item, so it runs once the mouse callback has returned.
                juce::MessageManager::callAsync([safe = juce::Component::SafePointer<ListCanvasItem>(this), button]
                                                {
                                                    if (safe != nullptr)
                                                        safe->pressButton(button);
                                                });
            }
            return;
        }

        dragMode = DragMode::none;
        updateCursor(localPoint);
    }

    void ListCanvasItem::handleViewClicked()
    {
        if (itemState != ItemState::active)
            canvas.activate(this);
    }

    bool ListCanvasItem::pressButton(TitleBarButton button)
    {
        auto& adapter = canvas.adapter();

        switch (button)
        {
            case TitleBarButton::close:
                if (!canvas.isOperationAllowed(CanvasOperation::close) || !adapter.getCanDelete(*item))
                    return false;
                return canvas.requestClose(*this);

            case TitleBarButton::minimize:
                if (!canvas.isOperationAllowed(CanvasOperation::minimize))
                    return false;
                setMinimized(!minimized);
                return true;

            case TitleBarButton::drag:
                if (!canvas.isOperationAllowed(CanvasOperation::drag) || !adapter.getCanDrag(*item))
                    return false;
                return canvas.startDragOut(*this);

            case TitleBarButton::clone:
                if (!canvas.isOperationAllowed(CanvasOperation::clone) || !adapter.getCanClone(*item))
                    return false;
                return canvas.requestClone(*this);
        }

        return false;
    }

    void ListCanvasItem::refresh()
    {
        auto& adapter = canvas.adapter();

        auto nextTitle = adapter.getTitle(*item);
        if (nextTitle.isEmpty())
            nextTitle = userNameFor(item->typeName());
        itemTitle = nextTitle;

        setTooltip(canvas.isOperationAllowed(CanvasOperation::tooltip) ? adapter.getTooltip(*item) : juce::String());
        applyTheme(adapter.getThemeFor(*item, itemState));
        repaint();
    }

    void ListCanvasItem::paint(juce::Graphics& g)
    {
        ItemPaintState paintState;
        paintState.title = itemTitle;
        paintState.minimized = minimized;
        paintState.pressedButton = pressedButton;
        canvas.renderer().paintItem(g, getLocalBounds(), itemTheme, layout, paintState);
    }

    void ListCanvasItem::resized()
    {
        layoutView();
        updateLayout();
    }

    void ListCanvasItem::mouseMove(const juce::MouseEvent& event)
    {
        handlePointerMove(event.getEventRelativeTo(this).getPosition());
    }

    void ListCanvasItem::mouseEnter(const juce::MouseEvent& event)
    {
        handlePointerMove(event.getEventRelativeTo(this).getPosition());
    }

    void ListCanvasItem::mouseExit(const juce::MouseEvent&)
    {
        if (!isMouseOver(true))
            handlePointerExit();
    }

    void ListCanvasItem::mouseDown(const juce::MouseEvent& event)
    {
        if (!event.mods.isLeftButtonDown())
            return;

        if (isFromView(event))
        {
            handleViewClicked();
            return;
        }

        handleLeftDown(event.getPosition());
    }

    void ListCanvasItem::mouseDrag(const juce::MouseEvent& event)
    {
        if (isFromView(event))
            return;

        if (pressedButton == TitleBarButton::drag && event.getDistanceFromDragStart() > kDragOutThreshold)
        {
            pressedButton.reset();
            repaint();
            pressButton(TitleBarButton::drag);
            return;
        }

        if (canvas.dragItem() == this)
            canvas.dragTo(event.getEventRelativeTo(&canvas.surface()).getPosition());
    }

    void ListCanvasItem::mouseUp(const juce::MouseEvent& event)
    {
        if (isFromView(event))
            return;

        if (canvas.dragItem() == this)
            canvas.endDrag();

        handleLeftUp(event.getPosition());
    }

    void ListCanvasItem::applyTheme(const juce::String& themeName)
    {
        const auto& next = canvas.themes().resolve(themeName);
        const auto geometryChanged = next.insets != itemTheme.insets || next.offset != itemTheme.offset;

        itemTheme = next;
        if (!geometryChanged && layout.has_value())
            return;

        if (minimized)
            setSize(getWidth(), collapsedHeight());

        layoutView();
        updateLayout();
    }

    void ListCanvasItem::updateLayout()
    {
        auto& adapter = canvas.adapter();

        TitleBarRequest request;
        request.fontHeight = titleFontHeight();
        request.itemSize = { getWidth(), getHeight() };
        request.insets = itemTheme.insets;
        request.offset = itemTheme.offset;
        request.showClose = canvas.isOperationAllowed(CanvasOperation::close) && adapter.getCanDelete(*item);
        request.showMinimize = canvas.isOperationAllowed(CanvasOperation::minimize);
        request.showDrag = canvas.isOperationAllowed(CanvasOperation::drag) && adapter.getCanDrag(*item);
        request.showClone = canvas.isOperationAllowed(CanvasOperation::clone) && adapter.getCanClone(*item);

        layout = computeTitleBarLayout(request);
    }

    void ListCanvasItem::updateCursor(juce::Point<int> localPoint)
    {
        if (dragMode != DragMode::none)
            return;

        setMouseCursor(Interaction::DragModeEngine::cursorFor(dragModeAt(localPoint)));
    }

    void ListCanvasItem::layoutView()
    {
        if (viewComponent == nullptr)
            return;

        viewComponent->setBounds(itemTheme.insets.subtractedFrom(getLocalBounds()));
    }

    int ListCanvasItem::collapsedHeight() const noexcept
    {
        return itemTheme.insets.getTopAndBottom();
    }

    bool ListCanvasItem::isFromView(const juce::MouseEvent& event) const noexcept
    {
        return event.eventComponent != this;
    }
}
