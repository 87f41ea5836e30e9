#include "Pinboard/Editor/Canvas/ListCanvas.h"

#include <algorithm>
#include <map>

namespace Pinboard::Ui::Canvas
{
    namespace
    {
        constexpr int kStatusLineHeight = 22;

        void showCloseConfirmation(ListCanvasItem& item, std::function<void(bool)> done)
        {
            const auto title = item.title().trim();
            juce::AlertWindow::showAsync(juce::MessageBoxOptions()
                                             .withIconType(juce::MessageBoxIconType::QuestionIcon)
                                             .withTitle("Close " + title)
                                             .withMessage("'" + title + "' has unsaved changes. Close it anyway?")
                                             .withButton("OK")
                                             .withButton("Cancel")
                                             .withAssociatedComponent(&item),
                                         [done = std::move(done)](int result)
                                         {
                                             if (done != nullptr)
                                                 done(result == 1);
                                         });
        }
    }

    class ListCanvas::Surface : public juce::Component
    {
    public:
        explicit Surface(ListCanvas& ownerIn)
            : owner(ownerIn)
        {
            setOpaque(true);
        }

        void paint(juce::Graphics& g) override
        {
            owner.paintSurface(g, getLocalBounds());
        }

        void mouseDown(const juce::MouseEvent& event) override
        {
            if (event.mods.isPopupMenu())
                owner.showContextMenu();
        }

    private:
        ListCanvas& owner;
    };

    ListCanvas::ListCanvas(ListCanvasAdapter& adapterIn, const ThemeRegistry& themesIn, bool scrollableIn)
        : canvasAdapter(adapterIn),
          themeRegistry(themesIn),
          scrollable(scrollableIn),
          surfaceComponent(std::make_unique<Surface>(*this))
    {
        if (scrollable)
        {
            viewport.setViewedComponent(surfaceComponent.get(), false);
            viewport.setScrollBarsShown(true, true);
            addAndMakeVisible(viewport);
        }
        else
        {
            addAndMakeVisible(*surfaceComponent);
        }

        statusLabel.setColour(juce::Label::backgroundColourId, juce::Colour::fromRGB(24, 28, 34));
        statusLabel.setColour(juce::Label::textColourId, juce::Colour::fromRGB(178, 186, 200));
        statusLabel.setJustificationType(juce::Justification::centredLeft);
        statusLabel.setFont(juce::Font(juce::FontOptions(12.0f)));
        addChildComponent(statusLabel);

        closeConfirmation = showCloseConfirmation;

        canvasAdapter.setStatusChangedCallback([safe = juce::Component::SafePointer<ListCanvas>(this)](const juce::String&)
                                               {
                                                   if (safe != nullptr)
                                                       safe->updateStatusLine();
                                               },
                                               this);
    }

    ListCanvas::~ListCanvas()
    {
        canvasAdapter.clearStatusChangedCallback(this);
        active = nullptr;
        draggedItem = nullptr;
        items.clear();
        viewport.setViewedComponent(nullptr, false);
    }

    ListCanvasAdapter& ListCanvas::adapter() const noexcept
    {
        return canvasAdapter;
    }

    const ThemeRegistry& ListCanvas::themes() const noexcept
    {
        return themeRegistry;
    }

    const CanvasRenderer& ListCanvas::renderer() const noexcept
    {
        return canvasRenderer;
    }

    void ListCanvas::setSettings(const CanvasSettings& settingsIn)
    {
        canvasSettings = settingsIn;
        canvasSettings.snap = clamped(canvasSettings.snap);
        canvasSettings.grid = clamped(canvasSettings.grid);

        for (const auto& item : items)
            item->refresh();

        updateStatusLine();
        surfaceComponent->repaint();
    }

    const CanvasSettings& ListCanvas::settings() const noexcept
    {
        return canvasSettings;
    }

    void ListCanvas::setSnapInfo(const SnapInfo& info)
    {
        canvasSettings.snap = clamped(info);
        surfaceComponent->repaint();
    }

    void ListCanvas::setGridInfo(const GridInfo& info)
    {
        canvasSettings.grid = clamped(info);
        surfaceComponent->repaint();
    }

    void ListCanvas::setGuideInfo(const GuideInfo& info)
    {
        canvasSettings.guide = info;
        surfaceComponent->repaint();
    }

    void ListCanvas::setOperations(const CanvasOperations& operations)
    {
        auto next = canvasSettings;
        next.operations = operations;
        setSettings(next);
    }

    bool ListCanvas::isOperationAllowed(CanvasOperation operation) const noexcept
    {
        return canvasSettings.operations.contains(operation);
    }

    void ListCanvas::setAddTypes(std::vector<AddType> types)
    {
        addTypeList = std::move(types);
    }

    const std::vector<AddType>& ListCanvas::addTypes() const noexcept
    {
        return addTypeList;
    }

    bool ListCanvas::isScrollable() const noexcept
    {
        return scrollable;
    }

    juce::Component& ListCanvas::surface() noexcept
    {
        return *surfaceComponent;
    }

    juce::Point<int> ListCanvas::surfaceSize() const noexcept
    {
        return { surfaceComponent->getWidth(), surfaceComponent->getHeight() };
    }

    juce::Point<int> ListCanvas::placementSize() const noexcept
    {
        if (scrollable)
            return { viewport.getMaximumVisibleWidth(), viewport.getMaximumVisibleHeight() };

        return surfaceSize();
    }

    std::unique_ptr<ListCanvasItem> ListCanvas::createItem(CanvasObject::Ptr object)
    {
        if (object == nullptr)
            return {};

        return std::make_unique<ListCanvasItem>(*this, std::move(object));
    }

    void ListCanvas::replaceItems(ItemList newItems, int first, int last)
    {
        const auto count = getNumItems();
        if (last < 0 || last > count)
            last = count;
        first = juce::jlimit(0, last, first);

        for (auto i = first; i < last; ++i)
        {
            const auto* removed = items[static_cast<size_t>(i)].get();
            if (removed == active)
                active = nullptr;

            if (removed == draggedItem)
            {
                draggedItem = nullptr;
                activeDragMode = DragMode::none;
                canvasState = CanvasState::normal;
                snap.clearGuides();
            }
        }

        items.erase(items.begin() + first, items.begin() + last);

        auto insertAt = first;
        for (auto& item : newItems)
        {
            if (item == nullptr)
                continue;

            initialisePosition(*item, itemBounds());
            surfaceComponent->addAndMakeVisible(*item);
            items.insert(items.begin() + insertAt, std::move(item));
            ++insertAt;
        }

        adjustSize();
        surfaceComponent->repaint();
        notifyStateChanged();
    }

    int ListCanvas::getNumItems() const noexcept
    {
        return static_cast<int>(items.size());
    }

    ListCanvasItem* ListCanvas::itemAt(int index) const noexcept
    {
        if (index < 0 || index >= getNumItems())
            return nullptr;

        return items[static_cast<size_t>(index)].get();
    }

    ListCanvasItem* ListCanvas::itemFor(const CanvasObject* object) const noexcept
    {
        for (const auto& item : items)
        {
            if (&item->object() == object)
                return item.get();
        }

        return nullptr;
    }

    ListCanvasItem* ListCanvas::itemAtPoint(juce::Point<int> surfacePoint) const noexcept
    {
        // Child order is the z-order, topmost last.
        for (auto i = surfaceComponent->getNumChildComponents(); --i >= 0;)
        {
            auto* child = surfaceComponent->getChildComponent(i);
            if (!child->isVisible() || !child->getBounds().contains(surfacePoint))
                continue;

            if (auto* item = dynamic_cast<ListCanvasItem*>(child); item != nullptr && indexOf(item) >= 0)
                return item;
        }

        return nullptr;
    }

    int ListCanvas::indexOf(const ListCanvasItem* item) const noexcept
    {
        const auto it = std::find_if(items.begin(),
                                     items.end(),
                                     [item](const std::unique_ptr<ListCanvasItem>& candidate)
                                     {
                                         return candidate.get() == item;
                                     });
        return it == items.end() ? -1 : static_cast<int>(std::distance(items.begin(), it));
    }

    void ListCanvas::activate(ListCanvasItem* item)
    {
        if (item == active)
            return;

        if (active != nullptr)
        {
            auto* previous = active;
            active = nullptr;
            previous->setState(ItemState::inactive);
            canvasAdapter.setDeactivated(previous->object());
        }

        active = item;
        if (item != nullptr)
        {
            item->setState(ItemState::active);
            canvasAdapter.setActivated(item->object());
        }

        notifyStateChanged();
    }

    ListCanvasItem* ListCanvas::activeItem() const noexcept
    {
        return active;
    }

    void ListCanvas::beginDrag(ListCanvasItem& item, int mode, juce::Point<int> surfacePoint)
    {
        if (mode == DragMode::none || indexOf(&item) < 0)
            return;

        draggedItem = &item;
        activeDragMode = mode;
        dragStartBounds = item.getBounds();
        dragStartPoint = surfacePoint;
        canvasState = CanvasState::dragging;

        snap.setSettings(Interaction::makeSnapSettings(canvasSettings.snap, canvasSettings.grid, canvasSettings.guide));
        if (canvasSettings.snap.distance > 0 && canvasSettings.guide.snapping)
            snap.setGuides(guideLines());
        else
            snap.clearGuides();

        refreshForDrag(true);
        notifyStateChanged();
    }

    void ListCanvas::dragTo(juce::Point<int> surfacePoint)
    {
        if (draggedItem == nullptr)
            return;

        const auto next = Interaction::DragModeEngine::apply(activeDragMode,
                                                              dragStartBounds,
                                                              surfacePoint - dragStartPoint,
                                                              snap);
        if (next != draggedItem->getBounds())
            draggedItem->setBounds(next);
    }

    void ListCanvas::endDrag()
    {
        if (canvasState != CanvasState::dragging)
            return;

        draggedItem = nullptr;
        activeDragMode = DragMode::none;
        snap.clearGuides();
        canvasState = CanvasState::normal;
        refreshForDrag(false);

        for (const auto& item : items)
            item->repaint();

        adjustSize();
        notifyStateChanged();
    }

    CanvasState ListCanvas::state() const noexcept
    {
        return canvasState;
    }

    ListCanvasItem* ListCanvas::dragItem() const noexcept
    {
        return draggedItem;
    }

    const Interaction::SnapEngine& ListCanvas::snapEngine() const noexcept
    {
        return snap;
    }

    bool ListCanvas::isGridVisible() const noexcept
    {
        const auto visible = canvasSettings.grid.visible;
        return visible == VisibilityMode::always
            || (visible == VisibilityMode::drag && canvasState == CanvasState::dragging);
    }

    bool ListCanvas::areGuidesVisible() const noexcept
    {
        const auto visible = canvasSettings.guide.visible;
        return visible == VisibilityMode::always
            || (visible == VisibilityMode::drag && canvasState == CanvasState::dragging && !items.empty());
    }

    Interaction::GuideLines ListCanvas::guideLines() const
    {
        std::optional<size_t> skip;
        if (const auto index = indexOf(draggedItem); index >= 0)
            skip = static_cast<size_t>(index);

        return placement.guideLines(surfaceSize(), itemBounds(), skip);
    }

    bool ListCanvas::requestClose(ListCanvasItem& item)
    {
        if (!isOperationAllowed(CanvasOperation::close))
        {
            DBG("[Pinboard][Canvas] close rejected: operation disabled");
            return false;
        }

        const auto object = item.objectPtr();
        switch (canvasAdapter.getCanClose(*object))
        {
            case CloseBehaviour::allowed:
                closeObject(object);
                return true;

            case CloseBehaviour::denied:
                showStatus("'" + item.title().trim() + "' cannot be closed.");
                return false;

            case CloseBehaviour::modified:
                if (closeConfirmation == nullptr)
                    return false;

                closeConfirmation(item,
                                  [safe = juce::Component::SafePointer<ListCanvas>(this), object](bool confirmed)
                                  {
                                      if (confirmed && safe != nullptr)
                                          safe->closeObject(object);
                                  });
                return true;
        }

        return false;
    }

    bool ListCanvas::requestClone(ListCanvasItem& item)
    {
        if (!isOperationAllowed(CanvasOperation::clone))
            return false;

        const auto clone = canvasAdapter.getClone(item.object());
        if (clone == nullptr)
        {
            showStatus("'" + item.title().trim() + "' cannot be cloned.");
            return false;
        }

        emitRequest({ ObjectRequestKind::clone, clone, item.objectPtr() });
        return true;
    }

    bool ListCanvas::startDragOut(ListCanvasItem& item)
    {
        if (!isOperationAllowed(CanvasOperation::drag) || isDragAndDropActive())
            return false;

        auto payload = canvasAdapter.getDrag(item.object());
        if (payload == nullptr)
            payload = item.objectPtr();

        startDragging(objectToVar(payload), &item);
        return true;
    }

    bool ListCanvas::addObject(CanvasObject::Ptr object)
    {
        if (object == nullptr)
            return false;

        emitRequest({ ObjectRequestKind::add, object, {} });
        return true;
    }

    int ListCanvas::clearObjects()
    {
        if (!isOperationAllowed(CanvasOperation::clear))
            return 0;

        std::vector<CanvasObject::Ptr> closing;
        for (const auto& item : items)
        {
            if (canvasAdapter.getCanClose(item->object()) != CloseBehaviour::denied)
                closing.push_back(item->objectPtr());
        }

        for (const auto& object : closing)
            closeObject(object);

        return static_cast<int>(closing.size());
    }

    bool ListCanvas::acceptsDrop(CanvasObject* dropped, juce::Point<int> surfacePoint)
    {
        if (dropped == nullptr || !isOperationAllowed(CanvasOperation::drop))
            return false;

        auto* target = itemAtPoint(surfacePoint);
        if (target != nullptr && &target->object() == dropped)
            return false;

        // Dropping an item back onto its own canvas background would duplicate it.
        if (target == nullptr && itemFor(dropped) != nullptr)
            return false;

        return canvasAdapter.getCanDrop(target != nullptr ? &target->object() : nullptr, dropped);
    }

    bool ListCanvas::dropObject(CanvasObject::Ptr dropped, juce::Point<int> surfacePoint)
    {
        if (!acceptsDrop(dropped.get(), surfacePoint))
            return false;

        if (auto* target = itemAtPoint(surfacePoint))
            emitRequest({ ObjectRequestKind::dropOnItem, dropped, target->objectPtr() });
        else
            emitRequest({ ObjectRequestKind::add, dropped, {} });

        return true;
    }

    Serialization::CanvasLayout ListCanvas::captureLayout()
    {
        Serialization::CanvasLayout layout;
        for (const auto& item : items)
        {
            const auto uniqueId = canvasAdapter.getUniqueId(item->object());
            if (uniqueId.isEmpty())
                continue;

            layout.push_back({ uniqueId, item->expandedBounds(), item->isMinimized() });
        }

        return layout;
    }

    int ListCanvas::applyLayout(const Serialization::CanvasLayout& layout)
    {
        std::map<juce::String, ListCanvasItem*> itemsById;
        for (const auto& item : items)
        {
            const auto uniqueId = canvasAdapter.getUniqueId(item->object());
            if (uniqueId.isNotEmpty())
                itemsById[uniqueId] = item.get();
        }

        auto moved = 0;
        for (const auto& entry : layout)
        {
            const auto it = itemsById.find(entry.uniqueId);
            if (it == itemsById.end())
                continue;

            auto* item = it->second;
            item->setMinimized(false);
            item->setBounds(entry.bounds);
            item->setMinimized(entry.minimized);
            ++moved;
        }

        adjustSize();
        surfaceComponent->repaint();
        return moved;
    }

    juce::Result ListCanvas::saveLayout(const juce::File& file)
    {
        if (!isOperationAllowed(CanvasOperation::save))
            return juce::Result::fail("Saving layouts is not allowed on this canvas");

        const auto result = Serialization::saveLayoutToFile(file, captureLayout());
        if (result.failed())
            DBG("[Pinboard][Canvas] layout save failed: " + result.getErrorMessage());
        return result;
    }

    juce::Result ListCanvas::loadLayout(const juce::File& file)
    {
        if (!isOperationAllowed(CanvasOperation::load))
            return juce::Result::fail("Loading layouts is not allowed on this canvas");

        Serialization::CanvasLayout layout;
        const auto result = Serialization::loadLayoutFromFile(file, layout);
        if (result.failed())
        {
            DBG("[Pinboard][Canvas] layout load failed: " + result.getErrorMessage());
            return result;
        }

        const auto moved = applyLayout(layout);
        showStatus("Restored layout of " + juce::String(moved) + " item(s).");
        return juce::Result::ok();
    }

    juce::PopupMenu ListCanvas::createContextMenu()
    {
        juce::PopupMenu menu;
        const auto safe = juce::Component::SafePointer<ListCanvas>(this);

        if (isOperationAllowed(CanvasOperation::add))
        {
            for (const auto& type : addTypeList)
            {
                menu.addItem("Add " + type.name,
                             [safe, create = type.create]
                             {
                                 if (safe != nullptr && create != nullptr)
                                     safe->addObject(create());
                             });
            }
        }

        if (isOperationAllowed(CanvasOperation::clear))
        {
            if (menu.getNumItems() > 0)
                menu.addSeparator();

            menu.addItem("Clear",
                         !items.empty(),
                         false,
                         [safe]
                         {
                             if (safe != nullptr)
                                 safe->clearObjects();
                         });
        }

        const auto canSave = isOperationAllowed(CanvasOperation::save);
        const auto canLoad = isOperationAllowed(CanvasOperation::load);
        if ((canSave || canLoad) && menu.getNumItems() > 0)
            menu.addSeparator();

        if (canSave)
        {
            menu.addItem("Save Layout...",
                         [safe]
                         {
                             if (safe != nullptr)
                                 safe->chooseLayoutFile(true);
                         });
        }

        if (canLoad)
        {
            menu.addItem("Load Layout...",
                         [safe]
                         {
                             if (safe != nullptr)
                                 safe->chooseLayoutFile(false);
                         });
        }

        return menu;
    }

    void ListCanvas::showContextMenu()
    {
        auto menu = createContextMenu();
        if (menu.getNumItems() == 0)
            return;

        menu.showMenuAsync(juce::PopupMenu::Options().withTargetComponent(surfaceComponent.get()).withMousePosition());
    }

    void ListCanvas::setObjectRequestCallback(std::function<void(const ObjectRequest&)> callback)
    {
        onObjectRequest = std::move(callback);
    }

    void ListCanvas::setCloseConfirmation(CloseConfirmation confirmation)
    {
        closeConfirmation = std::move(confirmation);
    }

    void ListCanvas::setStateChangedCallback(std::function<void()> callback)
    {
        onStateChanged = std::move(callback);
    }

    juce::String ListCanvas::statusText() const
    {
        return canvasAdapter.status();
    }

    void ListCanvas::resized()
    {
        layoutSurface();
    }

    bool ListCanvas::isInterestedInDragSource(const juce::DragAndDropTarget::SourceDetails& dragSourceDetails)
    {
        const auto dropped = objectFromVar(dragSourceDetails.description);
        const auto point = surfaceComponent->getLocalPoint(this, dragSourceDetails.localPosition.toInt());
        return acceptsDrop(dropped.get(), point);
    }

    void ListCanvas::itemDropped(const juce::DragAndDropTarget::SourceDetails& dragSourceDetails)
    {
        const auto dropped = objectFromVar(dragSourceDetails.description);
        const auto point = surfaceComponent->getLocalPoint(this, dragSourceDetails.localPosition.toInt());
        if (!dropObject(dropped, point))
            DBG("[Pinboard][Canvas] drop rejected");
    }

    void ListCanvas::paintSurface(juce::Graphics& g, juce::Rectangle<int> bounds)
    {
        canvasRenderer.paintBackground(g, bounds);

        if (isGridVisible())
            canvasRenderer.paintGrid(g, bounds, canvasSettings.grid);

        if (areGuidesVisible())
            canvasRenderer.paintGuides(g, bounds, canvasSettings.guide, guideLines());
    }

    void ListCanvas::refreshForDrag(bool starting)
    {
        const auto guideVisible = canvasSettings.guide.visible;
        if (canvasSettings.grid.visible == VisibilityMode::drag
            || guideVisible == VisibilityMode::drag
            || (!starting && guideVisible == VisibilityMode::always))
        {
            surfaceComponent->repaint();
        }
    }

    void ListCanvas::adjustSize()
    {
        if (!scrollable)
            return;

        const auto extent = placement.contentExtent(itemBounds());
        surfaceComponent->setSize(std::max(extent.x, viewport.getMaximumVisibleWidth()),
                                  std::max(extent.y, viewport.getMaximumVisibleHeight()));
    }

    void ListCanvas::layoutSurface()
    {
        auto area = getLocalBounds();
        if (statusLabel.isVisible())
            statusLabel.setBounds(area.removeFromBottom(kStatusLineHeight));

        if (scrollable)
        {
            viewport.setBounds(area);
            adjustSize();
        }
        else
        {
            surfaceComponent->setBounds(area);
        }
    }

    std::vector<juce::Rectangle<int>> ListCanvas::itemBounds() const
    {
        std::vector<juce::Rectangle<int>> bounds;
        bounds.reserve(items.size());
        for (const auto& item : items)
            bounds.push_back(item->getBounds());
        return bounds;
    }

    void ListCanvas::initialisePosition(ListCanvasItem& item, const std::vector<juce::Rectangle<int>>& existing)
    {
        Interaction::PlacementRequest request;
        request.requestedSize = canvasAdapter.getSize(item.object());
        request.requestedPosition = canvasAdapter.getPosition(item.object());
        request.bestSize = item.bestSize();
        request.canvasSize = placementSize();
        item.setBounds(placement.resolveBounds(request, existing));
    }

    void ListCanvas::closeObject(CanvasObject::Ptr object)
    {
        if (object == nullptr || itemFor(object.get()) == nullptr)
            return;

        canvasAdapter.setClosed(*object);
        emitRequest({ ObjectRequestKind::remove, object, {} });
    }

    void ListCanvas::emitRequest(const ObjectRequest& request)
    {
        if (onObjectRequest == nullptr)
        {
            DBG("[Pinboard][Canvas] object request ignored: no host attached");
            return;
        }

        onObjectRequest(request);
    }

    void ListCanvas::showStatus(const juce::String& text)
    {
        DBG("[Pinboard][Canvas] " + text);
        canvasAdapter.setStatus(text);
    }

    void ListCanvas::updateStatusLine()
    {
        const auto text = canvasAdapter.status();
        const auto shouldShow = isOperationAllowed(CanvasOperation::status) && text.isNotEmpty();

        statusLabel.setText(text, juce::dontSendNotification);
        if (statusLabel.isVisible() != shouldShow)
        {
            statusLabel.setVisible(shouldShow);
            layoutSurface();
        }
    }

    void ListCanvas::notifyStateChanged()
    {
        if (onStateChanged != nullptr)
            onStateChanged();
    }

    void ListCanvas::chooseLayoutFile(bool saving)
    {
        if (pendingFileChooser != nullptr)
            return;

        pendingFileChooser = std::make_unique<juce::FileChooser>(saving ? "Save canvas layout" : "Load canvas layout",
                                                                 juce::File::getSpecialLocation(juce::File::userDocumentsDirectory),
                                                                 "*.json");
        const auto chooserFlags = saving
                                      ? juce::FileBrowserComponent::saveMode
                                            | juce::FileBrowserComponent::canSelectFiles
                                            | juce::FileBrowserComponent::warnAboutOverwriting
                                      : juce::FileBrowserComponent::openMode
                                            | juce::FileBrowserComponent::canSelectFiles;

        pendingFileChooser->launchAsync(chooserFlags,
                                        [safe = juce::Component::SafePointer<ListCanvas>(this), saving](const juce::FileChooser& chooser)
                                        {
                                            if (safe == nullptr)
                                                return;

                                            const auto file = chooser.getResult();
                                            safe->pendingFileChooser.reset();
                                            if (file == juce::File())
                                                return;

                                            const auto result = saving ? safe->saveLayout(file) : safe->loadLayout(file);
                                            if (result.failed())
                                                safe->showStatus(result.getErrorMessage());
                                        });
    }
}
