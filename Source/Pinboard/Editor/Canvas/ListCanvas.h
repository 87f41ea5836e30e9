#pragma once

#include "Pinboard/Adapter/ListCanvasAdapter.h"
#include "Pinboard/Editor/Canvas/CanvasRenderer.h"
#include "Pinboard/Editor/Canvas/ListCanvasItem.h"
#include "Pinboard/Editor/Interaction/DragModeEngine.h"
#include "Pinboard/Editor/Interaction/PlacementEngine.h"
#include "Pinboard/Editor/Interaction/SnapEngine.h"
#include "Pinboard/Public/Types.h"
#include "Pinboard/Serialization/CanvasJson.h"
#include "Pinboard/Theme/ItemTheme.h"
#include <JuceHeader.h>
#include <functional>
#include <memory>
#include <vector>

namespace Pinboard::Ui::Canvas
{
    enum class ObjectRequestKind
    {
        add,
        remove,
        clone,
        dropOnItem
    };

    // A change the canvas wants its host to make to the bound object list.
    struct ObjectRequest
    {
        ObjectRequestKind kind = ObjectRequestKind::add;
        CanvasObject::Ptr object;
        CanvasObject::Ptr target;   // dropOnItem only
    };

    // An entry of the "Add" context menu.
    struct AddType
    {
        juce::String name;
        std::function<CanvasObject::Ptr()> create;
    };

    class ListCanvas : public juce::Component,
                       public juce::DragAndDropContainer,
                       public juce::DragAndDropTarget
    {
    public:
        using ItemList = std::vector<std::unique_ptr<ListCanvasItem>>;
        using CloseConfirmation = std::function<void(ListCanvasItem&, std::function<void(bool)>)>;

        ListCanvas(ListCanvasAdapter& adapterIn, const ThemeRegistry& themesIn, bool scrollableIn = false);
        ~ListCanvas() override;

        ListCanvasAdapter& adapter() const noexcept;
        const ThemeRegistry& themes() const noexcept;
        const CanvasRenderer& renderer() const noexcept;

        void setSettings(const CanvasSettings& settingsIn);
        const CanvasSettings& settings() const noexcept;
        void setSnapInfo(const SnapInfo& info);
        void setGridInfo(const GridInfo& info);
        void setGuideInfo(const GuideInfo& info);
        void setOperations(const CanvasOperations& operations);
        bool isOperationAllowed(CanvasOperation operation) const noexcept;

        void setAddTypes(std::vector<AddType> types);
        const std::vector<AddType>& addTypes() const noexcept;

        bool isScrollable() const noexcept;
        juce::Component& surface() noexcept;
        juce::Point<int> surfaceSize() const noexcept;
        // Visible canvas area used to place new items.
        juce::Point<int> placementSize() const noexcept;

        std::unique_ptr<ListCanvasItem> createItem(CanvasObject::Ptr object);

        // Replaces items [first, last) (last < 0 means the end) with newItems.
        void replaceItems(ItemList newItems, int first = 0, int last = -1);
        int getNumItems() const noexcept;
        ListCanvasItem* itemAt(int index) const noexcept;
        ListCanvasItem* itemFor(const CanvasObject* object) const noexcept;
        ListCanvasItem* itemAtPoint(juce::Point<int> surfacePoint) const noexcept;
        int indexOf(const ListCanvasItem* item) const noexcept;

        void activate(ListCanvasItem* item);
        ListCanvasItem* activeItem() const noexcept;

        void beginDrag(ListCanvasItem& item, int mode, juce::Point<int> surfacePoint);
        void dragTo(juce::Point<int> surfacePoint);
        void endDrag();
        CanvasState state() const noexcept;
        ListCanvasItem* dragItem() const noexcept;
        const Interaction::SnapEngine& snapEngine() const noexcept;

        bool isGridVisible() const noexcept;
        bool areGuidesVisible() const noexcept;
        // Canvas border plus the edges of every item except the one being dragged.
        Interaction::GuideLines guideLines() const;

        bool requestClose(ListCanvasItem& item);
        bool requestClone(ListCanvasItem& item);
        bool startDragOut(ListCanvasItem& item);
        bool addObject(CanvasObject::Ptr object);
        int clearObjects();
        bool acceptsDrop(CanvasObject* dropped, juce::Point<int> surfacePoint);
        bool dropObject(CanvasObject::Ptr dropped, juce::Point<int> surfacePoint);

        Serialization::CanvasLayout captureLayout();
        int applyLayout(const Serialization::CanvasLayout& layout);
        juce::Result saveLayout(const juce::File& file);
        juce::Result loadLayout(const juce::File& file);

        juce::PopupMenu createContextMenu();
        void showContextMenu();

        void setObjectRequestCallback(std::function<void(const ObjectRequest&)> callback);
        void setCloseConfirmation(CloseConfirmation confirmation);
        void setStateChangedCallback(std::function<void()> callback);

        juce::String statusText() const;

        void resized() override;

        bool isInterestedInDragSource(const juce::DragAndDropTarget::SourceDetails& dragSourceDetails) override;
        void itemDropped(const juce::DragAndDropTarget::SourceDetails& dragSourceDetails) override;

    private:
        class Surface;

        void paintSurface(juce::Graphics& g, juce::Rectangle<int> bounds);
        void refreshForDrag(bool starting);
        void adjustSize();
        void layoutSurface();
        std::vector<juce::Rectangle<int>> itemBounds() const;
        void initialisePosition(ListCanvasItem& item, const std::vector<juce::Rectangle<int>>& existing);
        void closeObject(CanvasObject::Ptr object);
        void emitRequest(const ObjectRequest& request);
        void showStatus(const juce::String& text);
        void updateStatusLine();
        void notifyStateChanged();
        void chooseLayoutFile(bool saving);

        ListCanvasAdapter& canvasAdapter;
        const ThemeRegistry& themeRegistry;
        CanvasRenderer canvasRenderer;
        Interaction::PlacementEngine placement;
        Interaction::SnapEngine snap;
        CanvasSettings canvasSettings;
        std::vector<AddType> addTypeList;
        bool scrollable = false;

        std::unique_ptr<Surface> surfaceComponent;
        juce::Viewport viewport;
        juce::Label statusLabel;

        ItemList items;
        ListCanvasItem* active = nullptr;

        CanvasState canvasState = CanvasState::normal;
        ListCanvasItem* draggedItem = nullptr;
        int activeDragMode = DragMode::none;
        juce::Rectangle<int> dragStartBounds;
        juce::Point<int> dragStartPoint;

        std::function<void(const ObjectRequest&)> onObjectRequest;
        CloseConfirmation closeConfirmation;
        std::function<void()> onStateChanged;
        std::unique_ptr<juce::FileChooser> pendingFileChooser;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ListCanvas)
    };
}
