#pragma once

#include "Pinboard/Adapter/ListCanvasAdapter.h"
#include "Pinboard/Core/CanvasObjectList.h"
#include "Pinboard/Editor/Canvas/ListCanvas.h"
#include "Pinboard/Public/Types.h"
#include "Pinboard/Theme/ItemTheme.h"
#include <JuceHeader.h>
#include <functional>
#include <memory>
#include <vector>

namespace Pinboard
{
    struct ListCanvasEditorSettings
    {
        // A plain ListCanvasAdapter is used when none is given.
        std::shared_ptr<ListCanvasAdapter> adapter;
        // defaultThemeRegistry() when null. Must outlive the editor.
        const ThemeRegistry* themes = nullptr;
        CanvasSettings canvas;
        std::vector<Ui::Canvas::AddType> addTypes;
        bool scrollable = false;
    };

    // Keeps a ListCanvas in step with a CanvasObjectList and applies the canvas's object requests
    // back to the list.
    class ListCanvasEditor : public juce::Component,
                             private CanvasObjectList::Listener
    {
    public:
        // Receives (item object, dropped object) for drops onto an item. Returns whether it was handled.
        using DropOnItemHandler = std::function<bool(CanvasObject::Ptr, CanvasObject::Ptr)>;

        ListCanvasEditor(const ListCanvasEditorSettings& settings, CanvasObjectList& listIn);
        ~ListCanvasEditor() override;

        Ui::Canvas::ListCanvas& canvas() noexcept;
        const Ui::Canvas::ListCanvas& canvas() const noexcept;
        ListCanvasAdapter& adapter() noexcept;
        CanvasObjectList& objectList() noexcept;

        // False until the canvas has been given a size and has loaded the list.
        bool isBound() const noexcept;

        void setDropOnItemHandler(DropOnItemHandler handler);

        void resized() override;

    private:
        void canvasObjectsReplaced(CanvasObjectList& list,
                                   int index,
                                   const CanvasObjects& removed,
                                   const CanvasObjects& added) override;

        void bindIfReady();
        Ui::Canvas::ListCanvas::ItemList createItems(const CanvasObjects& objects);
        void handleRequest(const Ui::Canvas::ObjectRequest& request);

        std::shared_ptr<ListCanvasAdapter> canvasAdapter;
        CanvasObjectList& list;
        std::unique_ptr<Ui::Canvas::ListCanvas> listCanvas;
        DropOnItemHandler onDropOnItem;
        bool bound = false;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ListCanvasEditor)
    };

    std::unique_ptr<ListCanvasEditor> createEditor(const ListCanvasEditorSettings& settings, CanvasObjectList& list);
}
