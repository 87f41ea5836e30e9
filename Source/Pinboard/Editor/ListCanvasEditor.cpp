#include "Pinboard/Public/ListCanvasEditor.h"

namespace Pinboard
{
    ListCanvasEditor::ListCanvasEditor(const ListCanvasEditorSettings& settings, CanvasObjectList& listIn)
        : canvasAdapter(settings.adapter != nullptr ? settings.adapter : std::make_shared<ListCanvasAdapter>()),
          list(listIn)
    {
        const auto& themes = settings.themes != nullptr ? *settings.themes : defaultThemeRegistry();
        listCanvas = std::make_unique<Ui::Canvas::ListCanvas>(*canvasAdapter, themes, settings.scrollable);
        listCanvas->setSettings(settings.canvas);
        listCanvas->setAddTypes(settings.addTypes);
        listCanvas->setObjectRequestCallback([this](const Ui::Canvas::ObjectRequest& request)
                                             {
                                                 handleRequest(request);
                                             });
        addAndMakeVisible(*listCanvas);

        list.addListener(this);
    }

    ListCanvasEditor::~ListCanvasEditor()
    {
        list.removeListener(this);
        listCanvas->setObjectRequestCallback(nullptr);
        listCanvas->replaceItems({});
    }

    Ui::Canvas::ListCanvas& ListCanvasEditor::canvas() noexcept
    {
        return *listCanvas;
    }

    const Ui::Canvas::ListCanvas& ListCanvasEditor::canvas() const noexcept
    {
        return *listCanvas;
    }

    ListCanvasAdapter& ListCanvasEditor::adapter() noexcept
    {
        return *canvasAdapter;
    }

    CanvasObjectList& ListCanvasEditor::objectList() noexcept
    {
        return list;
    }

    bool ListCanvasEditor::isBound() const noexcept
    {
        return bound;
    }

    void ListCanvasEditor::setDropOnItemHandler(DropOnItemHandler handler)
    {
        onDropOnItem = std::move(handler);
    }

    void ListCanvasEditor::resized()
    {
        listCanvas->setBounds(getLocalBounds());
        bindIfReady();
    }

    void ListCanvasEditor::canvasObjectsReplaced(CanvasObjectList&,
                                                 int index,
                                                 const CanvasObjects& removed,
                                                 const CanvasObjects& added)
    {
        // Before binding the whole list is loaded at once, so single events can be skipped.
        if (!bound)
            return;

        if (index < 0 || index + static_cast<int>(removed.size()) > listCanvas->getNumItems())
        {
            DBG("[Pinboard][Editor] list event out of range at " + juce::String(index) + ", reloading");
            listCanvas->replaceItems(createItems(list.objects()));
            return;
        }

        listCanvas->replaceItems(createItems(added), index, index + static_cast<int>(removed.size()));
    }

    void ListCanvasEditor::bindIfReady()
    {
        if (bound || listCanvas->getWidth() <= 0 || listCanvas->getHeight() <= 0)
            return;

        bound = true;
        listCanvas->replaceItems(createItems(list.objects()));
    }

    Ui::Canvas::ListCanvas::ItemList ListCanvasEditor::createItems(const CanvasObjects& objects)
    {
        Ui::Canvas::ListCanvas::ItemList created;
        created.reserve(objects.size());
        for (const auto& object : objects)
        {
            if (auto item = listCanvas->createItem(object))
                created.push_back(std::move(item));
        }
        return created;
    }

    void ListCanvasEditor::handleRequest(const Ui::Canvas::ObjectRequest& request)
    {
        using Ui::Canvas::ObjectRequestKind;

        switch (request.kind)
        {
            case ObjectRequestKind::add:
                list.add(request.object);
                break;

            case ObjectRequestKind::remove:
                if (!list.remove(request.object.get()))
                    DBG("[Pinboard][Editor] remove request for an object not in the list");
                break;

            case ObjectRequestKind::clone:
            {
                const auto targetIndex = list.indexOf(request.target.get());
                if (targetIndex < 0)
                    list.add(request.object);
                else if (!list.insert(targetIndex + 1, request.object))
                    DBG("[Pinboard][Editor] clone insert failed");
                break;
            }

            case ObjectRequestKind::dropOnItem:
                if (onDropOnItem == nullptr || !onDropOnItem(request.target, request.object))
                    DBG("[Pinboard][Editor] drop onto item not handled");
                break;
        }
    }

    std::unique_ptr<ListCanvasEditor> createEditor(const ListCanvasEditorSettings& settings, CanvasObjectList& list)
    {
        return std::make_unique<ListCanvasEditor>(settings, list);
    }
}
