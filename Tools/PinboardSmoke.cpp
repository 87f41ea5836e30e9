#include <JuceHeader.h>

#include "Pinboard/Adapter/ListCanvasAdapter.h"
#include "Pinboard/Core/CanvasObjectList.h"
#include "Pinboard/Editor/Canvas/ListCanvas.h"
#include "Pinboard/Editor/Canvas/TitleBarLayout.h"
#include "Pinboard/Editor/Interaction/DragModeEngine.h"
#include "Pinboard/Editor/Interaction/PlacementEngine.h"
#include "Pinboard/Editor/Interaction/SnapEngine.h"
#include "Pinboard/Public/ListCanvasEditor.h"
#include "Pinboard/Serialization/CanvasJson.h"
#include "Pinboard/Theme/ItemTheme.h"

#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <vector>

namespace
{
    using Pinboard::CanvasAttribute;
    using Pinboard::CanvasObject;
    using Pinboard::DragMode;
    using Pinboard::Ui::Canvas::ListCanvas;
    using Pinboard::Ui::Canvas::ObjectRequest;
    using Pinboard::Ui::Canvas::ObjectRequestKind;
    using Pinboard::Ui::Interaction::DragHitRequest;
    using Pinboard::Ui::Interaction::DragModeEngine;
    using Pinboard::Ui::Interaction::SnapEngine;
    using Pinboard::Ui::Interaction::SnapSettings;

    class TestObject : public CanvasObject
    {
    public:
        TestObject(juce::String nameIn, juce::StringArray chainIn = {})
            : name(std::move(nameIn)),
              chain(std::move(chainIn))
        {
        }

        juce::String typeName() const override
        {
            return chain.isEmpty() ? juce::String("Widget") : chain[0];
        }

        juce::StringArray typeChain() const override
        {
            return chain.isEmpty() ? juce::StringArray { typeName() } : chain;
        }

        std::unique_ptr<juce::Component> createView(const juce::String&) override
        {
            return std::make_unique<juce::Component>();
        }

        juce::Rectangle<int> preferredViewSize() const override
        {
            return { 0, 0, 100, 60 };
        }

        juce::String name;

    private:
        juce::StringArray chain;
    };

    class SelfDescribingObject : public TestObject,
                                 public Pinboard::ListCanvasItemProvider
    {
    public:
        using TestObject::TestObject;

        std::optional<juce::var> canvasAttribute(CanvasAttribute attribute, const CanvasObject*) override
        {
            if (attribute == CanvasAttribute::title)
                return juce::var("own title");
            return std::nullopt;
        }
    };

    CanvasObject::Ptr makeObject(const juce::String& name)
    {
        return new TestObject(name);
    }

    juce::String nameOf(const CanvasObject& object)
    {
        if (const auto* test = dynamic_cast<const TestObject*>(&object))
            return test->name;
        return {};
    }

    juce::String describe(juce::Rectangle<int> bounds)
    {
        return bounds.toString();
    }

    // Names every Widget by its name, so layouts can be keyed on it.
    void registerNameIds(Pinboard::ListCanvasAdapter& adapter)
    {
        adapter.registerTypeHandler("Widget",
                                    CanvasAttribute::uniqueId,
                                    [](const Pinboard::AdapterContext& context)
                                    {
                                        return juce::var(nameOf(*context.item));
                                    });
    }

    struct RecordingListener : public Pinboard::CanvasObjectList::Listener
    {
        struct Event
        {
            int index = 0;
            Pinboard::CanvasObjects removed;
            Pinboard::CanvasObjects added;
        };

        void canvasObjectsReplaced(Pinboard::CanvasObjectList&,
                                   int index,
                                   const Pinboard::CanvasObjects& removed,
                                   const Pinboard::CanvasObjects& added) override
        {
            events.push_back({ index, removed, added });
        }

        std::vector<Event> events;
    };

    SnapEngine makeGridSnap(int distance, int gridSize)
    {
        SnapSettings settings;
        settings.distance = distance;
        settings.gridSnapping = true;
        settings.gridSize = gridSize;
        settings.gridOffset = 0;
        settings.guideSnapping = false;
        return SnapEngine(settings, {});
    }

    juce::Result testSnapEngine()
    {
        SnapEngine disabled;
        if (disabled.isEnabled() || disabled.snapX(10, 37) != 37)
            return juce::Result::fail("snap distance 0 must return the delta unchanged");

        const auto grid = makeGridSnap(5, 50);
        if (grid.snapX(10, 37) != 40)
            return juce::Result::fail("grid snap to the following line expected 40, got " + juce::String(grid.snapX(10, 37)));
        if (grid.snapY(0, 52) != 50)
            return juce::Result::fail("grid snap to the preceding line expected 50");
        if (grid.snapX(0, -48) != -50)
            return juce::Result::fail("grid snap must floor negative coordinates");
        if (grid.snapX(0, 20) != 20)
            return juce::Result::fail("positions outside the snap distance must not move");

        SnapSettings guideSettings;
        guideSettings.distance = 5;
        guideSettings.gridSnapping = false;
        Pinboard::Ui::Interaction::GuideLines guides;
        guides.vertical = { 100, 104 };
        const SnapEngine guideSnap(guideSettings, guides);
        if (guideSnap.snapX(0, 102) != 104)
            return juce::Result::fail("equally near guides must resolve to the later guide");
        if (guideSnap.snapX(0, 101) != 100)
            return juce::Result::fail("the nearest guide must win");

        const auto settings = Pinboard::Ui::Interaction::makeSnapSettings({ 99 }, {}, {});
        if (settings.distance != Pinboard::SnapInfo::kMaxDistance)
            return juce::Result::fail("snap distance must be clamped");

        return juce::Result::ok();
    }

    juce::Result testDragModeDecoding()
    {
        DragHitRequest request;
        request.itemSize = { 100, 80 };
        request.titleBarTop = 22;
        request.titleBarBottom = 4;

        const std::vector<std::pair<juce::Point<int>, int>> expectations {
            { { 1, 1 }, DragMode::topLeft },
            { { 99, 1 }, DragMode::topRight },
            { { 1, 79 }, DragMode::bottomLeft },
            { { 99, 79 }, DragMode::bottomRight },
            { { 50, 1 }, DragMode::top },
            { { 50, 78 }, DragMode::bottom },
            { { 2, 40 }, DragMode::left },
            { { 97, 40 }, DragMode::right },
            { { 50, 10 }, DragMode::move },
            { { 50, 40 }, DragMode::none },
            { { 100, 40 }, DragMode::none }
        };

        for (const auto& [point, expected] : expectations)
        {
            request.point = point;
            const auto mode = DragModeEngine::decode(request);
            if (mode != expected)
            {
                return juce::Result::fail("decode " + point.toString() + " expected " + juce::String(expected)
                                          + ", got " + juce::String(mode));
            }
        }

        request.canResize = false;
        request.point = { 1, 1 };
        if (DragModeEngine::decode(request) != DragMode::move)
            return juce::Result::fail("non-resizable corner inside the title bar must move");

        request.point = { 50, 77 };
        if (DragModeEngine::decode(request) != DragMode::move)
            return juce::Result::fail("bottom title bar must move");

        request.canMove = false;
        request.point = { 50, 10 };
        if (DragModeEngine::decode(request) != DragMode::none)
            return juce::Result::fail("immovable item must not start a move");

        if (DragModeEngine::cursorFor(DragMode::left) != juce::MouseCursor::LeftRightResizeCursor
            || DragModeEngine::cursorFor(DragMode::bottom) != juce::MouseCursor::UpDownResizeCursor
            || DragModeEngine::cursorFor(DragMode::move) != juce::MouseCursor::NormalCursor)
        {
            return juce::Result::fail("unexpected cursor mapping");
        }

        return juce::Result::ok();
    }

    juce::Result testDragGeometry()
    {
        const SnapEngine noSnap;

        auto bounds = DragModeEngine::apply(DragMode::move, { 10, 10, 100, 80 }, { 30, -5 }, noSnap);
        if (bounds != juce::Rectangle<int>(40, 5, 100, 80))
            return juce::Result::fail("move expected (40, 5, 100, 80), got " + describe(bounds));

        bounds = DragModeEngine::apply(DragMode::left, { 100, 0, 100, 50 }, { -37, 12 }, noSnap);
        if (bounds != juce::Rectangle<int>(63, 0, 137, 50))
            return juce::Result::fail("left resize expected (63, 0, 137, 50), got " + describe(bounds));

        bounds = DragModeEngine::apply(DragMode::bottomRight, { 0, 0, 100, 50 }, { -20, 30 }, noSnap);
        if (bounds != juce::Rectangle<int>(0, 0, 80, 80))
            return juce::Result::fail("bottom-right resize expected (0, 0, 80, 80), got " + describe(bounds));

        bounds = DragModeEngine::apply(DragMode::topLeft, { 100, 100, 100, 50 }, { 200, 200 }, noSnap);
        if (bounds != juce::Rectangle<int>(176, 126, 24, 24))
            return juce::Result::fail("top-left collapse must keep the opposite edges, got " + describe(bounds));

        bounds = DragModeEngine::apply(DragMode::right, { 0, 0, 10, 10 }, { -50, 0 }, noSnap);
        if (bounds.getWidth() != 10)
            return juce::Result::fail("items smaller than the minimum extent must not grow when shrunk");

        const auto grid = makeGridSnap(5, 50);
        bounds = DragModeEngine::apply(DragMode::move, { 10, 10, 100, 80 }, { 37, 0 }, grid);
        if (bounds != juce::Rectangle<int>(50, 10, 100, 80))
            return juce::Result::fail("snapped move expected (50, 10, 100, 80), got " + describe(bounds));

        bounds = DragModeEngine::apply(DragMode::move, { 13, 0, 85, 60 }, { 0, 0 }, grid);
        if (bounds != juce::Rectangle<int>(15, 0, 85, 60))
            return juce::Result::fail("right edge must snap when the left edge does not, got " + describe(bounds));

        return juce::Result::ok();
    }

    juce::Result testPlacement()
    {
        const Pinboard::Ui::Interaction::PlacementEngine placement;

        const auto size = placement.resolveSize({ 0.0f, 0.5f }, { 100, 80 }, { 400, 300 });
        if (size != juce::Point<int>(100, 150))
            return juce::Result::fail("size resolution expected (100, 150), got " + size.toString());

        if (placement.resolveSize({ 250.0f, -1.0f }, { 100, 80 }, { 400, 300 }) != juce::Point<int>(250, 80))
            return juce::Result::fail("absolute width with best height expected (250, 80)");

        const std::vector<juce::Rectangle<int>> row { { 0, 0, 100, 50 }, { 100, 0, 100, 60 } };
        if (placement.initialPositionFor({ 100, 50 }, { 400, 300 }, row) != juce::Point<int>(200, 0))
            return juce::Result::fail("flow placement must continue the row");
        if (placement.initialPositionFor({ 100, 50 }, { 250, 300 }, row) != juce::Point<int>(0, 60))
            return juce::Result::fail("flow placement must wrap below the tallest item of the row");
        if (placement.initialPositionFor({ 100, 50 }, { 400, 300 }, {}) != juce::Point<int>(0, 0))
            return juce::Result::fail("first item must be placed at the origin");

        Pinboard::Ui::Interaction::PlacementRequest request;
        request.bestSize = { 100, 50 };
        request.canvasSize = { 400, 300 };
        request.requestedPosition = { 0.0f, 40.0f };
        if (placement.resolveBounds(request, row) != juce::Rectangle<int>(0, 40, 100, 50))
            return juce::Result::fail("explicit y must pin x to the left edge");

        request.requestedPosition = { 0.5f, 0.0f };
        if (placement.resolveBounds(request, row) != juce::Rectangle<int>(200, 0, 100, 50))
            return juce::Result::fail("fractional x must be resolved against the canvas width");

        request.requestedPosition = {};
        if (placement.resolveBounds(request, row) != juce::Rectangle<int>(200, 0, 100, 50))
            return juce::Result::fail("unset position must use flow placement");

        const auto lines = placement.guideLines({ 200, 100 }, { { 10, 10, 50, 20 }, { 100, 40, 30, 30 } }, 1u);
        if (lines.vertical != std::set<int> { 0, 10, 60, 199 } || lines.horizontal != std::set<int> { 0, 10, 30, 99 })
            return juce::Result::fail("guide lines must hold the border and the edges of non-dragged items");

        if (placement.contentExtent({ { 10, 10, 50, 20 }, { 100, 40, 30, 30 } }) != juce::Point<int>(130, 70))
            return juce::Result::fail("content extent expected (130, 70)");

        return juce::Result::ok();
    }

    juce::Result testTitleBarLayout()
    {
        using Pinboard::Ui::Canvas::TitleBarButton;

        Pinboard::Ui::Canvas::TitleBarRequest request;
        request.fontHeight = 14;
        request.itemSize = { 200, 100 };
        request.insets = { 22, 4, 4, 4 };
        request.showClose = true;

        const auto top = Pinboard::Ui::Canvas::computeTitleBarLayout(request);
        if (!top.has_value() || !top->onTop)
            return juce::Result::fail("title must fit into the top bar");
        if (top->boundsOf(TitleBarButton::close) != juce::Rectangle<int>(184, 5, 12, 12))
            return juce::Result::fail("close button expected at (184, 5)");
        if (top->boundsOf(TitleBarButton::minimize) != juce::Rectangle<int>(170, 5, 12, 12))
            return juce::Result::fail("minimize button expected left of close");
        if (top->title != juce::Rectangle<int>(4, 4, 164, 14))
            return juce::Result::fail("title expected at (4, 4, 164, 14), got " + describe(top->title));
        if (top->buttonAt({ 175, 10 }) != TitleBarButton::minimize || top->buttonAt({ 50, 10 }).has_value())
            return juce::Result::fail("button hit testing failed");

        request.insets = { 10, 4, 24, 4 };
        request.showClose = false;
        const auto bottom = Pinboard::Ui::Canvas::computeTitleBarLayout(request);
        if (!bottom.has_value() || bottom->onTop)
            return juce::Result::fail("title must move to the bottom bar");
        if (bottom->title.getY() != 77 || bottom->boundsOf(TitleBarButton::minimize) != juce::Rectangle<int>(184, 82, 12, 12))
            return juce::Result::fail("bottom bar placement mismatch");

        request.insets = { 10, 4, 10, 4 };
        if (Pinboard::Ui::Canvas::computeTitleBarLayout(request).has_value())
            return juce::Result::fail("title must not be placed when no bar is tall enough");

        return juce::Result::ok();
    }

    juce::Result testAdapterResolution()
    {
        Pinboard::ListCanvasAdapter adapter;
        TestObject plain("plain");
        TestObject derived("derived", { "Derived", "Base" });
        TestObject base("base", { "Base" });
        SelfDescribingObject self("self", { "Derived", "Base" });

        if (adapter.getTitle(plain).isNotEmpty() || !adapter.getCanMove(plain) || adapter.getCanDelete(plain))
            return juce::Result::fail("generic defaults mismatch");
        if (adapter.getCanClose(plain) != Pinboard::CloseBehaviour::allowed)
            return juce::Result::fail("items must be closable by default");

        adapter.registerTypeHandler("Base",
                                    CanvasAttribute::title,
                                    [](const Pinboard::AdapterContext&)
                                    {
                                        return juce::var("base title");
                                    });
        if (adapter.getTitle(derived) != "base title")
            return juce::Result::fail("type handler must apply to derived types");

        auto acceptCalls = 0;
        auto sub = std::make_shared<Pinboard::LambdaSubAdapter>();
        sub->forTypes({ "Derived" })
            .acceptWhen([&acceptCalls](const Pinboard::AdapterContext&)
                        {
                            ++acceptCalls;
                            return true;
                        })
            .on(CanvasAttribute::title, [](const Pinboard::AdapterContext&) { return juce::var("sub title"); });
        adapter.addSubAdapter(sub);

        if (adapter.cachedHandlerCount() != 0)
            return juce::Result::fail("adding a sub-adapter must flush the cache");
        if (adapter.getTitle(derived) != "sub title" || adapter.getTitle(base) != "base title")
            return juce::Result::fail("sub-adapter must take precedence for the types it accepts");
        if (adapter.getTitle(self) != "own title")
            return juce::Result::fail("the item's own answer must take precedence");

        const auto callsAfterFirst = acceptCalls;
        adapter.getTitle(derived);
        if (acceptCalls != callsAfterFirst)
            return juce::Result::fail("cacheable sub-adapter must not be consulted again");

        sub->cacheable(false);
        adapter.flushCache();
        adapter.getTitle(derived);
        adapter.getTitle(derived);
        if (acceptCalls != callsAfterFirst + 2)
            return juce::Result::fail("non-cacheable sub-adapter must be consulted on every query");

        if (adapter.getCanDrop(nullptr, &plain))
            return juce::Result::fail("canvas drops must be refused by default");
        adapter.defaults().canDrop = true;
        if (!adapter.getCanDrop(nullptr, &plain))
            return juce::Result::fail("canvas drops must follow the defaults");

        std::vector<std::pair<CanvasAttribute, CanvasObject*>> notifications;
        adapter.setNotificationCallback([&notifications](CanvasAttribute attribute, CanvasObject* item)
                                        {
                                            notifications.emplace_back(attribute, item);
                                        });
        adapter.setActivated(plain);
        adapter.setClosed(plain);
        if (notifications.size() != 2
            || notifications[0].first != CanvasAttribute::activated
            || notifications[1].first != CanvasAttribute::closed
            || notifications[1].second != &plain)
        {
            return juce::Result::fail("notifications must reach the generic handler");
        }

        juce::var closeAnswer("denied");
        adapter.registerTypeHandler("Widget",
                                    CanvasAttribute::canClose,
                                    [&closeAnswer](const Pinboard::AdapterContext&)
                                    {
                                        return closeAnswer;
                                    });
        if (adapter.getCanClose(plain) != Pinboard::CloseBehaviour::denied)
            return juce::Result::fail("\"denied\" must refuse closing");
        closeAnswer = "allowed";
        if (adapter.getCanClose(plain) != Pinboard::CloseBehaviour::allowed)
            return juce::Result::fail("\"allowed\" must allow closing");
        closeAnswer = 0.0;
        if (adapter.getCanClose(plain) != Pinboard::CloseBehaviour::denied)
            return juce::Result::fail("zero must refuse closing");
        closeAnswer = 1.5;
        if (adapter.getCanClose(plain) != Pinboard::CloseBehaviour::allowed)
            return juce::Result::fail("non-zero numbers must allow closing");
        closeAnswer = juce::var();
        if (adapter.getCanClose(plain) != Pinboard::CloseBehaviour::modified)
            return juce::Result::fail("void must ask before closing");

        return juce::Result::ok();
    }

    juce::Result testThemeFallback()
    {
        Pinboard::ListCanvasAdapter adapter;
        TestObject item("item");

        if (adapter.getThemeFor(item, Pinboard::ItemState::hover) != Pinboard::ThemeRegistry::kDefaultHover)
            return juce::Result::fail("hover theme default mismatch");

        adapter.defaults().themeHover = {};
        adapter.defaults().themeInactive = {};
        if (adapter.getThemeHover(item) != Pinboard::ThemeRegistry::kDefaultActive)
            return juce::Result::fail("hover must fall back through inactive to active");

        const auto& registry = Pinboard::defaultThemeRegistry();
        if (registry.resolve("no_such_theme").name != Pinboard::ThemeRegistry::kDefaultInactive)
            return juce::Result::fail("unknown themes must resolve to the inactive default");

        Pinboard::ThemeRegistry custom;
        Pinboard::ItemTheme unnamed;
        if (custom.registerTheme(unnamed))
            return juce::Result::fail("themes without a name must be rejected");

        Pinboard::ItemTheme wide;
        wide.name = "wide";
        wide.insets = { 30, 8, 8, 8 };
        if (!custom.registerTheme(wide) || custom.resolve("wide").insets.getTop() != 30)
            return juce::Result::fail("registered theme must resolve");

        return juce::Result::ok();
    }

    juce::Result testSettingsJson()
    {
        Pinboard::CanvasSettings settings;
        settings.snap.distance = 7;
        settings.grid.visible = Pinboard::VisibilityMode::always;
        settings.grid.snapping = false;
        settings.grid.colour = juce::Colour(0xff102030);
        settings.grid.style = Pinboard::LineStyle::dash;
        settings.grid.size = 25;
        settings.grid.offset = 3;
        settings.guide.visible = Pinboard::VisibilityMode::drag;
        settings.guide.style = Pinboard::LineStyle::dot;
        settings.operations.erase(Pinboard::CanvasOperation::clear);

        juce::String json;
        auto result = Pinboard::Serialization::serializeSettingsToJsonString(settings, json);
        if (result.failed())
            return result;

        Pinboard::CanvasSettings parsed;
        result = Pinboard::Serialization::parseSettingsFromJsonString(json, parsed);
        if (result.failed())
            return juce::Result::fail("settings parse failed: " + result.getErrorMessage());

        if (parsed.snap.distance != 7
            || parsed.grid.visible != Pinboard::VisibilityMode::always
            || parsed.grid.snapping
            || parsed.grid.colour != juce::Colour(0xff102030)
            || parsed.grid.style != Pinboard::LineStyle::dash
            || parsed.grid.size != 25
            || parsed.grid.offset != 3
            || parsed.guide.visible != Pinboard::VisibilityMode::drag
            || parsed.guide.style != Pinboard::LineStyle::dot
            || parsed.operations != settings.operations)
        {
            return juce::Result::fail("settings did not survive serialization: " + json);
        }

        result = Pinboard::Serialization::parseSettingsFromJsonString(
            R"({"snap":{"distance":42},"grid":{"size":1,"offset":500}})", parsed);
        if (result.failed() || parsed.snap.distance != 10 || parsed.grid.size != 5 || parsed.grid.offset != 200)
            return juce::Result::fail("out-of-range settings must be clamped");

        result = Pinboard::Serialization::parseSettingsFromJsonString(
            R"({"snap":{"distance":1e12},"grid":{"size":-1e12,"offset":3e9}})", parsed);
        if (result.failed() || parsed.snap.distance != 10 || parsed.grid.size != 5 || parsed.grid.offset != 200)
            return juce::Result::fail("numbers beyond the int range must be clamped");

        if (Pinboard::Serialization::parseSettingsFromJsonString(R"({"operations":["move","fly"]})", parsed).wasOk())
            return juce::Result::fail("unknown operation must be rejected");
        if (Pinboard::Serialization::parseSettingsFromJsonString(R"({"grid":{"style":"wavy"}})", parsed).wasOk())
            return juce::Result::fail("unknown line style must be rejected");
        if (Pinboard::Serialization::parseSettingsFromJsonString("[1, 2]", parsed).wasOk())
            return juce::Result::fail("non-object settings must be rejected");

        const auto missing = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("pinboard-missing.json");
        if (Pinboard::Serialization::loadSettingsFromFile(missing, parsed).wasOk())
            return juce::Result::fail("loading a missing file must fail");

        return juce::Result::ok();
    }

    juce::Result testLayoutJson()
    {
        const Pinboard::Serialization::CanvasLayout layout {
            { "alpha", { 10, 20, 110, 90 }, false },
            { "beta", { 140, 20, 60, 40 }, true }
        };

        const juce::TemporaryFile temporary(".json");
        auto result = Pinboard::Serialization::saveLayoutToFile(temporary.getFile(), layout);
        if (result.failed())
            return juce::Result::fail("layout save failed: " + result.getErrorMessage());

        Pinboard::Serialization::CanvasLayout loaded;
        result = Pinboard::Serialization::loadLayoutFromFile(temporary.getFile(), loaded);
        if (result.failed())
            return juce::Result::fail("layout load failed: " + result.getErrorMessage());

        if (loaded.size() != 2
            || loaded[0].uniqueId != "alpha" || loaded[0].bounds != layout[0].bounds || loaded[0].minimized
            || loaded[1].uniqueId != "beta" || loaded[1].bounds != layout[1].bounds || !loaded[1].minimized)
        {
            return juce::Result::fail("layout did not survive the file round trip");
        }

        if (Pinboard::Serialization::parseLayoutFromJsonString(
                R"({"items":[{"id":"a","x":0,"y":0,"w":0,"h":10}]})", loaded).wasOk())
            return juce::Result::fail("empty item size must be rejected");
        if (Pinboard::Serialization::parseLayoutFromJsonString(R"({"items":[{"x":0,"y":0,"w":5,"h":10}]})", loaded).wasOk())
            return juce::Result::fail("items without an id must be rejected");

        return juce::Result::ok();
    }

    juce::Result testObjectListNotifications()
    {
        Pinboard::CanvasObjectList list;
        RecordingListener listener;
        list.addListener(&listener);

        const auto a = makeObject("a");
        const auto b = makeObject("b");
        const auto c = makeObject("c");

        list.add(a);
        list.insert(0, b);
        if (list.size() != 2 || list.objectAt(0) != b || listener.events.size() != 2 || listener.events[1].index != 0)
            return juce::Result::fail("insert must notify with the insertion index");

        if (!list.replace(0, 5, { c }))
            return juce::Result::fail("replace must clamp the removed count");
        const auto& event = listener.events.back();
        if (event.removed.size() != 2 || event.removed[0] != b || event.added.size() != 1 || list.size() != 1)
            return juce::Result::fail("replace event must carry the removed and added objects");

        if (list.replace(-1, 0, { a }) || list.remove(a.get()) || list.replace(0, 0, { nullptr }))
            return juce::Result::fail("invalid or empty changes must be rejected");

        const auto eventsBefore = listener.events.size();
        list.clear();
        list.clear();
        if (listener.events.size() != eventsBefore + 1 || !list.isEmpty())
            return juce::Result::fail("clearing an empty list must not notify");

        list.removeListener(&listener);
        list.add(a);
        if (listener.events.size() != eventsBefore + 1)
            return juce::Result::fail("removed listener must not be notified");

        return juce::Result::ok();
    }

    juce::Result testCanvasItems()
    {
        Pinboard::ListCanvasAdapter adapter;
        registerNameIds(adapter);

        std::vector<std::pair<CanvasAttribute, juce::String>> notifications;
        adapter.setNotificationCallback([&notifications](CanvasAttribute attribute, CanvasObject* item)
                                        {
                                            notifications.emplace_back(attribute, item != nullptr ? nameOf(*item) : juce::String());
                                        });

        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry());
        canvas.setSize(600, 400);

        ListCanvas::ItemList created;
        for (const auto* name : { "a", "b", "c", "d", "e", "f" })
            created.push_back(canvas.createItem(makeObject(name)));
        canvas.replaceItems(std::move(created));

        if (canvas.getNumItems() != 6)
            return juce::Result::fail("expected 6 items");

        auto* first = canvas.itemAt(0);
        if (first->getBounds() != juce::Rectangle<int>(0, 0, 108, 86))
            return juce::Result::fail("best size must frame the view with the theme insets, got " + describe(first->getBounds()));
        if (canvas.itemAt(2)->getPosition() != juce::Point<int>(216, 0))
            return juce::Result::fail("items must flow left to right");
        if (canvas.itemAt(5)->getPosition() != juce::Point<int>(0, 86))
            return juce::Result::fail("items must wrap when the row is full, got " + canvas.itemAt(5)->getPosition().toString());

        canvas.activate(first);
        canvas.activate(canvas.itemAt(1));
        if (canvas.activeItem() != canvas.itemAt(1)
            || first->state() != Pinboard::ItemState::inactive
            || canvas.itemAt(1)->state() != Pinboard::ItemState::active)
        {
            return juce::Result::fail("activation must move between items");
        }

        if (notifications.size() != 3
            || notifications[1].first != CanvasAttribute::deactivated || notifications[1].second != "a"
            || notifications[2].first != CanvasAttribute::activated || notifications[2].second != "b")
        {
            return juce::Result::fail("activation must notify deactivated before activated");
        }

        canvas.replaceItems({}, 1, 2);
        if (canvas.activeItem() != nullptr || canvas.getNumItems() != 5 || nameOf(canvas.itemAt(1)->object()) != "c")
            return juce::Result::fail("removing the active item must clear the active item");
        if (notifications.size() != 3)
            return juce::Result::fail("removing the active item must not notify");

        if (canvas.itemAtPoint({ 10, 10 }) != first || canvas.itemFor(&first->object()) != first)
            return juce::Result::fail("item lookup failed");

        return juce::Result::ok();
    }

    juce::Result testCanvasDrag()
    {
        Pinboard::ListCanvasAdapter adapter;
        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry());
        canvas.setSize(600, 400);

        ListCanvas::ItemList created;
        created.push_back(canvas.createItem(makeObject("a")));
        canvas.replaceItems(std::move(created));
        auto& item = *canvas.itemAt(0);

        if (item.dragModeAt({ 50, 10 }) != DragMode::move || item.dragModeAt({ 107, 85 }) != DragMode::bottomRight)
            return juce::Result::fail("item drag mode decoding mismatch");

        canvas.beginDrag(item, DragMode::move, { 10, 10 });
        if (canvas.state() != Pinboard::CanvasState::dragging || canvas.dragItem() != &item)
            return juce::Result::fail("drag must start");

        canvas.dragTo({ 40, 25 });
        if (item.getBounds() != juce::Rectangle<int>(30, 15, 108, 86))
            return juce::Result::fail("move drag expected (30, 15), got " + describe(item.getBounds()));

        canvas.endDrag();
        if (canvas.state() != Pinboard::CanvasState::normal || canvas.dragItem() != nullptr)
            return juce::Result::fail("drag must end");

        canvas.beginDrag(item, DragMode::bottomRight, { 138, 101 });
        canvas.dragTo({ 0, 0 });
        canvas.endDrag();
        if (item.getBounds() != juce::Rectangle<int>(30, 15, 24, 24))
            return juce::Result::fail("resize must stop at the minimum extent, got " + describe(item.getBounds()));

        Pinboard::CanvasSettings settings;
        settings.grid.visible = Pinboard::VisibilityMode::drag;
        settings.operations.erase(Pinboard::CanvasOperation::size);
        canvas.setSettings(settings);
        if (canvas.isGridVisible())
            return juce::Result::fail("drag-only grid must be hidden while idle");
        if (DragModeEngine::isResizeMode(item.dragModeAt({ 23, 23 })))
            return juce::Result::fail("resizing must follow the size operation");

        canvas.beginDrag(item, DragMode::move, { 40, 20 });
        const auto gridVisibleWhileDragging = canvas.isGridVisible();
        canvas.endDrag();
        if (!gridVisibleWhileDragging)
            return juce::Result::fail("drag-only grid must show while dragging");

        return juce::Result::ok();
    }

    juce::Result testCanvasRequestsAndLayout()
    {
        using Pinboard::Ui::Canvas::TitleBarButton;

        Pinboard::ListCanvasAdapter adapter;
        registerNameIds(adapter);
        adapter.registerTypeHandler("Widget",
                                    CanvasAttribute::canClose,
                                    [](const Pinboard::AdapterContext& context)
                                    {
                                        const auto name = nameOf(*context.item);
                                        if (name == "locked")
                                            return Pinboard::closeBehaviourToVar(Pinboard::CloseBehaviour::denied);
                                        if (name == "dirty")
                                            return Pinboard::closeBehaviourToVar(Pinboard::CloseBehaviour::modified);
                                        return Pinboard::closeBehaviourToVar(Pinboard::CloseBehaviour::allowed);
                                    });
        adapter.registerTypeHandler("Widget",
                                    CanvasAttribute::clone,
                                    [](const Pinboard::AdapterContext& context)
                                    {
                                        return Pinboard::objectToVar(makeObject(nameOf(*context.item) + "-copy"));
                                    });

        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry());
        canvas.setSize(600, 400);

        std::vector<ObjectRequest> requests;
        canvas.setObjectRequestCallback([&requests](const ObjectRequest& request)
                                        {
                                            requests.push_back(request);
                                        });

        ListCanvas::ItemList created;
        for (const auto* name : { "plain", "locked", "dirty" })
            created.push_back(canvas.createItem(makeObject(name)));
        canvas.replaceItems(std::move(created));

        auto& plain = *canvas.itemAt(0);
        auto& locked = *canvas.itemAt(1);
        auto& dirty = *canvas.itemAt(2);

        if (plain.pressButton(TitleBarButton::close))
            return juce::Result::fail("close button must require a deletable item");

        if (!canvas.requestClose(plain) || requests.size() != 1 || requests[0].kind != ObjectRequestKind::remove)
            return juce::Result::fail("closing an allowed item must request its removal");
        if (canvas.requestClose(locked) || canvas.statusText().isEmpty())
            return juce::Result::fail("closing a denied item must fail with a status message");

        canvas.setCloseConfirmation([](Pinboard::Ui::Canvas::ListCanvasItem&, std::function<void(bool)> done)
                                    {
                                        done(false);
                                    });
        canvas.requestClose(dirty);
        if (requests.size() != 1)
            return juce::Result::fail("cancelled confirmation must keep the item");

        canvas.setCloseConfirmation([](Pinboard::Ui::Canvas::ListCanvasItem&, std::function<void(bool)> done)
                                    {
                                        done(true);
                                    });
        canvas.requestClose(dirty);
        if (requests.size() != 2 || nameOf(*requests[1].object) != "dirty")
            return juce::Result::fail("confirmed close must request removal");

        if (!canvas.requestClone(plain) || requests.back().kind != ObjectRequestKind::clone
            || nameOf(*requests.back().object) != "plain-copy" || requests.back().target.get() != &plain.object())
        {
            return juce::Result::fail("clone must request the adapter's copy next to the original");
        }

        requests.clear();
        if (canvas.clearObjects() != 2 || requests.size() != 2)
            return juce::Result::fail("clear must skip items that cannot be closed");

        if (!plain.pressButton(TitleBarButton::minimize) || !plain.isMinimized() || plain.getHeight() != 26)
            return juce::Result::fail("minimize must collapse the item to its title bars");

        const auto layout = canvas.captureLayout();
        if (layout.size() != 3 || layout[0].uniqueId != "plain" || !layout[0].minimized || layout[0].bounds.getHeight() != 86)
            return juce::Result::fail("layout must store the expanded bounds and the minimized flag");

        Pinboard::Serialization::CanvasLayout moved { { "locked", { 300, 200, 150, 100 }, false },
                                                      { "unknown", { 0, 0, 10, 10 }, false } };
        if (canvas.applyLayout(moved) != 1 || locked.getBounds() != juce::Rectangle<int>(300, 200, 150, 100))
            return juce::Result::fail("layout must move the items it names");

        auto operations = Pinboard::CanvasOperations::none();
        canvas.setOperations(operations);
        if (canvas.createContextMenu().getNumItems() != 0)
            return juce::Result::fail("context menu must follow the allowed operations");
        if (canvas.saveLayout(juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("pinboard-denied.json")).wasOk())
            return juce::Result::fail("saving must follow the save operation");

        return juce::Result::ok();
    }

    juce::Result testItemPointerStates()
    {
        using Pinboard::ItemState;

        Pinboard::ListCanvasAdapter adapter;
        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry());
        canvas.setSize(600, 400);

        ListCanvas::ItemList created;
        created.push_back(canvas.createItem(makeObject("a")));
        created.push_back(canvas.createItem(makeObject("b")));
        canvas.replaceItems(std::move(created));
        auto& a = *canvas.itemAt(0);
        auto& b = *canvas.itemAt(1);

        a.handlePointerMove({ 50, 40 });
        if (a.state() != ItemState::hover || a.theme().name != Pinboard::ThemeRegistry::kDefaultHover)
            return juce::Result::fail("pointer motion must hover an inactive item");

        a.handlePointerExit();
        if (a.state() != ItemState::inactive)
            return juce::Result::fail("leaving a hovered item must make it inactive");

        a.handlePointerMove({ 50, 40 });
        a.handlePointerMove({ 500, 300 });
        if (a.state() != ItemState::inactive)
            return juce::Result::fail("motion outside a hovered item must make it inactive");

        a.handlePointerMove({ 50, 40 });
        a.handleLeftDown({ 50, 10 });
        if (canvas.activeItem() != &a || a.state() != ItemState::active)
            return juce::Result::fail("left down on a hovered item must activate it");
        if (a.currentDragMode() != DragMode::move || canvas.state() != Pinboard::CanvasState::dragging || canvas.dragItem() != &a)
            return juce::Result::fail("left down in the title bar must start a move drag");

        canvas.dragTo({ 60, 30 });
        canvas.endDrag();
        a.handleLeftUp({ 50, 10 });
        if (a.currentDragMode() != DragMode::none || a.getPosition() != juce::Point<int>(10, 20))
            return juce::Result::fail("left up must end the drag where the pointer left it, got " + describe(a.getBounds()));

        a.handlePointerMove({ 60, 50 });
        if (a.state() != ItemState::active)
            return juce::Result::fail("motion must keep an active item active");

        a.handleLeftDown({ 60, 50 });
        if (a.currentDragMode() != DragMode::none || canvas.state() != Pinboard::CanvasState::normal)
            return juce::Result::fail("left down over the view area must not start a drag");
        a.handleLeftUp({ 60, 50 });

        b.handleViewClicked();
        if (canvas.activeItem() != &b || a.state() != ItemState::inactive || canvas.state() != Pinboard::CanvasState::normal)
            return juce::Result::fail("clicking a view must activate its item without dragging");

        b.handleLeftDown({ b.getWidth() - 1, b.getHeight() - 1 });
        const auto resizeMode = b.currentDragMode();
        canvas.endDrag();
        b.handleLeftUp({ b.getWidth() - 1, b.getHeight() - 1 });
        if (resizeMode != DragMode::bottomRight || b.currentDragMode() != DragMode::none)
            return juce::Result::fail("left down on the corner must start a bottom-right resize");

        return juce::Result::ok();
    }

    juce::Result testCanvasGuideSnapping()
    {
        Pinboard::ListCanvasAdapter adapter;
        registerNameIds(adapter);
        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry());
        canvas.setSize(600, 400);

        Pinboard::CanvasSettings settings;
        settings.snap.distance = 5;
        settings.grid.snapping = false;
        settings.guide.snapping = true;
        canvas.setSettings(settings);

        ListCanvas::ItemList created;
        created.push_back(canvas.createItem(makeObject("a")));
        created.push_back(canvas.createItem(makeObject("b")));
        canvas.replaceItems(std::move(created));
        canvas.applyLayout({ { "a", { 0, 0, 108, 86 }, false }, { "b", { 300, 0, 108, 86 }, false } });
        auto& b = *canvas.itemAt(1);

        canvas.beginDrag(b, DragMode::move, { 310, 10 });
        const auto& guides = canvas.snapEngine().guides();
        if (guides.vertical != std::set<int> { 0, 108, 599 } || guides.horizontal != std::set<int> { 0, 86, 399 })
            return juce::Result::fail("drag start must capture the border and the other items' edges");

        canvas.dragTo({ 121, 10 });
        canvas.endDrag();
        if (b.getBounds() != juce::Rectangle<int>(108, 0, 108, 86))
            return juce::Result::fail("moved item must snap onto its neighbour's edge, got " + describe(b.getBounds()));
        if (!canvas.snapEngine().guides().empty())
            return juce::Result::fail("guides must be dropped when the drag ends");

        settings.guide.snapping = false;
        canvas.setSettings(settings);
        canvas.applyLayout({ { "b", { 300, 0, 108, 86 }, false } });
        canvas.beginDrag(b, DragMode::move, { 310, 10 });
        const auto capturedWithoutSnapping = !canvas.snapEngine().guides().empty();
        canvas.dragTo({ 121, 10 });
        canvas.endDrag();
        if (capturedWithoutSnapping || b.getX() != 111)
            return juce::Result::fail("guides must not pull items when guide snapping is off");

        return juce::Result::ok();
    }

    juce::Result testScrollableCanvas()
    {
        Pinboard::ListCanvasAdapter adapter;
        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry(), true);
        canvas.setSize(300, 200);

        if (!canvas.isScrollable() || canvas.surfaceSize() != juce::Point<int>(300, 200))
            return juce::Result::fail("empty scrollable surface must fill the viewport, got " + canvas.surfaceSize().toString());

        ListCanvas::ItemList created;
        for (const auto* name : { "a", "b", "c", "d", "e" })
            created.push_back(canvas.createItem(makeObject(name)));
        canvas.replaceItems(std::move(created));

        auto& last = *canvas.itemAt(4);
        if (last.getPosition() != juce::Point<int>(0, 172))
            return juce::Result::fail("items must flow within the visible width, got " + last.getPosition().toString());

        const auto grown = canvas.surfaceSize();
        if (grown.y != 258 || grown.x < 216 || grown.x > 300)
            return juce::Result::fail("surface must grow to the content extent, got " + grown.toString());

        canvas.beginDrag(last, DragMode::move, { 10, 180 });
        canvas.dragTo({ 410, 480 });
        canvas.endDrag();
        if (canvas.surfaceSize() != juce::Point<int>(508, 558))
            return juce::Result::fail("dragging past the edge must extend the surface, got " + canvas.surfaceSize().toString());

        canvas.replaceItems({});
        const auto shrunk = canvas.surfaceSize();
        if (shrunk.x <= 0 || shrunk.x > 300 || shrunk.y <= 0 || shrunk.y > 200)
            return juce::Result::fail("empty surface must shrink back to the viewport, got " + shrunk.toString());

        return juce::Result::ok();
    }

    juce::Result testCanvasLayoutFile()
    {
        Pinboard::ListCanvasAdapter adapter;
        registerNameIds(adapter);
        ListCanvas canvas(adapter, Pinboard::defaultThemeRegistry());
        canvas.setSize(600, 400);

        ListCanvas::ItemList created;
        created.push_back(canvas.createItem(makeObject("a")));
        created.push_back(canvas.createItem(makeObject("b")));
        canvas.replaceItems(std::move(created));
        auto& a = *canvas.itemAt(0);
        auto& b = *canvas.itemAt(1);
        a.setBounds(40, 50, 150, 120);
        b.setMinimized(true);

        const juce::TemporaryFile temp(".json");
        if (const auto result = canvas.saveLayout(temp.getFile()); result.failed())
            return juce::Result::fail("layout save failed: " + result.getErrorMessage());

        a.setBounds(300, 200, 60, 60);
        b.setMinimized(false);
        b.setBounds(400, 10, 100, 100);

        if (const auto result = canvas.loadLayout(temp.getFile()); result.failed())
            return juce::Result::fail("layout load failed: " + result.getErrorMessage());

        if (a.getBounds() != juce::Rectangle<int>(40, 50, 150, 120))
            return juce::Result::fail("loaded layout must restore bounds, got " + describe(a.getBounds()));
        if (!b.isMinimized() || b.expandedBounds() != juce::Rectangle<int>(108, 0, 108, 86))
            return juce::Result::fail("loaded layout must restore the minimized item, got " + describe(b.expandedBounds()));
        if (!canvas.statusText().contains("2"))
            return juce::Result::fail("loading must report the restored items");

        const juce::TemporaryFile broken(".json");
        if (!broken.getFile().replaceWithText("not json"))
            return juce::Result::fail("could not write the broken layout file");
        if (canvas.loadLayout(broken.getFile()).wasOk() || a.getBounds() != juce::Rectangle<int>(40, 50, 150, 120))
            return juce::Result::fail("an unreadable layout must fail and leave the items alone");

        return juce::Result::ok();
    }

    juce::Result testLiveThemeChanges()
    {
        Pinboard::ListCanvasAdapter adapter;
        Pinboard::ThemeRegistry themes;
        ListCanvas canvas(adapter, themes);
        canvas.setSize(600, 400);

        ListCanvas::ItemList created;
        created.push_back(canvas.createItem(makeObject("a")));
        canvas.replaceItems(std::move(created));
        auto& item = *canvas.itemAt(0);

        for (auto i = 0; i < 16; ++i)
        {
            Pinboard::ItemTheme extra;
            extra.name = "extra_" + juce::String(i);
            extra.insets = juce::BorderSize<int>(40, 1, 1, 1);
            themes.registerTheme(extra);
        }

        if (item.theme().name != Pinboard::ThemeRegistry::kDefaultInactive || item.theme().insets.getTop() != 22)
            return juce::Result::fail("items must keep their theme while the registry grows");

        auto replaced = *themes.find(Pinboard::ThemeRegistry::kDefaultInactive);
        replaced.insets = juce::BorderSize<int>(30, 6, 6, 6);
        themes.registerTheme(replaced);
        item.refresh();

        if (item.theme().insets.getTop() != 30)
            return juce::Result::fail("refresh must pick up a replaced theme");
        if (item.view()->getBounds() != juce::Rectangle<int>(6, 30, item.getWidth() - 12, item.getHeight() - 36))
            return juce::Result::fail("view must follow the replaced insets, got " + describe(item.view()->getBounds()));
        if (item.dragModeAt({ 50, 26 }) != DragMode::move)
            return juce::Result::fail("title bar hit testing must follow the replaced insets");

        return juce::Result::ok();
    }

    juce::Result testSharedAdapterStatus()
    {
        Pinboard::ListCanvasAdapter adapter;
        auto older = std::make_unique<ListCanvas>(adapter, Pinboard::defaultThemeRegistry());
        ListCanvas newer(adapter, Pinboard::defaultThemeRegistry());
        newer.setSize(600, 400);

        older.reset();
        adapter.setStatus("still listening");
        if (newer.surfaceSize() != juce::Point<int>(600, 378))
            return juce::Result::fail("destroying another canvas must keep this canvas's status line, got "
                                      + newer.surfaceSize().toString());

        return juce::Result::ok();
    }

    juce::Result testEditorBinding()
    {
        Pinboard::CanvasObjectList list;
        const auto a = makeObject("a");
        const auto b = makeObject("b");
        list.setAll({ a, b });

        Pinboard::ListCanvasEditorSettings settings;
        settings.addTypes = { { "Widget", [] { return makeObject("added"); } } };
        auto editor = Pinboard::createEditor(settings, list);
        auto& canvas = editor->canvas();

        if (editor->isBound() || canvas.getNumItems() != 0)
            return juce::Result::fail("binding must wait for a non-empty size");

        list.add(makeObject("early"));
        editor->setSize(600, 400);
        if (!editor->isBound() || canvas.getNumItems() != 3)
            return juce::Result::fail("first layout must load the whole list");

        const auto c = makeObject("c");
        list.insert(1, c);
        if (canvas.getNumItems() != 4 || &canvas.itemAt(1)->object() != c.get())
            return juce::Result::fail("list insertions must appear at the same index");

        list.removeAt(0);
        if (canvas.getNumItems() != 3 || &canvas.itemAt(0)->object() != c.get())
            return juce::Result::fail("list removals must remove the matching item");

        editor->adapter().registerTypeHandler("Widget",
                                              CanvasAttribute::clone,
                                              [](const Pinboard::AdapterContext& context)
                                              {
                                                  return Pinboard::objectToVar(makeObject(nameOf(*context.item) + "-copy"));
                                              });
        if (!canvas.requestClone(*canvas.itemAt(0)) || list.size() != 4 || canvas.getNumItems() != 4)
            return juce::Result::fail("clone request must insert into the list");
        if (list.objectAt(0) != c || nameOf(*list.objectAt(1)) != "c-copy")
            return juce::Result::fail("clone must be inserted after its original");

        canvas.addObject(makeObject("d"));
        if (list.size() != 5 || nameOf(*list.objectAt(4)) != "d")
            return juce::Result::fail("add request must append to the list");

        CanvasObject::Ptr dropTarget;
        editor->setDropOnItemHandler([&dropTarget](CanvasObject::Ptr target, CanvasObject::Ptr)
                                     {
                                         dropTarget = target;
                                         return true;
                                     });
        editor->adapter().defaults().canDrop = true;
        const auto dropped = makeObject("dropped");
        const auto firstItemCentre = canvas.itemAt(0)->getBounds().getCentre();
        if (!canvas.dropObject(dropped, firstItemCentre) || dropTarget != list.objectAt(0))
            return juce::Result::fail("drop onto an item must reach the host");
        if (list.size() != 5)
            return juce::Result::fail("drop onto an item must not change the list");

        if (canvas.clearObjects() != 5 || !list.isEmpty() || canvas.getNumItems() != 0)
            return juce::Result::fail("clear must empty the bound list");

        list.setAll({ a, b });
        editor.reset();
        list.add(c);
        if (list.size() != 3)
            return juce::Result::fail("list must stay usable after the editor is gone");

        return juce::Result::ok();
    }
}

int main()
{
    const juce::ScopedJuceInitialiser_GUI juceInitialiser;

    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Snap engine grid and guides", testSnapEngine },
        { "Drag mode decoding", testDragModeDecoding },
        { "Drag geometry", testDragGeometry },
        { "Placement and guide lines", testPlacement },
        { "Title bar layout", testTitleBarLayout },
        { "Adapter resolution and caching", testAdapterResolution },
        { "Theme fallback", testThemeFallback },
        { "Settings JSON", testSettingsJson },
        { "Layout JSON", testLayoutJson },
        { "Object list notifications", testObjectListNotifications },
        { "Canvas items and activation", testCanvasItems },
        { "Canvas drag", testCanvasDrag },
        { "Canvas requests and layout", testCanvasRequestsAndLayout },
        { "Item pointer states", testItemPointerStates },
        { "Canvas guide snapping", testCanvasGuideSnapping },
        { "Scrollable canvas", testScrollableCanvas },
        { "Canvas layout file", testCanvasLayoutFile },
        { "Live theme changes", testLiveThemeChanges },
        { "Shared adapter status", testSharedAdapterStatus },
        { "Editor binding", testEditorBinding }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Pinboard smoke passed." << std::endl;
    return 0;
}
