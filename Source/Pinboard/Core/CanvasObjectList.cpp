#include "Pinboard/Core/CanvasObjectList.h"

#include <algorithm>

namespace Pinboard
{
    CanvasObjectList::CanvasObjectList(CanvasObjects initial)
        : items(std::move(initial))
    {
        items.erase(std::remove(items.begin(), items.end(), nullptr), items.end());
    }

    int CanvasObjectList::size() const noexcept
    {
        return static_cast<int>(items.size());
    }

    bool CanvasObjectList::isEmpty() const noexcept
    {
        return items.empty();
    }

    const CanvasObjects& CanvasObjectList::objects() const noexcept
    {
        return items;
    }

    CanvasObject::Ptr CanvasObjectList::objectAt(int index) const noexcept
    {
        if (index < 0 || index >= size())
            return {};

        return items[static_cast<size_t>(index)];
    }

    int CanvasObjectList::indexOf(const CanvasObject* object) const noexcept
    {
        const auto it = std::find_if(items.begin(),
                                     items.end(),
                                     [object](const CanvasObject::Ptr& candidate)
                                     {
                                         return candidate.get() == object;
                                     });
        return it == items.end() ? -1 : static_cast<int>(std::distance(items.begin(), it));
    }

    void CanvasObjectList::add(CanvasObject::Ptr object)
    {
        insert(size(), std::move(object));
    }

    bool CanvasObjectList::insert(int index, CanvasObject::Ptr object)
    {
        return replace(index, 0, { std::move(object) });
    }

    bool CanvasObjectList::remove(const CanvasObject* object)
    {
        return removeAt(indexOf(object));
    }

    bool CanvasObjectList::removeAt(int index)
    {
        if (index < 0 || index >= size())
            return false;

        return replace(index, 1, {});
    }

    bool CanvasObjectList::replace(int index, int removedCount, CanvasObjects added)
    {
        if (index < 0 || index > size() || removedCount < 0)
        {
            DBG("[Pinboard][List] replace rejected: index=" + juce::String(index)
                + " removed=" + juce::String(removedCount) + " size=" + juce::String(size()));
            return false;
        }

        added.erase(std::remove(added.begin(), added.end(), nullptr), added.end());
        removedCount = std::min(removedCount, size() - index);
        if (removedCount == 0 && added.empty())
            return false;

        const auto first = items.begin() + index;
        CanvasObjects removed(first, first + removedCount);
        items.erase(first, first + removedCount);
        items.insert(items.begin() + index, added.begin(), added.end());

        notify(index, removed, added);
        return true;
    }

    void CanvasObjectList::clear()
    {
        replace(0, size(), {});
    }

    void CanvasObjectList::setAll(CanvasObjects next)
    {
        replace(0, size(), std::move(next));
    }

    void CanvasObjectList::addListener(Listener* listener)
    {
        listeners.add(listener);
    }

    void CanvasObjectList::removeListener(Listener* listener)
    {
        listeners.remove(listener);
    }

    void CanvasObjectList::notify(int index, const CanvasObjects& removed, const CanvasObjects& added)
    {
        listeners.call([this, index, &removed, &added](Listener& listener)
                       {
                           listener.canvasObjectsReplaced(*this, index, removed, added);
                       });
    }
}
