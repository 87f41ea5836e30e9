#pragma once

#include "Pinboard/Public/CanvasObject.h"
#include <JuceHeader.h>
#include <vector>

namespace Pinboard
{
    using CanvasObjects = std::vector<CanvasObject::Ptr>;

    // The observable object list a canvas editor is bound to.
    class CanvasObjectList
    {
    public:
        class Listener
        {
        public:
            virtual ~Listener() = default;

            // removed objects were at [index, index + removed.size()) and have been replaced by added.
            virtual void canvasObjectsReplaced(CanvasObjectList& list,
                                               int index,
                                               const CanvasObjects& removed,
                                               const CanvasObjects& added) = 0;
        };

        CanvasObjectList() = default;
        explicit CanvasObjectList(CanvasObjects initial);

        CanvasObjectList(const CanvasObjectList&) = delete;
        CanvasObjectList& operator=(const CanvasObjectList&) = delete;

        int size() const noexcept;
        bool isEmpty() const noexcept;
        const CanvasObjects& objects() const noexcept;
        CanvasObject::Ptr objectAt(int index) const noexcept;
        int indexOf(const CanvasObject* object) const noexcept;

        void add(CanvasObject::Ptr object);
        bool insert(int index, CanvasObject::Ptr object);
        bool remove(const CanvasObject* object);
        bool removeAt(int index);
        bool replace(int index, int removedCount, CanvasObjects added);
        void clear();
        void setAll(CanvasObjects next);

        void addListener(Listener* listener);
        void removeListener(Listener* listener);

    private:
        void notify(int index, const CanvasObjects& removed, const CanvasObjects& added);

        CanvasObjects items;
        juce::ListenerList<Listener> listeners;
    };
}
