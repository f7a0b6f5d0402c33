/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Format.h>
#include <AK/Function.h>
#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
#include <AK/RefCounted.h>
#include <AK/StringView.h>
#include <AK/Vector.h>
#include <LibIndexedStore/Export.h>

namespace IndexedStore {

#define ENUMERATE_INDEXEDSTORE_EVENT_TYPES                \
    __ENUMERATE_EVENT_TYPE(Success, "success")             \
    __ENUMERATE_EVENT_TYPE(Error, "error")                 \
    __ENUMERATE_EVENT_TYPE(Blocked, "blocked")             \
    __ENUMERATE_EVENT_TYPE(UpgradeNeeded, "upgradeneeded") \
    __ENUMERATE_EVENT_TYPE(Complete, "complete")           \
    __ENUMERATE_EVENT_TYPE(Abort, "abort")                 \
    __ENUMERATE_EVENT_TYPE(VersionChange, "versionchange") \
    __ENUMERATE_EVENT_TYPE(Close, "close")

enum class EventType : u8 {
#define __ENUMERATE_EVENT_TYPE(type, name) type,
    ENUMERATE_INDEXEDSTORE_EVENT_TYPES
#undef __ENUMERATE_EVENT_TYPE
};

INDEXEDSTORE_API StringView event_type_to_string(EventType);

class EventTarget;

class INDEXEDSTORE_API Event {
public:
    enum class Bubbles {
        No,
        Yes,
    };

    enum class Cancelable {
        No,
        Yes,
    };

    Event(EventType type, Bubbles bubbles = Bubbles::No, Cancelable cancelable = Cancelable::No)
        : m_type(type)
        , m_bubbles(bubbles == Bubbles::Yes)
        , m_cancelable(cancelable == Cancelable::Yes)
    {
    }

    // https://w3c.github.io/IndexedDB/#idbversionchangeevent
    static Event create_version_change(EventType type, u64 old_version, Optional<u64> new_version)
    {
        Event event { type };
        event.m_old_version = old_version;
        event.m_new_version = new_version;
        return event;
    }

    EventType type() const { return m_type; }
    bool bubbles() const { return m_bubbles; }
    bool cancelable() const { return m_cancelable; }

    Optional<u64> old_version() const { return m_old_version; }
    Optional<u64> new_version() const { return m_new_version; }

    EventTarget* target() const { return m_target; }
    EventTarget* current_target() const { return m_current_target; }

    void stop_propagation() { m_stop_propagation = true; }
    bool propagation_stopped() const { return m_stop_propagation; }

    void prevent_default()
    {
        if (m_cancelable)
            m_default_prevented = true;
    }
    bool default_prevented() const { return m_default_prevented; }

private:
    friend class EventTarget;

    EventType m_type;
    bool m_bubbles { false };
    bool m_cancelable { false };
    bool m_stop_propagation { false };
    bool m_default_prevented { false };

    Optional<u64> m_old_version;
    Optional<u64> m_new_version;

    EventTarget* m_target { nullptr };
    EventTarget* m_current_target { nullptr };
};

// A table of listeners per entity. Dispatch is synchronous, so anything a listener changes is
// visible to the dispatching code as soon as dispatch_event() returns.
class INDEXEDSTORE_API EventTarget {
public:
    using Callback = Function<void(Event&)>;
    using ListenerID = u64;

    struct ListenerOptions {
        bool once { false };
    };

    virtual ~EventTarget();

    ListenerID add_event_listener(EventType, Callback, ListenerOptions = {});
    void remove_event_listener(ListenerID);
    bool has_event_listener(EventType) const;

    // Returns false if a listener canceled the event.
    bool dispatch_event(Event&);

protected:
    EventTarget();

    // Bubbling events continue to this target after the listeners of this one have run.
    virtual EventTarget* parent_for_event_dispatch() { return nullptr; }

private:
    // https://dom.spec.whatwg.org/#concept-event-listener
    struct Listener : public RefCounted<Listener> {
        Listener(ListenerID id, EventType type, Callback callback, bool once)
            : id(id)
            , type(type)
            , callback(move(callback))
            , once(once)
        {
        }

        ListenerID id { 0 };
        EventType type;
        Callback callback;
        bool once { false };
        bool removed { false };
    };

    void invoke_listeners(Event&);

    Vector<NonnullRefPtr<Listener>> m_listeners;
    ListenerID m_next_listener_id { 1 };
};

}

namespace AK {

template<>
struct Formatter<IndexedStore::EventType> final : Formatter<StringView> {
    ErrorOr<void> format(FormatBuilder& builder, IndexedStore::EventType type)
    {
        return Formatter<StringView>::format(builder, IndexedStore::event_type_to_string(type));
    }
};

}
