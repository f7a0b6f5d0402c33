/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Event.h>

namespace IndexedStore {

StringView event_type_to_string(EventType type)
{
    switch (type) {
#define __ENUMERATE_EVENT_TYPE(type, name) \
    case EventType::type:                  \
        return name##sv;
        ENUMERATE_INDEXEDSTORE_EVENT_TYPES
#undef __ENUMERATE_EVENT_TYPE
    }
    VERIFY_NOT_REACHED();
}

EventTarget::EventTarget() = default;

EventTarget::~EventTarget() = default;

EventTarget::ListenerID EventTarget::add_event_listener(EventType type, Callback callback, ListenerOptions options)
{
    auto id = m_next_listener_id++;
    m_listeners.append(adopt_ref(*new Listener(id, type, move(callback), options.once)));
    return id;
}

void EventTarget::remove_event_listener(ListenerID id)
{
    m_listeners.remove_all_matching([&](auto& listener) {
        if (listener->id != id)
            return false;
        listener->removed = true;
        return true;
    });
}

bool EventTarget::has_event_listener(EventType type) const
{
    for (auto const& listener : m_listeners) {
        if (listener->type == type)
            return true;
    }
    return false;
}

bool EventTarget::dispatch_event(Event& event)
{
    event.m_target = this;

    Vector<EventTarget*> path;
    path.append(this);
    if (event.bubbles()) {
        for (auto* parent = parent_for_event_dispatch(); parent; parent = parent->parent_for_event_dispatch())
            path.append(parent);
    }

    for (auto* target : path) {
        event.m_current_target = target;
        target->invoke_listeners(event);
        if (event.propagation_stopped())
            break;
    }

    event.m_current_target = nullptr;
    return !event.default_prevented();
}

// https://dom.spec.whatwg.org/#concept-event-listener-inner-invoke
void EventTarget::invoke_listeners(Event& event)
{
    // Listeners added during dispatch do not run, and listeners removed during dispatch no longer run.
    auto listeners = m_listeners;

    for (auto& listener : listeners) {
        if (listener->removed || listener->type != event.type())
            continue;

        if (listener->once)
            remove_event_listener(listener->id);

        listener->callback(event);
    }
}

}
