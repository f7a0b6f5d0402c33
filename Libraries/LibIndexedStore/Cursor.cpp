/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/StoreData.h>
#include <LibIndexedStore/Transaction.h>
#include <LibIndexedStore/Value.h>

namespace IndexedStore {

StringView cursor_direction_to_string(CursorDirection direction)
{
    switch (direction) {
    case CursorDirection::Next:
        return "next"sv;
    case CursorDirection::NextUnique:
        return "nextunique"sv;
    case CursorDirection::Prev:
        return "prev"sv;
    case CursorDirection::PrevUnique:
        return "prevunique"sv;
    }
    VERIFY_NOT_REACHED();
}

ExceptionOr<NonnullRefPtr<Cursor>> Cursor::create(Request& request, Optional<KeyQuery> query, CursorDirection direction, KeyOnly key_only)
{
    RefPtr<Index> index;
    auto object_store = request.source().visit(
        [](Empty) -> NonnullRefPtr<ObjectStore> { VERIFY_NOT_REACHED(); },
        [](NonnullRefPtr<ObjectStore> const& source_store) -> NonnullRefPtr<ObjectStore> { return source_store; },
        [&](NonnullRefPtr<Index> const& source_index) -> NonnullRefPtr<ObjectStore> {
            index = source_index;
            return source_index->object_store();
        });

    auto store = object_store->store_data();
    if (!store)
        return InvalidStateError::create(String::formatted("openCursor: Object store '{}' does not exist", object_store->name()));

    Optional<String> index_key_path;
    if (index) {
        auto descriptor = store->index_with_name(index->name());
        if (!descriptor.has_value())
            return InvalidStateError::create(String::formatted("openCursor: Index '{}' does not exist", index->name()));
        index_key_path = descriptor->key_path;
    }

    auto positions = collect_record_positions(*store, index_key_path, query, direction);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Opened {} cursor over {} record(s)", cursor_direction_to_string(direction), positions.size());

    auto cursor = adopt_ref(*new Cursor(request, move(object_store), move(index), direction, key_only, move(positions)));

    // Move to the first position.
    cursor->progress();
    return cursor;
}

Cursor::Cursor(Request& request, NonnullRefPtr<ObjectStore> object_store, RefPtr<Index> index, CursorDirection direction, KeyOnly key_only, Vector<RecordPosition> positions)
    : m_request(request.make_weak_ptr())
    , m_object_store(move(object_store))
    , m_index(move(index))
    , m_direction(direction)
    , m_key_only(key_only == KeyOnly::Yes)
    , m_positions(move(positions))
{
}

Cursor::~Cursor() = default;

RefPtr<Request> Cursor::request() const
{
    return m_request.strong_ref();
}

Optional<JsonValue> Cursor::value() const
{
    if (m_key_only || !m_value)
        return {};
    return m_value->value();
}

void Cursor::progress()
{
    if (m_next_position >= m_positions.size()) {
        m_key.clear();
        m_primary_key.clear();
        m_value = nullptr;
        return;
    }

    auto const& position = m_positions[m_next_position++];
    m_key = position.key;
    m_primary_key = position.primary_key;

    if (m_key_only)
        return;

    // The record may have been removed by a request that ran after the cursor was opened.
    m_value = nullptr;
    if (auto store = m_object_store->store_data()) {
        if (auto record = store->record_with_key(position.primary_key); record.has_value())
            m_value = record->value;
    }
}

ExceptionOr<void> Cursor::check_can_move(StringView operation) const
{
    if (m_object_store->transaction().is_finished())
        return InvalidStateError::create(String::formatted("{}: Transaction has finished", operation));

    auto request = m_request.strong_ref();
    if (!request)
        return InvalidStateError::create(String::formatted("{}: Cursor's request no longer exists", operation));

    // The cursor can only be moved between the completions of its request.
    if (!request->is_done())
        return InvalidStateError::create(String::formatted("{}: Cursor is currently iterating", operation));

    if (is_exhausted())
        return InvalidStateError::create(String::formatted("{}: Cursor has iterated past the end of the set", operation));

    if (!m_object_store->store_data())
        return InvalidStateError::create(String::formatted("{}: Object store '{}' does not exist", operation, m_object_store->name()));

    return {};
}

// https://w3c.github.io/IndexedDB/#dom-idbcursor-continue
ExceptionOr<void> Cursor::continue_(Optional<KeyQuery> target)
{
    TRY(check_can_move("continue"sv));

    // Move at least one step, then on until the key matches the target.
    progress();
    if (target.has_value()) {
        while (!is_exhausted() && !target->matches(*m_key))
            progress();
    }

    return request()->rerun();
}

// https://w3c.github.io/IndexedDB/#dom-idbcursor-advance
ExceptionOr<void> Cursor::advance(u32 count)
{
    // 1. If count is 0 (zero), throw a TypeError.
    if (count == 0)
        return TypeError::create("advance: Count must be 1 or more"_string);

    TRY(check_can_move("advance"sv));

    for (u32 i = 0; i < count && !is_exhausted(); ++i)
        progress();

    return request()->rerun();
}

// https://w3c.github.io/IndexedDB/#dom-idbcursor-continueprimarykey
ExceptionOr<void> Cursor::continue_primary_key(KeyQuery const& target, KeyQuery const& target_primary_key)
{
    TRY(check_can_move("continuePrimaryKey"sv));

    // Unlike continue(), the current position is kept if it already satisfies either target.
    while (!is_exhausted() && !target.matches(*m_key) && !target_primary_key.matches(*m_primary_key))
        progress();

    return request()->rerun();
}

ExceptionOr<void> Cursor::check_has_value(StringView operation) const
{
    if (m_object_store->transaction().is_finished())
        return InvalidStateError::create(String::formatted("{}: Transaction has finished", operation));

    if (m_key_only)
        return InvalidStateError::create(String::formatted("{}: Cursor does not have a value", operation));

    if (is_exhausted())
        return InvalidStateError::create(String::formatted("{}: Cursor has iterated past the end of the set", operation));

    auto request = m_request.strong_ref();
    if (!request)
        return InvalidStateError::create(String::formatted("{}: Cursor's request no longer exists", operation));
    if (!request->is_done())
        return InvalidStateError::create(String::formatted("{}: Cursor is currently iterating", operation));

    return {};
}

// https://w3c.github.io/IndexedDB/#dom-idbcursor-update
ExceptionOr<NonnullRefPtr<Request>> Cursor::update(JsonValue const& value)
{
    TRY(check_has_value("update"sv));

    // If the store uses in-line keys, the key in the new value must not change.
    if (auto key_path = m_object_store->key_path(); key_path.has_value()) {
        auto key = TRY(extract_key_from_value(value, *key_path));
        if (!key.has_value() || !Key::equals(*key, *m_primary_key))
            return DataError::create(String::formatted("update: The key at '{}' must be the cursor's primary key {}", *key_path, *m_primary_key));
        return m_object_store->put(value);
    }

    return m_object_store->put(value, *m_primary_key);
}

// https://w3c.github.io/IndexedDB/#dom-idbcursor-delete
ExceptionOr<NonnullRefPtr<Request>> Cursor::delete_()
{
    TRY(check_has_value("delete"sv));
    return m_object_store->delete_(*m_primary_key);
}

}
