/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/JsonValue.h>
#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
#include <AK/RefCounted.h>
#include <AK/RefPtr.h>
#include <AK/StringView.h>
#include <AK/Vector.h>
#include <AK/WeakPtr.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/KeyRange.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#enumdef-idbcursordirection
enum class CursorDirection : u8 {
    Next,
    NextUnique,
    Prev,
    PrevUnique,
};

INDEXEDSTORE_API StringView cursor_direction_to_string(CursorDirection);

// A step of a cursor: the key it is positioned at, and the primary key of the record it refers to.
// For cursors over an object store both keys are the same.
struct RecordPosition {
    Key key;
    Key primary_key;
};

// https://w3c.github.io/IndexedDB/#cursor-interface
class INDEXEDSTORE_API Cursor : public RefCounted<Cursor> {
public:
    enum class KeyOnly {
        No,
        Yes,
    };

    static ExceptionOr<NonnullRefPtr<Cursor>> create(Request&, Optional<KeyQuery>, CursorDirection, KeyOnly);

    ~Cursor();

    CursorDirection direction() const { return m_direction; }
    bool key_only() const { return m_key_only; }

    ObjectStore& object_store() { return *m_object_store; }
    RefPtr<Index> index() const { return m_index; }
    RefPtr<Request> request() const;

    Optional<Key> const& key() const { return m_key; }
    Optional<Key> const& primary_key() const { return m_primary_key; }

    // Key-only cursors never have a value.
    Optional<JsonValue> value() const;

    // The number of records the cursor iterates over, fixed when it was created.
    size_t count() const { return m_positions.size(); }

    bool is_exhausted() const { return !m_primary_key.has_value(); }

    ExceptionOr<void> continue_(Optional<KeyQuery> target = {});
    ExceptionOr<void> advance(u32 count);
    ExceptionOr<void> continue_primary_key(KeyQuery const& target, KeyQuery const& target_primary_key);

    ExceptionOr<NonnullRefPtr<Request>> update(JsonValue const&);
    ExceptionOr<NonnullRefPtr<Request>> delete_();

private:
    Cursor(Request&, NonnullRefPtr<ObjectStore>, RefPtr<Index>, CursorDirection, KeyOnly, Vector<RecordPosition>);

    void progress();
    ExceptionOr<void> check_can_move(StringView operation) const;
    ExceptionOr<void> check_has_value(StringView operation) const;

    WeakPtr<Request> m_request;
    NonnullRefPtr<ObjectStore> m_object_store;
    RefPtr<Index> m_index;

    CursorDirection m_direction { CursorDirection::Next };
    bool m_key_only { false };

    // The positions still ahead of the cursor, in iteration order, computed when the cursor was opened.
    Vector<RecordPosition> m_positions;
    size_t m_next_position { 0 };

    Optional<Key> m_key;
    Optional<Key> m_primary_key;
    RefPtr<RecordValue> m_value;
};

}
