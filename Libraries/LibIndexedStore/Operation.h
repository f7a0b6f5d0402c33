/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/JsonValue.h>
#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
#include <AK/Variant.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Forward.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/KeyRange.h>

namespace IndexedStore {

// Whether a retrieval produces the values of the matching records, or their primary keys.
enum class RetrievalType : u8 {
    Value,
    Key,
};

// https://w3c.github.io/IndexedDB/#store-a-record-into-an-object-store
struct PutOperation {
    JsonValue value;
    Optional<Key> key;
    bool no_overwrite { false };
};

struct GetOperation {
    KeyQuery query;
    RetrievalType type { RetrievalType::Value };
};

struct GetAllOperation {
    Optional<KeyQuery> query;
    Optional<u32> count;
    RetrievalType type { RetrievalType::Value };
};

struct DeleteOperation {
    KeyQuery query;
};

struct ClearOperation {
};

struct CountOperation {
    Optional<KeyQuery> query;
};

// The cursor is created when the request first executes, so it sees the writes of earlier requests.
struct OpenCursorOperation {
    Optional<KeyQuery> query;
    CursorDirection direction { CursorDirection::Next };
    Cursor::KeyOnly key_only { Cursor::KeyOnly::No };
};

// Reports the position a cursor was moved to since its request last completed.
struct IterateCursorOperation {
    NonnullRefPtr<Cursor> cursor;
};

// Hands the upgrade transaction to the open request, which fires "upgradeneeded" while it is running.
struct VersionChangeOperation {
    NonnullRefPtr<OpenRequest> open_request;
    u64 old_version { 0 };
    u64 new_version { 0 };
};

using Operation = Variant<
    PutOperation,
    GetOperation,
    GetAllOperation,
    DeleteOperation,
    ClearOperation,
    CountOperation,
    OpenCursorOperation,
    IterateCursorOperation,
    VersionChangeOperation>;

}
