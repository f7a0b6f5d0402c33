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
#include <AK/String.h>
#include <AK/Vector.h>
#include <AK/Weakable.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/KeyRange.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#dictdef-idbindexparameters
struct IndexParameters {
    bool unique { false };
    bool multi_entry { false };
};

// https://w3c.github.io/IndexedDB/#object-store-handle-construct
// A handle to the object store named name, as seen by one transaction.
class INDEXEDSTORE_API ObjectStore final
    : public RefCounted<ObjectStore>
    , public Weakable<ObjectStore> {
public:
    static NonnullRefPtr<ObjectStore> create(NonnullRefPtr<Transaction>, String name);

    ~ObjectStore();

    String const& name() const { return m_name; }
    Optional<String> key_path();
    bool auto_increment();
    Vector<String> index_names();

    Transaction& transaction() { return *m_transaction; }

    ExceptionOr<NonnullRefPtr<Request>> put(JsonValue const& value, Optional<Key> key = {});
    ExceptionOr<NonnullRefPtr<Request>> add(JsonValue const& value, Optional<Key> key = {});
    ExceptionOr<NonnullRefPtr<Request>> delete_(KeyQuery);
    ExceptionOr<NonnullRefPtr<Request>> clear();

    ExceptionOr<NonnullRefPtr<Request>> get(KeyQuery);
    ExceptionOr<NonnullRefPtr<Request>> get_key(KeyQuery);
    ExceptionOr<NonnullRefPtr<Request>> get_all(Optional<KeyQuery> = {}, Optional<u32> count = {});
    ExceptionOr<NonnullRefPtr<Request>> get_all_keys(Optional<KeyQuery> = {}, Optional<u32> count = {});
    ExceptionOr<NonnullRefPtr<Request>> count(Optional<KeyQuery> = {});

    ExceptionOr<NonnullRefPtr<Request>> open_cursor(Optional<KeyQuery> = {}, CursorDirection = CursorDirection::Next);
    ExceptionOr<NonnullRefPtr<Request>> open_key_cursor(Optional<KeyQuery> = {}, CursorDirection = CursorDirection::Next);

    ExceptionOr<NonnullRefPtr<Index>> index(String const& name);
    ExceptionOr<NonnullRefPtr<Index>> create_index(String const& name, String const& key_path, IndexParameters = {});
    ExceptionOr<void> delete_index(String const& name);

    // The store's data in the transaction, or null if the store has been deleted.
    RefPtr<StoreData> store_data();

private:
    ObjectStore(NonnullRefPtr<Transaction>, String name, Optional<String> key_path, bool auto_increment);

    ExceptionOr<NonnullRefPtr<Request>> put_or_add(JsonValue const& value, Optional<Key> key, bool no_overwrite, StringView operation);
    ExceptionOr<NonnullRefPtr<StoreData>> check_can_read(StringView operation);
    ExceptionOr<NonnullRefPtr<StoreData>> check_can_write(StringView operation);
    ExceptionOr<NonnullRefPtr<StoreData>> check_can_change_schema(StringView operation);
    ExceptionOr<NonnullRefPtr<Request>> open_cursor_with_key_only(Optional<KeyQuery>, CursorDirection, Cursor::KeyOnly, StringView operation);

    NonnullRefPtr<Transaction> m_transaction;
    String m_name;
    Optional<String> m_key_path;
    bool m_auto_increment { false };
};

}
