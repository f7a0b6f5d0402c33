/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
#include <AK/RefCounted.h>
#include <AK/String.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>
#include <LibIndexedStore/KeyRange.h>
#include <LibIndexedStore/Operation.h>
#include <LibIndexedStore/StoreData.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#index-handle-construct
// Index keys are not stored: every operation evaluates the key path against the current records.
class INDEXEDSTORE_API Index final : public RefCounted<Index> {
public:
    static NonnullRefPtr<Index> create(NonnullRefPtr<ObjectStore>, String name);

    ~Index();

    String const& name() const { return m_name; }
    String const& key_path() const { return m_key_path; }
    bool unique() const { return m_unique; }
    bool multi_entry() const { return m_multi_entry; }

    ObjectStore& object_store() { return *m_object_store; }
    ObjectStore const& object_store() const { return *m_object_store; }

    ExceptionOr<NonnullRefPtr<Request>> get(KeyQuery);
    ExceptionOr<NonnullRefPtr<Request>> get_key(KeyQuery);
    ExceptionOr<NonnullRefPtr<Request>> get_all(Optional<KeyQuery> = {}, Optional<u32> count = {});
    ExceptionOr<NonnullRefPtr<Request>> get_all_keys(Optional<KeyQuery> = {}, Optional<u32> count = {});
    ExceptionOr<NonnullRefPtr<Request>> count(Optional<KeyQuery> = {});

    ExceptionOr<NonnullRefPtr<Request>> open_cursor(Optional<KeyQuery> = {}, CursorDirection = CursorDirection::Next);
    ExceptionOr<NonnullRefPtr<Request>> open_key_cursor(Optional<KeyQuery> = {}, CursorDirection = CursorDirection::Next);

private:
    Index(NonnullRefPtr<ObjectStore>, String name, IndexDescriptor const&);

    ExceptionOr<void> check_can_read(StringView operation);
    ExceptionOr<NonnullRefPtr<Request>> request(Operation, StringView operation);

    NonnullRefPtr<ObjectStore> m_object_store;
    String m_name;
    String m_key_path;
    bool m_unique { false };
    bool m_multi_entry { false };
};

}
