/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/JsonValue.h>
#include <AK/Optional.h>
#include <AK/String.h>
#include <AK/StringView.h>
#include <AK/Vector.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/KeyRange.h>
#include <LibIndexedStore/StoreData.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#create-a-sorted-name-list
INDEXEDSTORE_API Vector<String> create_a_sorted_name_list(Vector<String>);

// https://w3c.github.io/IndexedDB/#store-a-record-into-an-object-store
INDEXEDSTORE_API ExceptionOr<Key> store_a_record_into_an_object_store(StoreData&, JsonValue value, Optional<Key> key, bool no_overwrite);

// Returns the positions a cursor over the store (or over one of its indexes, if an index key path is given)
// steps through. Positions are ordered by key and then by primary key, and reversed for the "prev" directions.
// The unique directions keep only the first position of each run of equal keys.
INDEXEDSTORE_API Vector<RecordPosition> collect_record_positions(StoreData const&, Optional<String> const& index_key_path, Optional<KeyQuery> const&, CursorDirection);

// https://w3c.github.io/IndexedDB/#count-the-records-in-a-range
INDEXEDSTORE_API u64 count_the_records_in_a_range(StoreData const&, Optional<String> const& index_key_path, Optional<KeyQuery> const&);

}
