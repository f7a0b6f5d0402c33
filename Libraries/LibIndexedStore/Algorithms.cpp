/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/QuickSort.h>
#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Value.h>

namespace IndexedStore {

// The largest integer a key generator produces, 2^53.
static constexpr u64 key_generator_limit = 9007199254740992ull;

Vector<String> create_a_sorted_name_list(Vector<String> names)
{
    // 1. Let sorted be names sorted in ascending order with the code unit less than algorithm.
    quick_sort(names, [](String const& a, String const& b) {
        return a.bytes_as_string_view().compare(b.bytes_as_string_view()) < 0;
    });

    // 2. Return sorted.
    return names;
}

ExceptionOr<Key> store_a_record_into_an_object_store(StoreData& store, JsonValue value, Optional<Key> key, bool no_overwrite)
{
    // 1. If store uses a key generator, then:
    if (store.auto_increment()) {
        // 1. If key is undefined, then:
        if (!key.has_value()) {
            // 1. Let key be the result of generating a key for store.
            // 2. If key is failure, then this operation failed with a "ConstraintError" DOMException.
            if (store.current_number() >= key_generator_limit)
                return ConstraintError::create("Key generator has reached its maximum value"_string);

            key = Key { static_cast<double>(store.generate_key()) };

            // 3. If store also uses in-line keys, then inject key into value using store's key path.
            if (store.key_path().has_value())
                TRY(inject_key_into_value(value, *store.key_path(), *key));
        }
        // 2. Otherwise, possibly update the key generator for store with key.
        else {
            store.possibly_update_key_generator(*key);
        }
    }

    VERIFY(key.has_value());

    // 2. If the no-overwrite flag was given to these steps and is true, and a record already exists in store
    //    with its key equal to key, then this operation failed with a "ConstraintError" DOMException.
    if (no_overwrite && store.has_record_with_key(*key))
        return ConstraintError::create(String::formatted("A record with key {} already exists", *key));

    // 3. If a record already exists in store with its key equal to key, then remove the record from store.
    // 4. Store a record in store containing key as its key and value as its value.
    store.store_record(*key, RecordValue::create(move(value)));

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Stored record with key {}", *key);

    // 5. Return key.
    return key.release_value();
}

static int compare_record_positions(RecordPosition const& a, RecordPosition const& b)
{
    if (auto result = Key::compare_two_keys(a.key, b.key); result != 0)
        return result;
    return Key::compare_two_keys(a.primary_key, b.primary_key);
}

Vector<RecordPosition> collect_record_positions(StoreData const& store, Optional<String> const& index_key_path, Optional<KeyQuery> const& query, CursorDirection direction)
{
    Vector<RecordPosition> positions;

    for (auto const& record : store.records()) {
        Optional<Key> key;

        if (index_key_path.has_value()) {
            // Records without a valid key at the index's key path are not part of the index.
            auto index_key = extract_key_from_value(record.value->value(), *index_key_path);
            if (index_key.is_error() || !index_key.value().has_value())
                continue;
            key = index_key.release_value();
        } else {
            key = record.key;
        }

        if (query.has_value() && !query->matches(*key))
            continue;

        positions.append({ key.release_value(), record.key });
    }

    // Records are already sorted by primary key, so only index positions need sorting.
    if (index_key_path.has_value()) {
        quick_sort(positions, [](RecordPosition const& a, RecordPosition const& b) {
            return compare_record_positions(a, b) < 0;
        });
    }

    if (direction == CursorDirection::NextUnique || direction == CursorDirection::PrevUnique) {
        Vector<RecordPosition> unique_positions;
        for (auto& position : positions) {
            if (!unique_positions.is_empty() && Key::equals(unique_positions.last().key, position.key))
                continue;
            unique_positions.append(move(position));
        }
        positions = move(unique_positions);
    }

    if (direction == CursorDirection::Prev || direction == CursorDirection::PrevUnique)
        positions.reverse();

    return positions;
}

u64 count_the_records_in_a_range(StoreData const& store, Optional<String> const& index_key_path, Optional<KeyQuery> const& query)
{
    if (!index_key_path.has_value() && !query.has_value())
        return store.records().size();

    return collect_record_positions(store, index_key_path, query, CursorDirection::Next).size();
}

}
