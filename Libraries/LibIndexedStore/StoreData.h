/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/HashMap.h>
#include <AK/JsonValue.h>
#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
#include <AK/RefCounted.h>
#include <AK/String.h>
#include <AK/Vector.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/KeyRange.h>

namespace IndexedStore {

// A stored value. Values are never modified once stored, so snapshots share them.
class RecordValue : public RefCounted<RecordValue> {
public:
    static NonnullRefPtr<RecordValue> create(JsonValue value)
    {
        return adopt_ref(*new RecordValue(move(value)));
    }

    JsonValue const& value() const { return m_value; }

private:
    explicit RecordValue(JsonValue value)
        : m_value(move(value))
    {
    }

    JsonValue m_value;
};

struct Record {
    Key key;
    NonnullRefPtr<RecordValue> value;
};

// https://w3c.github.io/IndexedDB/#index-construct
// The unique and multi_entry flags are recorded but not enforced.
struct IndexDescriptor {
    String key_path;
    bool unique { false };
    bool multi_entry { false };
};

// The records, key generator and index metadata of a single object store.
class INDEXEDSTORE_API StoreData : public RefCounted<StoreData> {
public:
    static NonnullRefPtr<StoreData> create(Optional<String> key_path, bool auto_increment);

    // Returns a copy that can be modified without affecting this one. Record values are shared.
    NonnullRefPtr<StoreData> clone() const;

    Optional<String> const& key_path() const { return m_key_path; }
    bool auto_increment() const { return m_auto_increment; }

    // The list of records is kept sorted by key in ascending order.
    Vector<Record> const& records() const { return m_records; }

    Optional<Record const&> record_with_key(Key const&) const;
    bool has_record_with_key(Key const& key) const { return record_with_key(key).has_value(); }

    void store_record(Key, NonnullRefPtr<RecordValue>);
    void delete_records_in_range(KeyQuery const&);
    void clear();

    // https://w3c.github.io/IndexedDB/#key-generator-construct
    u64 current_number() const { return m_current_number; }
    u64 generate_key();
    void possibly_update_key_generator(Key const&);

    HashMap<String, IndexDescriptor> const& indexes() const { return m_indexes; }
    Optional<IndexDescriptor const&> index_with_name(String const&) const;
    void add_index(String name, IndexDescriptor);
    void remove_index(String const& name);
    Vector<String> index_names() const;

private:
    StoreData(Optional<String> key_path, bool auto_increment)
        : m_key_path(move(key_path))
        , m_auto_increment(auto_increment)
    {
    }

    Optional<size_t> index_of_record_with_key(Key const&) const;
    size_t lower_bound(Key const&) const;

    Optional<String> m_key_path;
    bool m_auto_increment { false };
    u64 m_current_number { 0 };
    Vector<Record> m_records;
    HashMap<String, IndexDescriptor> m_indexes;
};

}
