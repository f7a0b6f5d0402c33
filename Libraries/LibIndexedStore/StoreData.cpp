/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/BinarySearch.h>
#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/StoreData.h>

namespace IndexedStore {

NonnullRefPtr<StoreData> StoreData::create(Optional<String> key_path, bool auto_increment)
{
    return adopt_ref(*new StoreData(move(key_path), auto_increment));
}

NonnullRefPtr<StoreData> StoreData::clone() const
{
    auto copy = create(m_key_path, m_auto_increment);
    copy->m_current_number = m_current_number;
    copy->m_records = m_records;
    copy->m_indexes = m_indexes;
    return copy;
}

static int compare_key_to_record(Key const& key, Record const& record)
{
    return Key::compare_two_keys(key, record.key);
}

// The position of the first record whose key is not less than key.
size_t StoreData::lower_bound(Key const& key) const
{
    size_t nearby_index = 0;
    if (binary_search(m_records, key, &nearby_index, compare_key_to_record))
        return nearby_index;

    if (nearby_index < m_records.size() && Key::less_than(m_records[nearby_index].key, key))
        return nearby_index + 1;
    return nearby_index;
}

Optional<size_t> StoreData::index_of_record_with_key(Key const& key) const
{
    size_t index = 0;
    if (!binary_search(m_records, key, &index, compare_key_to_record))
        return {};
    return index;
}

Optional<Record const&> StoreData::record_with_key(Key const& key) const
{
    auto index = index_of_record_with_key(key);
    if (!index.has_value())
        return {};
    return m_records[*index];
}

// https://w3c.github.io/IndexedDB/#store-a-record-into-an-object-store
void StoreData::store_record(Key key, NonnullRefPtr<RecordValue> value)
{
    auto index = lower_bound(key);

    // If a record already exists in store with the same key, it is replaced.
    if (index < m_records.size() && Key::equals(m_records[index].key, key)) {
        m_records[index].value = move(value);
        return;
    }

    m_records.insert(index, Record { move(key), move(value) });
}

void StoreData::delete_records_in_range(KeyQuery const& query)
{
    m_records.remove_all_matching([&](Record const& record) {
        return query.matches(record.key);
    });
}

void StoreData::clear()
{
    m_records.clear();
}

// https://w3c.github.io/IndexedDB/#generate-a-key
u64 StoreData::generate_key()
{
    return ++m_current_number;
}

// https://w3c.github.io/IndexedDB/#possibly-update-the-key-generator
void StoreData::possibly_update_key_generator(Key const& key)
{
    if (!m_auto_increment || !key.is_number())
        return;

    auto value = floor(key.number());
    if (value <= 0 || value <= static_cast<double>(m_current_number))
        return;

    // The generator stops at 2^53, the largest integer that is exactly representable.
    m_current_number = static_cast<u64>(min(value, 9007199254740992.0));
}

Optional<IndexDescriptor const&> StoreData::index_with_name(String const& name) const
{
    auto it = m_indexes.find(name);
    if (it == m_indexes.end())
        return {};
    return it->value;
}

void StoreData::add_index(String name, IndexDescriptor index)
{
    m_indexes.set(move(name), move(index));
}

void StoreData::remove_index(String const& name)
{
    m_indexes.remove(name);
}

Vector<String> StoreData::index_names() const
{
    return create_a_sorted_name_list(m_indexes.keys());
}

}
