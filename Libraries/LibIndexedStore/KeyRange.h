/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Optional.h>
#include <AK/Variant.h>
#include <AK/Vector.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Key.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#range-construct
class INDEXEDSTORE_API KeyRange {
public:
    static ExceptionOr<KeyRange> create(Optional<Key> lower, Optional<Key> upper, bool lower_open = false, bool upper_open = false);

    static KeyRange only(Key);
    static ExceptionOr<KeyRange> bound(Key lower, Key upper, bool lower_open = false, bool upper_open = false);
    static KeyRange lower_bound(Key, bool open = false);
    static KeyRange upper_bound(Key, bool open = false);

    Optional<Key> const& lower() const { return m_lower; }
    Optional<Key> const& upper() const { return m_upper; }
    bool lower_open() const { return m_lower_open; }
    bool upper_open() const { return m_upper_open; }

    // https://w3c.github.io/IndexedDB/#in
    bool is_in_range(Key const&) const;

private:
    KeyRange(Optional<Key> lower, Optional<Key> upper, bool lower_open, bool upper_open)
        : m_lower(move(lower))
        , m_upper(move(upper))
        , m_lower_open(lower_open)
        , m_upper_open(upper_open)
    {
    }

    Optional<Key> m_lower;
    Optional<Key> m_upper;
    bool m_lower_open { false };
    bool m_upper_open { false };
};

// The filter accepted by lookups, deletes and cursors: a single key, a key range, or a non-empty
// list of keys and ranges that matches when any of its entries does.
class INDEXEDSTORE_API KeyQuery {
public:
    using Entry = Variant<Key, KeyRange>;

    KeyQuery(Key key)
    {
        m_entries.append(move(key));
    }

    KeyQuery(KeyRange range)
    {
        m_entries.append(move(range));
    }

    static ExceptionOr<KeyQuery> any_of(Vector<Entry>);

    bool matches(Key const&) const;

    Vector<Entry> const& entries() const { return m_entries; }

private:
    explicit KeyQuery(Vector<Entry> entries)
        : m_entries(move(entries))
    {
    }

    Vector<Entry> m_entries;
};

}
