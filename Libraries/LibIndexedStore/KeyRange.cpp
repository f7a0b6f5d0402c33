/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/KeyRange.h>

namespace IndexedStore {

ExceptionOr<KeyRange> KeyRange::create(Optional<Key> lower, Optional<Key> upper, bool lower_open, bool upper_open)
{
    // If lower is greater than upper, throw a "DataError" DOMException.
    if (lower.has_value() && upper.has_value() && Key::greater_than(*lower, *upper))
        return DataError::create("Lower bound of a key range must not be greater than its upper bound"_string);

    return KeyRange { move(lower), move(upper), lower_open, upper_open };
}

// https://w3c.github.io/IndexedDB/#dom-idbkeyrange-only
KeyRange KeyRange::only(Key key)
{
    auto upper = key;
    return KeyRange { move(key), move(upper), false, false };
}

// https://w3c.github.io/IndexedDB/#dom-idbkeyrange-bound
ExceptionOr<KeyRange> KeyRange::bound(Key lower, Key upper, bool lower_open, bool upper_open)
{
    return create(move(lower), move(upper), lower_open, upper_open);
}

// https://w3c.github.io/IndexedDB/#dom-idbkeyrange-lowerbound
KeyRange KeyRange::lower_bound(Key key, bool open)
{
    return KeyRange { move(key), {}, open, true };
}

// https://w3c.github.io/IndexedDB/#dom-idbkeyrange-upperbound
KeyRange KeyRange::upper_bound(Key key, bool open)
{
    return KeyRange { {}, move(key), true, open };
}

bool KeyRange::is_in_range(Key const& key) const
{
    // A key is in a key range range if both of the following conditions are fulfilled:

    // * The range’s lower bound is null, or it is less than key, or it is both equal to key and the range’s lower open flag is false.
    if (m_lower.has_value()) {
        auto comparison = Key::compare_two_keys(*m_lower, key);
        if (comparison > 0 || (comparison == 0 && m_lower_open))
            return false;
    }

    // * The range’s upper bound is null, or it is greater than key, or it is both equal to key and the range’s upper open flag is false.
    if (m_upper.has_value()) {
        auto comparison = Key::compare_two_keys(*m_upper, key);
        if (comparison < 0 || (comparison == 0 && m_upper_open))
            return false;
    }

    return true;
}

ExceptionOr<KeyQuery> KeyQuery::any_of(Vector<Entry> entries)
{
    if (entries.is_empty())
        return DataError::create("A list of keys must not be empty"_string);
    return KeyQuery { move(entries) };
}

bool KeyQuery::matches(Key const& key) const
{
    for (auto const& entry : m_entries) {
        auto matched = entry.visit(
            [&](Key const& candidate) { return Key::equals(candidate, key); },
            [&](KeyRange const& range) { return range.is_in_range(key); });
        if (matched)
            return true;
    }
    return false;
}

}
