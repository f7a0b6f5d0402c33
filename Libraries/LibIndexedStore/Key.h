/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Format.h>
#include <AK/JsonValue.h>
#include <AK/String.h>
#include <AK/Time.h>
#include <AK/Variant.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <math.h>

namespace IndexedStore {

// A record key. Valid keys are finite numbers, dates and strings.
class INDEXEDSTORE_API Key {
public:
    // Keys of different types order by type first, in declaration order.
    enum class Type : u8 {
        Number,
        Date,
        String,
    };

    Key(double number)
        : m_value(number)
    {
        VERIFY(isfinite(number));
    }

    Key(UnixDateTime date)
        : m_value(date)
    {
    }

    Key(String string)
        : m_value(move(string))
    {
    }

    static ExceptionOr<Key> create_number(double);
    static ExceptionOr<Key> from_json(JsonValue const&);

    Type type() const;
    bool is_number() const { return m_value.has<double>(); }
    bool is_date() const { return m_value.has<UnixDateTime>(); }
    bool is_string() const { return m_value.has<String>(); }

    double number() const { return m_value.get<double>(); }
    UnixDateTime date() const { return m_value.get<UnixDateTime>(); }
    String const& string() const { return m_value.get<String>(); }

    // Dates have no JSON representation, so they convert to their millisecond offset from the epoch.
    JsonValue to_json() const;
    String to_string() const;

    // https://w3c.github.io/IndexedDB/#compare-two-keys
    static int compare_two_keys(Key const& a, Key const& b);

    static bool equals(Key const& a, Key const& b) { return compare_two_keys(a, b) == 0; }
    static bool less_than(Key const& a, Key const& b) { return compare_two_keys(a, b) < 0; }
    static bool greater_than(Key const& a, Key const& b) { return compare_two_keys(a, b) > 0; }

    bool operator==(Key const& other) const { return equals(*this, other); }

private:
    Variant<double, UnixDateTime, String> m_value;
};

}

template<>
struct AK::Formatter<IndexedStore::Key> : AK::Formatter<StringView> {
    ErrorOr<void> format(FormatBuilder& builder, IndexedStore::Key const& key)
    {
        return Formatter<StringView>::format(builder, key.to_string());
    }
};
