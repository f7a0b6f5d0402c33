/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Key.h>

namespace IndexedStore {

ExceptionOr<Key> Key::create_number(double number)
{
    if (!isfinite(number))
        return DataError::create("Number keys must be finite"_string);
    return Key { number };
}

// https://w3c.github.io/IndexedDB/#convert-a-value-to-a-key
ExceptionOr<Key> Key::from_json(JsonValue const& value)
{
    if (value.is_string())
        return Key { value.as_string() };

    if (value.is_number()) {
        auto number = value.get_double_with_precision_loss();
        VERIFY(number.has_value());
        return create_number(*number);
    }

    return DataError::create("A key must be a finite number, a date or a string"_string);
}

Key::Type Key::type() const
{
    return m_value.visit(
        [](double) { return Type::Number; },
        [](UnixDateTime const&) { return Type::Date; },
        [](String const&) { return Type::String; });
}

JsonValue Key::to_json() const
{
    return m_value.visit(
        [](double number) { return JsonValue { number }; },
        [](UnixDateTime const& date) { return JsonValue { date.offset_to_epoch().to_milliseconds() }; },
        [](String const& string) { return JsonValue { string }; });
}

String Key::to_string() const
{
    return m_value.visit(
        [](double number) { return String::number(number); },
        [](UnixDateTime const& date) { return String::formatted("Date({})", date.offset_to_epoch().to_milliseconds()); },
        [](String const& string) { return String::formatted("\"{}\"", string); });
}

int Key::compare_two_keys(Key const& a, Key const& b)
{
    // 1. Let ta be the type of a.
    auto ta = a.type();

    // 2. Let tb be the type of b.
    auto tb = b.type();

    // 3. If ta does not equal tb, then the key whose type orders first is less.
    if (ta != tb)
        return to_underlying(ta) < to_underlying(tb) ? -1 : 1;

    switch (ta) {
    case Type::Number: {
        auto va = a.number();
        auto vb = b.number();
        if (va == vb)
            return 0;
        return va < vb ? -1 : 1;
    }
    case Type::Date: {
        auto va = a.date().offset_to_epoch().to_milliseconds();
        auto vb = b.date().offset_to_epoch().to_milliseconds();
        if (va == vb)
            return 0;
        return va < vb ? -1 : 1;
    }
    case Type::String: {
        // UTF-8 byte order is code point order.
        auto comparison = a.string().bytes_as_string_view().compare(b.string().bytes_as_string_view());
        if (comparison == 0)
            return 0;
        return comparison < 0 ? -1 : 1;
    }
    }
    VERIFY_NOT_REACHED();
}

}
