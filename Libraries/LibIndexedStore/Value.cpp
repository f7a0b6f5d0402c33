/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/JsonArray.h>
#include <AK/JsonObject.h>
#include <LibIndexedStore/Value.h>

namespace IndexedStore {

static ExceptionOr<void> verify_value_is_cloneable(JsonValue const& value)
{
    if (value.is_number()) {
        auto number = value.get_double_with_precision_loss();
        if (!number.has_value() || !isfinite(*number))
            return DataCloneError::create("Values must not contain non-finite numbers"_string);
        return {};
    }

    if (value.is_array()) {
        for (size_t i = 0; i < value.as_array().size(); ++i)
            TRY(verify_value_is_cloneable(value.as_array().at(i)));
        return {};
    }

    if (value.is_object()) {
        return value.as_object().try_for_each_member([](String const&, JsonValue const& member) -> ExceptionOr<void> {
            return verify_value_is_cloneable(member);
        });
    }

    return {};
}

ExceptionOr<JsonValue> clone_value(JsonValue const& value)
{
    TRY(verify_value_is_cloneable(value));

    // Copying a JsonValue copies every nested array and object.
    return JsonValue { value };
}

Optional<JsonValue const&> evaluate_key_path_on_value(JsonValue const& value, StringView key_path)
{
    JsonValue const* current = &value;

    for (auto identifier : key_path.split_view('.', SplitBehavior::KeepEmpty)) {
        if (!current->is_object())
            return {};

        auto member = current->as_object().get(identifier);
        if (!member.has_value())
            return {};

        current = &member.value();
    }

    return *current;
}

ExceptionOr<Optional<Key>> extract_key_from_value(JsonValue const& value, StringView key_path)
{
    auto member = evaluate_key_path_on_value(value, key_path);
    if (!member.has_value())
        return Optional<Key> {};

    auto key = TRY(Key::from_json(*member));
    return Optional<Key> { move(key) };
}

ExceptionOr<void> inject_key_into_value(JsonValue& value, StringView key_path, Key const& key)
{
    auto identifiers = key_path.split_view('.', SplitBehavior::KeepEmpty);
    VERIFY(!identifiers.is_empty());

    JsonValue* current = &value;

    for (size_t i = 0; i < identifiers.size() - 1; ++i) {
        if (!current->is_object())
            return DataError::create(String::formatted("Cannot inject a key at '{}' into a value that is not an object", key_path));

        auto& object = current->as_object();
        if (!object.has(identifiers[i]))
            object.set(identifiers[i], JsonObject {});

        current = &object.get(identifiers[i]).value();
    }

    if (!current->is_object())
        return DataError::create(String::formatted("Cannot inject a key at '{}' into a value that is not an object", key_path));

    current->as_object().set(identifiers.last(), key.to_json());
    return {};
}

}
