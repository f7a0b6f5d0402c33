/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/JsonValue.h>
#include <AK/Optional.h>
#include <AK/StringView.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Key.h>

namespace IndexedStore {

// Returns an independent deep copy of a JSON-like value. Non-finite numbers cannot be stored.
INDEXEDSTORE_API ExceptionOr<JsonValue> clone_value(JsonValue const&);

// https://w3c.github.io/IndexedDB/#evaluate-a-key-path-on-a-value
// Each period-separated segment of the key path selects a member of the object reached so far.
INDEXEDSTORE_API Optional<JsonValue const&> evaluate_key_path_on_value(JsonValue const&, StringView key_path);

// https://w3c.github.io/IndexedDB/#extract-a-key-from-a-value-using-a-key-path
// Returns an empty optional if the value has nothing at the key path, and a DataError if what it has is not a key.
INDEXEDSTORE_API ExceptionOr<Optional<Key>> extract_key_from_value(JsonValue const&, StringView key_path);

// https://w3c.github.io/IndexedDB/#inject-a-key-into-a-value-using-a-key-path
INDEXEDSTORE_API ExceptionOr<void> inject_key_into_value(JsonValue&, StringView key_path, Key const&);

}
