/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/StringView.h>
#include <AK/Vector.h>
#include <LibIndexedStore/Export.h>

namespace IndexedStore {

// Database, object store and index names, and each segment of a key path, match [a-z_][A-Za-z0-9_\-$]*.
INDEXEDSTORE_API bool is_valid_identifier(StringView);

// A key path is one or more identifiers separated by periods, e.g. "id" or "author.name".
INDEXEDSTORE_API bool is_valid_key_path(StringView);
INDEXEDSTORE_API bool is_valid_multi_key_path(ReadonlySpan<StringView>);

INDEXEDSTORE_API bool is_valid_version(u64);

}
