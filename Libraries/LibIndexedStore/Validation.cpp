/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/CharacterTypes.h>
#include <LibIndexedStore/Validation.h>

namespace IndexedStore {

bool is_valid_identifier(StringView identifier)
{
    if (identifier.is_empty())
        return false;

    auto first = identifier[0];
    if (!is_ascii_lower_alpha(first) && first != '_')
        return false;

    for (auto ch : identifier.substring_view(1)) {
        if (!is_ascii_alphanumeric(ch) && ch != '_' && ch != '-' && ch != '$')
            return false;
    }

    return true;
}

bool is_valid_key_path(StringView key_path)
{
    auto segments = key_path.split_view('.', SplitBehavior::KeepEmpty);
    if (segments.is_empty())
        return false;

    for (auto segment : segments) {
        if (!is_valid_identifier(segment))
            return false;
    }
    return true;
}

bool is_valid_multi_key_path(ReadonlySpan<StringView> key_paths)
{
    if (key_paths.is_empty())
        return false;

    for (auto key_path : key_paths) {
        if (!is_valid_key_path(key_path))
            return false;
    }
    return true;
}

bool is_valid_version(u64 version)
{
    return version > 0;
}

}
