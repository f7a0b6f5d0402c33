/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Exception.h>

namespace IndexedStore {

StringView error_kind_to_string(ErrorKind kind)
{
    switch (kind) {
#define __ENUMERATE_ERROR_KIND(kind, name) \
    case ErrorKind::kind:                  \
        return name##sv;
        ENUMERATE_INDEXEDSTORE_ERROR_KINDS
#undef __ENUMERATE_ERROR_KIND
    }
    VERIFY_NOT_REACHED();
}

}
