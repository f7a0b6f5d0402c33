/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Error.h>
#include <AK/Format.h>
#include <AK/String.h>
#include <AK/StringView.h>
#include <AK/Types.h>
#include <LibIndexedStore/Export.h>

namespace IndexedStore {

#define ENUMERATE_INDEXEDSTORE_ERROR_KINDS                   \
    __ENUMERATE_ERROR_KIND(InvalidState, "InvalidStateError") \
    __ENUMERATE_ERROR_KIND(Data, "DataError")                 \
    __ENUMERATE_ERROR_KIND(Constraint, "ConstraintError")     \
    __ENUMERATE_ERROR_KIND(NotFound, "NotFoundError")         \
    __ENUMERATE_ERROR_KIND(Version, "VersionError")           \
    __ENUMERATE_ERROR_KIND(Abort, "AbortError")               \
    __ENUMERATE_ERROR_KIND(ReadOnly, "ReadOnlyError")         \
    __ENUMERATE_ERROR_KIND(DataClone, "DataCloneError")       \
    __ENUMERATE_ERROR_KIND(Type, "TypeError")

enum class ErrorKind : u8 {
#define __ENUMERATE_ERROR_KIND(kind, name) kind,
    ENUMERATE_INDEXEDSTORE_ERROR_KINDS
#undef __ENUMERATE_ERROR_KIND
};

INDEXEDSTORE_API StringView error_kind_to_string(ErrorKind);

// An error raised by a store operation. The kind mirrors the DOMException names used by the IndexedDB API.
class INDEXEDSTORE_API Exception {
public:
    Exception(ErrorKind kind, String message)
        : m_kind(kind)
        , m_message(move(message))
    {
    }

    ErrorKind kind() const { return m_kind; }
    StringView name() const { return error_kind_to_string(m_kind); }
    String const& message() const { return m_message; }

    bool operator==(Exception const&) const = default;

private:
    ErrorKind m_kind;
    String m_message;
};

template<typename T>
using ExceptionOr = AK::ErrorOr<T, Exception>;

#define __ENUMERATE_ERROR_KIND(kind, name)                       \
    struct kind##Error {                                         \
        static Exception create(String message)                  \
        {                                                        \
            return Exception { ErrorKind::kind, move(message) }; \
        }                                                        \
    };
ENUMERATE_INDEXEDSTORE_ERROR_KINDS
#undef __ENUMERATE_ERROR_KIND

}

namespace AK {

template<>
struct Formatter<IndexedStore::ErrorKind> final : Formatter<StringView> {
    ErrorOr<void> format(FormatBuilder& builder, IndexedStore::ErrorKind kind)
    {
        return Formatter<StringView>::format(builder, IndexedStore::error_kind_to_string(kind));
    }
};

template<>
struct Formatter<IndexedStore::Exception> : Formatter<FormatString> {
    ErrorOr<void> format(FormatBuilder& builder, IndexedStore::Exception const& exception)
    {
        return Formatter<FormatString>::format(builder, "{}: {}"sv, exception.name(), exception.message());
    }
};

}
