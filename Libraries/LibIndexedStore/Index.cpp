/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/StoreData.h>
#include <LibIndexedStore/Transaction.h>

namespace IndexedStore {

NonnullRefPtr<Index> Index::create(NonnullRefPtr<ObjectStore> object_store, String name)
{
    auto store = object_store->store_data();
    VERIFY(store);

    auto descriptor = store->index_with_name(name);
    VERIFY(descriptor.has_value());

    return adopt_ref(*new Index(move(object_store), move(name), *descriptor));
}

Index::Index(NonnullRefPtr<ObjectStore> object_store, String name, IndexDescriptor const& descriptor)
    : m_object_store(move(object_store))
    , m_name(move(name))
    , m_key_path(descriptor.key_path)
    , m_unique(descriptor.unique)
    , m_multi_entry(descriptor.multi_entry)
{
}

Index::~Index() = default;

ExceptionOr<void> Index::check_can_read(StringView operation)
{
    auto& transaction = m_object_store->transaction();
    if (transaction.is_finished())
        return InvalidStateError::create(String::formatted("{}: Transaction has finished", operation));

    auto store = m_object_store->store_data();
    if (!store)
        return InvalidStateError::create(String::formatted("{}: Object store '{}' does not exist", operation, m_object_store->name()));

    if (!store->index_with_name(m_name).has_value())
        return InvalidStateError::create(String::formatted("{}: Index '{}' does not exist", operation, m_name));

    return {};
}

ExceptionOr<NonnullRefPtr<Request>> Index::request(Operation operation, StringView operation_name)
{
    TRY(check_can_read(operation_name));
    return m_object_store->transaction().request(NonnullRefPtr { *this }, move(operation));
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-get
ExceptionOr<NonnullRefPtr<Request>> Index::get(KeyQuery query)
{
    return request(GetOperation { move(query), RetrievalType::Value }, "get"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-getkey
ExceptionOr<NonnullRefPtr<Request>> Index::get_key(KeyQuery query)
{
    return request(GetOperation { move(query), RetrievalType::Key }, "getKey"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-getall
ExceptionOr<NonnullRefPtr<Request>> Index::get_all(Optional<KeyQuery> query, Optional<u32> count)
{
    return request(GetAllOperation { move(query), count, RetrievalType::Value }, "getAll"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-getallkeys
ExceptionOr<NonnullRefPtr<Request>> Index::get_all_keys(Optional<KeyQuery> query, Optional<u32> count)
{
    return request(GetAllOperation { move(query), count, RetrievalType::Key }, "getAllKeys"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-count
ExceptionOr<NonnullRefPtr<Request>> Index::count(Optional<KeyQuery> query)
{
    return request(CountOperation { move(query) }, "count"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-opencursor
ExceptionOr<NonnullRefPtr<Request>> Index::open_cursor(Optional<KeyQuery> query, CursorDirection direction)
{
    return request(OpenCursorOperation { move(query), direction, Cursor::KeyOnly::No }, "openCursor"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbindex-openkeycursor
ExceptionOr<NonnullRefPtr<Request>> Index::open_key_cursor(Optional<KeyQuery> query, CursorDirection direction)
{
    return request(OpenCursorOperation { move(query), direction, Cursor::KeyOnly::Yes }, "openKeyCursor"sv);
}

}
