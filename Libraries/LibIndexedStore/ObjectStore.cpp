/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/StoreData.h>
#include <LibIndexedStore/Transaction.h>
#include <LibIndexedStore/Validation.h>
#include <LibIndexedStore/Value.h>

namespace IndexedStore {

NonnullRefPtr<ObjectStore> ObjectStore::create(NonnullRefPtr<Transaction> transaction, String name)
{
    auto store = transaction->store_data(name);
    VERIFY(store);

    auto key_path = store->key_path();
    auto auto_increment = store->auto_increment();
    return adopt_ref(*new ObjectStore(move(transaction), move(name), move(key_path), auto_increment));
}

ObjectStore::ObjectStore(NonnullRefPtr<Transaction> transaction, String name, Optional<String> key_path, bool auto_increment)
    : m_transaction(move(transaction))
    , m_name(move(name))
    , m_key_path(move(key_path))
    , m_auto_increment(auto_increment)
{
}

ObjectStore::~ObjectStore() = default;

RefPtr<StoreData> ObjectStore::store_data()
{
    return m_transaction->store_data(m_name);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-keypath
Optional<String> ObjectStore::key_path()
{
    // A store deleted in this transaction keeps reporting what it was created with.
    if (auto store = store_data())
        return store->key_path();
    return m_key_path;
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-autoincrement
bool ObjectStore::auto_increment()
{
    if (auto store = store_data())
        return store->auto_increment();
    return m_auto_increment;
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-indexnames
Vector<String> ObjectStore::index_names()
{
    auto store = store_data();
    if (!store)
        return {};
    return store->index_names();
}

ExceptionOr<NonnullRefPtr<StoreData>> ObjectStore::check_can_read(StringView operation)
{
    if (m_transaction->is_finished())
        return InvalidStateError::create(String::formatted("{}: Transaction has finished", operation));

    auto store = store_data();
    if (!store)
        return InvalidStateError::create(String::formatted("{}: Object store '{}' does not exist", operation, m_name));
    return store.release_nonnull();
}

ExceptionOr<NonnullRefPtr<StoreData>> ObjectStore::check_can_write(StringView operation)
{
    if (m_transaction->is_readonly())
        return ReadOnlyError::create(String::formatted("{}: Transaction is read only", operation));
    return check_can_read(operation);
}

ExceptionOr<NonnullRefPtr<StoreData>> ObjectStore::check_can_change_schema(StringView operation)
{
    if (m_transaction->is_finished())
        return InvalidStateError::create(String::formatted("{}: Transaction has finished", operation));

    if (!m_transaction->is_upgrade_transaction())
        return InvalidStateError::create(String::formatted("{}: Can only be used within an upgrade transaction, not a {} one", operation, m_transaction->mode()));

    auto store = store_data();
    if (!store)
        return InvalidStateError::create(String::formatted("{}: Object store '{}' does not exist", operation, m_name));
    return store.release_nonnull();
}

// https://w3c.github.io/IndexedDB/#add-or-put
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::put_or_add(JsonValue const& value, Optional<Key> key, bool no_overwrite, StringView operation)
{
    // 1. If store uses in-line keys and key was given, throw a "DataError" DOMException.
    // 2. If store uses out-of-line keys and has no key generator and key was not given, throw a "DataError" DOMException.
    auto key_path = this->key_path();
    auto auto_increment = this->auto_increment();

    if (key_path.has_value()) {
        if (!value.is_object())
            return DataError::create(String::formatted("{}: Value must be an object for object stores with a key path", operation));

        if (key.has_value())
            return DataError::create(String::formatted("{}: Key cannot be given for object stores with a key path (use value.{} instead)", operation, *key_path));

        // 3. If store uses in-line keys, let kpk be the result of extracting a key from value using store's key path.
        //    If kpk is invalid, throw a "DataError" DOMException.
        key = TRY(extract_key_from_value(value, *key_path));

        if (!key.has_value() && !auto_increment)
            return DataError::create(String::formatted("{}: Value has no key at '{}' and the object store has no key generator", operation, *key_path));
    } else if (!key.has_value() && !auto_increment) {
        return DataError::create(String::formatted("{}: Key must be given for object stores without a key generator", operation));
    }

    TRY(check_can_write(operation));

    // 4. Let clone be a clone of value.
    auto clone = TRY(clone_value(value));

    // 5. Let operation be an algorithm to run store a record into an object store with store, clone, key, and no-overwrite flag.
    // 6. Return the result of asynchronously executing a request with handle and operation.
    return m_transaction->request(NonnullRefPtr { *this }, PutOperation { move(clone), move(key), no_overwrite });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-put
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::put(JsonValue const& value, Optional<Key> key)
{
    return put_or_add(value, move(key), false, "put"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-add
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::add(JsonValue const& value, Optional<Key> key)
{
    return put_or_add(value, move(key), true, "add"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-delete
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::delete_(KeyQuery query)
{
    TRY(check_can_write("delete"sv));
    return m_transaction->request(NonnullRefPtr { *this }, DeleteOperation { move(query) });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-clear
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::clear()
{
    TRY(check_can_write("clear"sv));
    return m_transaction->request(NonnullRefPtr { *this }, ClearOperation {});
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-get
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::get(KeyQuery query)
{
    TRY(check_can_read("get"sv));
    return m_transaction->request(NonnullRefPtr { *this }, GetOperation { move(query), RetrievalType::Value });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-getkey
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::get_key(KeyQuery query)
{
    TRY(check_can_read("getKey"sv));
    return m_transaction->request(NonnullRefPtr { *this }, GetOperation { move(query), RetrievalType::Key });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-getall
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::get_all(Optional<KeyQuery> query, Optional<u32> count)
{
    TRY(check_can_read("getAll"sv));
    return m_transaction->request(NonnullRefPtr { *this }, GetAllOperation { move(query), count, RetrievalType::Value });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-getallkeys
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::get_all_keys(Optional<KeyQuery> query, Optional<u32> count)
{
    TRY(check_can_read("getAllKeys"sv));
    return m_transaction->request(NonnullRefPtr { *this }, GetAllOperation { move(query), count, RetrievalType::Key });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-count
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::count(Optional<KeyQuery> query)
{
    TRY(check_can_read("count"sv));
    return m_transaction->request(NonnullRefPtr { *this }, CountOperation { move(query) });
}

ExceptionOr<NonnullRefPtr<Request>> ObjectStore::open_cursor_with_key_only(Optional<KeyQuery> query, CursorDirection direction, Cursor::KeyOnly key_only, StringView operation)
{
    // Primary keys are unique, so the unique directions have no meaning here.
    if (direction != CursorDirection::Next && direction != CursorDirection::Prev)
        return TypeError::create(String::formatted("{}: Direction must be 'next' or 'prev', not '{}'", operation, cursor_direction_to_string(direction)));

    TRY(check_can_read(operation));
    return m_transaction->request(NonnullRefPtr { *this }, OpenCursorOperation { move(query), direction, key_only });
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-opencursor
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::open_cursor(Optional<KeyQuery> query, CursorDirection direction)
{
    return open_cursor_with_key_only(move(query), direction, Cursor::KeyOnly::No, "openCursor"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-openkeycursor
ExceptionOr<NonnullRefPtr<Request>> ObjectStore::open_key_cursor(Optional<KeyQuery> query, CursorDirection direction)
{
    return open_cursor_with_key_only(move(query), direction, Cursor::KeyOnly::Yes, "openKeyCursor"sv);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-index
ExceptionOr<NonnullRefPtr<Index>> ObjectStore::index(String const& name)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("index: '{}' is not a valid index name", name));

    auto store = TRY(check_can_read("index"sv));

    if (!store->index_with_name(name).has_value())
        return InvalidStateError::create(String::formatted("index: Index '{}' does not exist", name));

    return Index::create(*this, name);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-createindex
ExceptionOr<NonnullRefPtr<Index>> ObjectStore::create_index(String const& name, String const& key_path, IndexParameters parameters)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("createIndex: '{}' is not a valid index name", name));

    if (!is_valid_key_path(key_path))
        return TypeError::create(String::formatted("createIndex: '{}' is not a valid key path", key_path));

    auto store = TRY(check_can_change_schema("createIndex"sv));

    // If an index named name already exists in store, throw a "ConstraintError" DOMException.
    if (store->index_with_name(name).has_value())
        return ConstraintError::create(String::formatted("createIndex: Index '{}' already exists", name));

    store->add_index(name, IndexDescriptor { key_path, parameters.unique, parameters.multi_entry });

    return Index::create(*this, name);
}

// https://w3c.github.io/IndexedDB/#dom-idbobjectstore-deleteindex
ExceptionOr<void> ObjectStore::delete_index(String const& name)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("deleteIndex: '{}' is not a valid index name", name));

    auto store = TRY(check_can_change_schema("deleteIndex"sv));

    if (!store->index_with_name(name).has_value())
        return NotFoundError::create(String::formatted("deleteIndex: Index '{}' does not exist", name));

    store->remove_index(name);
    return {};
}

}
