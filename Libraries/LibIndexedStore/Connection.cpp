/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibCore/EventLoop.h>
#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Factory.h>
#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Validation.h>

namespace IndexedStore {

NonnullRefPtr<Connection> Connection::create(Factory& factory, NonnullRefPtr<Database> database, u64 version)
{
    auto connection = adopt_ref(*new Connection(factory, move(database), version));
    factory.register_connection({}, connection);
    return connection;
}

Connection::Connection(Factory& factory, NonnullRefPtr<Database> database, u64 version)
    : m_database(move(database))
    , m_factory(factory.make_weak_ptr())
    , m_version(version)
{
}

Connection::~Connection() = default;

// https://w3c.github.io/IndexedDB/#dom-idbdatabase-objectstorenames
Vector<String> Connection::object_store_names()
{
    if (m_active_transaction && m_active_transaction->is_upgrade_transaction())
        return create_a_sorted_name_list(m_active_transaction->data().keys());
    return m_database->store_names();
}

// https://w3c.github.io/IndexedDB/#dom-idbdatabase-transaction
ExceptionOr<NonnullRefPtr<Transaction>> Connection::transaction(Vector<String> const& store_names, TransactionMode mode)
{
    if (store_names.is_empty())
        return TypeError::create("transaction: Store names must not be empty"_string);

    for (auto const& name : store_names) {
        if (!is_valid_identifier(name))
            return TypeError::create(String::formatted("transaction: '{}' is not a valid object store name", name));
    }

    if (mode != TransactionMode::ReadOnly && mode != TransactionMode::ReadWrite)
        return TypeError::create(String::formatted("transaction: Mode must be readonly or readwrite, not {}", mode));

    // 1. If a live upgrade transaction is associated with the connection, throw an "InvalidStateError" DOMException.
    if (m_active_transaction && m_active_transaction->is_upgrade_transaction())
        return InvalidStateError::create("transaction: An upgrade transaction is running"_string);

    // 2. If this's close pending flag is true, then throw an "InvalidStateError" DOMException.
    if (m_closed)
        return InvalidStateError::create("transaction: Database connection is closed"_string);
    if (m_closing)
        return InvalidStateError::create("transaction: Database connection is closing"_string);

    // 3. Let scope be the set of unique strings in storeNames.
    Vector<String> scope;
    for (auto const& name : store_names) {
        // 4. If any string in scope is not the name of an object store in the connected database, throw a "NotFoundError" DOMException.
        if (!m_database->stores().contains(name))
            return NotFoundError::create(String::formatted("transaction: Object store '{}' does not exist", name));
        if (!scope.contains_slow(name))
            scope.append(name);
    }

    // 5. Let transaction be a newly created transaction with this connection, mode and the set of object stores named in scope.
    auto transaction = Transaction::create(*this, move(scope), mode);
    m_transaction_queue.append(transaction);

    schedule_run();

    // 6. Return an IDBTransaction object representing transaction.
    return transaction;
}

void Connection::schedule_run()
{
    // Transactions made before the event loop gets to the run are batched into it.
    if (m_run_scheduled)
        return;
    m_run_scheduled = true;

    Core::deferred_invoke([self = NonnullRefPtr { *this }] {
        if (!self->m_run_scheduled || self->m_closed)
            return;

        if (auto result = self->run(); result.is_error())
            dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Failed to run transactions of '{}': {}", self->name(), result.error());
    });
}

ExceptionOr<void> Connection::run()
{
    if (m_closed)
        return InvalidStateError::create("run: Database connection is closed"_string);

    m_run_scheduled = false;

    // A listener of a transaction that is running made a new transaction or closed the connection.
    // The loop further up the stack takes care of it.
    if (m_running)
        return {};

    m_running = true;
    while (!m_transaction_queue.is_empty()) {
        m_active_transaction = m_transaction_queue.take_first();
        m_active_transaction->run({});
        m_active_transaction = nullptr;
    }
    m_running = false;

    if (m_close_pending) {
        m_close_pending = false;
        finish_closing();
    }

    return {};
}

ExceptionOr<NonnullRefPtr<Transaction>> Connection::upgrade_transaction()
{
    if (m_closed)
        return InvalidStateError::create("upgradeTransaction: Database connection is closed"_string);
    if (m_closing)
        return InvalidStateError::create("upgradeTransaction: Database connection is closing"_string);
    if (!m_transaction_queue.is_empty())
        return InvalidStateError::create("upgradeTransaction: Database connection already has transactions"_string);

    auto transaction = Transaction::create(*this, m_database->store_names(), TransactionMode::VersionChange);
    m_transaction_queue.append(transaction);
    return transaction;
}

ExceptionOr<NonnullRefPtr<Transaction>> Connection::active_upgrade_transaction(StringView operation)
{
    if (m_closed)
        return InvalidStateError::create(String::formatted("{}: Database connection is closed", operation));

    if (!m_active_transaction || !m_active_transaction->is_upgrade_transaction())
        return InvalidStateError::create(String::formatted("{}: Can only be used within a running upgrade transaction", operation));

    return NonnullRefPtr { *m_active_transaction };
}

// https://w3c.github.io/IndexedDB/#dom-idbdatabase-createobjectstore
ExceptionOr<NonnullRefPtr<ObjectStore>> Connection::create_object_store(String const& name, ObjectStoreParameters const& parameters)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("createObjectStore: '{}' is not a valid object store name", name));

    if (parameters.key_path.has_value() && !is_valid_key_path(*parameters.key_path))
        return TypeError::create(String::formatted("createObjectStore: '{}' is not a valid key path", *parameters.key_path));

    // 1. Let transaction be database's upgrade transaction if it is not null, or throw an "InvalidStateError" DOMException otherwise.
    auto transaction = TRY(active_upgrade_transaction("createObjectStore"sv));

    // 2. If an object store named name already exists in database throw a "ConstraintError" DOMException.
    if (transaction->data().contains(name))
        return ConstraintError::create(String::formatted("createObjectStore: Object store '{}' already exists", name));

    // 3. Let store be a new object store in database.
    transaction->data().set(name, StoreData::create(parameters.key_path, parameters.auto_increment));
    transaction->add_to_scope(name);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Created object store '{}' in '{}'", name, this->name());

    // 4. Return a new object store handle associated with store and transaction.
    return transaction->object_store_handle(name);
}

// https://w3c.github.io/IndexedDB/#dom-idbdatabase-deleteobjectstore
ExceptionOr<void> Connection::delete_object_store(String const& name)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("deleteObjectStore: '{}' is not a valid object store name", name));

    auto transaction = TRY(active_upgrade_transaction("deleteObjectStore"sv));

    if (!transaction->data().contains(name))
        return NotFoundError::create(String::formatted("deleteObjectStore: Object store '{}' does not exist", name));

    transaction->data().remove(name);

    // A store created later under the same name gets a handle of its own.
    transaction->forget_object_store_handle({}, name);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Deleted object store '{}' in '{}'", name, this->name());
    return {};
}

// https://w3c.github.io/IndexedDB/#dom-idbdatabase-close
ExceptionOr<void> Connection::close()
{
    if (m_closed)
        return InvalidStateError::create("close: Database connection is closed"_string);

    if (m_closing)
        return {};

    // 1. Set connection's close pending flag to true. No new transactions can be made.
    m_closing = true;

    // 2. Wait for all transactions created using connection to complete.
    if (m_running) {
        m_close_pending = true;
        return {};
    }

    TRY(run());
    finish_closing();
    return {};
}

void Connection::finish_closing()
{
    // 3. Set connection's state to closed.
    m_closed = true;

    if (auto factory = m_factory.strong_ref())
        factory->unregister_connection({}, *this);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Closed connection to '{}'", name());

    Event event { EventType::Close, Event::Bubbles::Yes };
    dispatch_event(event);
}

}
