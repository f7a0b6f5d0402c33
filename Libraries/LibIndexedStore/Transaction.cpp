/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Transaction.h>
#include <LibIndexedStore/Validation.h>

namespace IndexedStore {

StringView transaction_mode_to_string(TransactionMode mode)
{
    switch (mode) {
    case TransactionMode::ReadOnly:
        return "readonly"sv;
    case TransactionMode::ReadWrite:
        return "readwrite"sv;
    case TransactionMode::VersionChange:
        return "versionchange"sv;
    }
    VERIFY_NOT_REACHED();
}

NonnullRefPtr<Transaction> Transaction::create(NonnullRefPtr<Connection> connection, Vector<String> scope, TransactionMode mode)
{
    return adopt_ref(*new Transaction(move(connection), move(scope), mode));
}

Transaction::Transaction(NonnullRefPtr<Connection> connection, Vector<String> scope, TransactionMode mode)
    : m_connection(move(connection))
    , m_scope(move(scope))
    , m_mode(mode)
{
}

Transaction::~Transaction() = default;

EventTarget* Transaction::parent_for_event_dispatch()
{
    return m_connection.ptr();
}

Vector<String> Transaction::object_store_names() const
{
    return create_a_sorted_name_list(m_scope);
}

StoreMap& Transaction::data()
{
    if (m_working_data.has_value())
        return *m_working_data;
    return m_connection->database().stores();
}

RefPtr<StoreData> Transaction::store_data(String const& name)
{
    auto& stores = data();
    auto it = stores.find(name);
    if (it == stores.end())
        return nullptr;
    return it->value;
}

void Transaction::add_to_scope(String const& name)
{
    if (!m_scope.contains_slow(name))
        m_scope.append(name);
}

NonnullRefPtr<ObjectStore> Transaction::object_store_handle(String const& name)
{
    if (auto it = m_object_store_handles.find(name); it != m_object_store_handles.end()) {
        if (auto handle = it->value.strong_ref())
            return handle.release_nonnull();
    }

    auto handle = ObjectStore::create(*this, name);
    m_object_store_handles.set(name, handle->make_weak_ptr());
    return handle;
}

void Transaction::forget_object_store_handle(Badge<Connection>, String const& name)
{
    m_object_store_handles.remove(name);
}

// https://w3c.github.io/IndexedDB/#dom-idbtransaction-error
ExceptionOr<Optional<Exception>> Transaction::error() const
{
    if (!m_finished)
        return InvalidStateError::create("error: Transaction has not finished"_string);
    return Optional<Exception> {};
}

// https://w3c.github.io/IndexedDB/#dom-idbtransaction-objectstore
ExceptionOr<NonnullRefPtr<ObjectStore>> Transaction::object_store(String const& name)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("'{}' is not a valid object store name", name));

    // 1. If this's state is finished, then throw an "InvalidStateError" DOMException.
    if (m_finished)
        return InvalidStateError::create("Transaction has already finished"_string);

    // 2. Let store be the object store named name in this's scope, or throw a "NotFoundError" DOMException if none.
    if (!m_scope.contains_slow(name))
        return NotFoundError::create(String::formatted("Object store '{}' is not in the scope of this transaction", name));

    if (!store_data(name))
        return NotFoundError::create(String::formatted("Object store '{}' does not exist", name));

    // 3. Return an object store handle associated with store and this.
    return object_store_handle(name);
}

// https://w3c.github.io/IndexedDB/#dom-idbtransaction-abort
ExceptionOr<void> Transaction::abort()
{
    // 1. If this's state is committing or finished, then throw an "InvalidStateError" DOMException.
    if (m_finished)
        return InvalidStateError::create("Transaction has already finished"_string);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Aborting {} transaction", m_mode);

    // 2. Set this's state to inactive and run abort a transaction with this and null.
    //    The run loop notices the flag before it executes the next request.
    m_finished = true;
    m_aborted = true;
    return {};
}

ExceptionOr<NonnullRefPtr<Request>> Transaction::request(RequestSource source, Operation operation)
{
    if (m_finished)
        return InvalidStateError::create("Cannot make a request on a transaction that has already finished"_string);

    auto request = Request::create(*this, move(source), move(operation));
    m_requests.append(request);
    return request;
}

ExceptionOr<void> Transaction::requeue_request(Badge<Request>, Request& request)
{
    if (m_finished)
        return InvalidStateError::create("Cannot make a request on a transaction that has already finished"_string);

    m_requests.append(request);
    return {};
}

void Transaction::take_snapshot()
{
    // Each store is copied on its own; the record values themselves are immutable and shared.
    StoreMap working_data;
    auto const& live_data = m_connection->database().stores();
    for (auto const& name : m_scope) {
        auto it = live_data.find(name);
        if (it == live_data.end())
            continue;
        working_data.set(name, it->value->clone());
    }
    m_working_data = move(working_data);
}

// https://w3c.github.io/IndexedDB/#commit-a-transaction
void Transaction::commit()
{
    VERIFY(m_working_data.has_value());

    // Every store in scope takes the state of the working copy. Stores deleted by the transaction are
    // missing from it, and stores it created only exist in it.
    auto& live_data = m_connection->database().stores();
    for (auto const& name : m_scope) {
        auto it = m_working_data->find(name);
        if (it == m_working_data->end())
            live_data.remove(name);
        else
            live_data.set(name, it->value);
    }

    m_working_data.clear();
}

void Transaction::abort_pending_requests()
{
    while (!m_requests.is_empty()) {
        auto request = m_requests.take_first();
        request->abort_request();
    }
}

void Transaction::run(Badge<Connection>)
{
    VERIFY(m_state == State::Queued);
    m_state = State::Running;

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Running {} transaction with {} request(s)", m_mode, m_requests.size());

    if (!m_aborted)
        take_snapshot();

    while (!m_aborted && !m_requests.is_empty()) {
        auto request = m_requests.take_first();
        request->execute();
    }

    if (m_aborted) {
        // https://w3c.github.io/IndexedDB/#abort-a-transaction
        // 1. All the changes made to the database by transaction are reverted.
        m_working_data.clear();

        // 2. Set transaction's state to finished.
        m_state = State::Finished;
        m_finished = true;

        // 3. For each request of transaction's request list, set its done flag, its result to undefined
        //    and its error to a newly created "AbortError" DOMException, and fire an event named error at it.
        abort_pending_requests();

        dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Aborted {} transaction", m_mode);

        // 4. Fire an event named abort at transaction with its bubbles attribute initialized to true.
        Event event { EventType::Abort, Event::Bubbles::Yes };
        dispatch_event(event);
        return;
    }

    commit();

    m_state = State::Finished;
    m_finished = true;

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Committed {} transaction", m_mode);

    Event event { EventType::Complete };
    dispatch_event(event);
}

}
