/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Badge.h>
#include <AK/HashMap.h>
#include <AK/NonnullRefPtr.h>
#include <AK/RefCounted.h>
#include <AK/RefPtr.h>
#include <AK/String.h>
#include <AK/Vector.h>
#include <AK/WeakPtr.h>
#include <AK/Weakable.h>
#include <LibIndexedStore/Database.h>
#include <LibIndexedStore/Event.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>
#include <LibIndexedStore/Request.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#transaction-mode
enum class TransactionMode : u8 {
    ReadOnly,
    ReadWrite,
    VersionChange,
};

INDEXEDSTORE_API StringView transaction_mode_to_string(TransactionMode);

// https://w3c.github.io/IndexedDB/#transaction-concept
class INDEXEDSTORE_API Transaction final
    : public RefCounted<Transaction>
    , public Weakable<Transaction>
    , public EventTarget {
public:
    enum class State {
        Queued,
        Running,
        Finished,
    };

    static NonnullRefPtr<Transaction> create(NonnullRefPtr<Connection>, Vector<String> scope, TransactionMode);

    virtual ~Transaction() override;

    TransactionMode mode() const { return m_mode; }
    Connection& connection() { return *m_connection; }
    Connection const& connection() const { return *m_connection; }

    // The names of the object stores in the transaction's scope, sorted.
    Vector<String> object_store_names() const;

    State state() const { return m_state; }
    bool is_finished() const { return m_finished; }
    bool is_aborted() const { return m_aborted; }
    bool is_readonly() const { return m_mode == TransactionMode::ReadOnly; }
    bool is_upgrade_transaction() const { return m_mode == TransactionMode::VersionChange; }

    ExceptionOr<NonnullRefPtr<ObjectStore>> object_store(String const& name);

    // Only readable once the transaction has finished.
    ExceptionOr<Optional<Exception>> error() const;

    // Takes effect between requests: the request currently executing completes, the rest are abandoned.
    ExceptionOr<void> abort();

    // Queues a new request against the transaction.
    ExceptionOr<NonnullRefPtr<Request>> request(RequestSource, Operation);
    ExceptionOr<void> requeue_request(Badge<Request>, Request&);

    // Runs every queued request, then commits or discards the working copy. Called by the connection.
    void run(Badge<Connection>);

    // Until the transaction starts running this is the connection's live data, afterwards it is the
    // transaction's private copy of the stores in its scope.
    StoreMap& data();
    RefPtr<StoreData> store_data(String const& name);

    // Stores created by an upgrade become part of its scope, so they are committed with it.
    void add_to_scope(String const& name);

    // Returns the handle for a store, creating it on first use.
    NonnullRefPtr<ObjectStore> object_store_handle(String const& name);
    void forget_object_store_handle(Badge<Connection>, String const& name);

private:
    Transaction(NonnullRefPtr<Connection>, Vector<String> scope, TransactionMode);

    virtual EventTarget* parent_for_event_dispatch() override;

    void take_snapshot();
    void commit();
    void abort_pending_requests();

    NonnullRefPtr<Connection> m_connection;
    Vector<String> m_scope;
    TransactionMode m_mode { TransactionMode::ReadOnly };

    State m_state { State::Queued };
    bool m_finished { false };
    bool m_aborted { false };

    Vector<NonnullRefPtr<Request>> m_requests;

    Optional<StoreMap> m_working_data;

    HashMap<String, WeakPtr<ObjectStore>> m_object_store_handles;
};

}

namespace AK {

template<>
struct Formatter<IndexedStore::TransactionMode> final : Formatter<StringView> {
    ErrorOr<void> format(FormatBuilder& builder, IndexedStore::TransactionMode mode)
    {
        return Formatter<StringView>::format(builder, IndexedStore::transaction_mode_to_string(mode));
    }
};

}
