/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Badge.h>
#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
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
#include <LibIndexedStore/Transaction.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#dictdef-idbobjectstoreparameters
struct ObjectStoreParameters {
    Optional<String> key_path;
    bool auto_increment { false };
};

// https://w3c.github.io/IndexedDB/#connection
// A connection runs the transactions made against it one after another, in the order they were made.
class INDEXEDSTORE_API Connection final
    : public RefCounted<Connection>
    , public Weakable<Connection>
    , public EventTarget {
public:
    static NonnullRefPtr<Connection> create(Factory&, NonnullRefPtr<Database>, u64 version);

    virtual ~Connection() override;

    String const& name() const { return m_database->name(); }
    u64 version() const { return m_version; }

    Database& database() { return *m_database; }
    Database const& database() const { return *m_database; }

    // The names of the object stores, sorted. While an upgrade runs this includes the stores it has created.
    Vector<String> object_store_names();

    bool is_closed() const { return m_closed; }
    bool is_closing() const { return m_closing; }

    ExceptionOr<NonnullRefPtr<Transaction>> transaction(Vector<String> const& store_names, TransactionMode = TransactionMode::ReadOnly);

    ExceptionOr<NonnullRefPtr<ObjectStore>> create_object_store(String const& name, ObjectStoreParameters const& = {});
    ExceptionOr<void> delete_object_store(String const& name);

    ExceptionOr<void> close();

    // Queues the transaction that upgrades the database. It must be the only transaction of the connection.
    ExceptionOr<NonnullRefPtr<Transaction>> upgrade_transaction();

    // Runs every queued transaction to completion, in order.
    ExceptionOr<void> run();

    RefPtr<Transaction> active_transaction() const { return m_active_transaction; }

private:
    Connection(Factory&, NonnullRefPtr<Database>, u64 version);

    void schedule_run();
    void finish_closing();
    ExceptionOr<NonnullRefPtr<Transaction>> active_upgrade_transaction(StringView operation);

    NonnullRefPtr<Database> m_database;
    WeakPtr<Factory> m_factory;
    u64 m_version { 0 };

    bool m_closed { false };
    bool m_closing { false };

    // A close requested while the run loop was draining completes once the loop is done.
    bool m_close_pending { false };

    bool m_run_scheduled { false };
    bool m_running { false };

    Vector<NonnullRefPtr<Transaction>> m_transaction_queue;
    RefPtr<Transaction> m_active_transaction;
};

}
