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
#include <LibIndexedStore/Event.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#idbopendbrequest
// A request to open a database at a version, or, without a version, to delete it. It runs on the next
// turn of the event loop after it was made.
class INDEXEDSTORE_API OpenRequest final
    : public RefCounted<OpenRequest>
    , public EventTarget {
public:
    enum class ReadyState {
        Pending,
        Done,
    };

    static NonnullRefPtr<OpenRequest> create(Factory&, String name, Optional<u64> version);

    virtual ~OpenRequest() override;

    String const& name() const { return m_name; }
    Optional<u64> version() const { return m_version; }
    bool is_delete_request() const { return !m_version.has_value(); }

    ReadyState ready_state() const { return m_ready_state; }
    bool is_done() const { return m_ready_state == ReadyState::Done; }

    // The new connection. Null for delete requests and failed requests.
    ExceptionOr<RefPtr<Connection>> result() const;
    ExceptionOr<Optional<Exception>> error() const;

    // The upgrade transaction, while "upgradeneeded" is being dispatched.
    RefPtr<Transaction> transaction() const { return m_transaction; }

    void upgrade_needed(Badge<Request>, Transaction&, u64 old_version, u64 new_version);

private:
    OpenRequest(Factory&, String name, Optional<u64> version);

    void run();
    void open_database();
    void delete_database();
    void upgrade_database(NonnullRefPtr<Database>, u64 old_version);

    // Asks every other connection to the database to close. Returns false, after firing "blocked", if any stay open.
    bool close_other_connections(u64 old_version);

    void finish_with_success(RefPtr<Connection>);
    void finish_with_error(Exception);

    NonnullRefPtr<Factory> m_factory;
    String m_name;
    Optional<u64> m_version;

    ReadyState m_ready_state { ReadyState::Pending };
    RefPtr<Connection> m_result;
    Optional<Exception> m_error;
    RefPtr<Transaction> m_transaction;
};

}
