/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibCore/EventLoop.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Database.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Factory.h>
#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/Transaction.h>

namespace IndexedStore {

NonnullRefPtr<OpenRequest> OpenRequest::create(Factory& factory, String name, Optional<u64> version)
{
    auto request = adopt_ref(*new OpenRequest(factory, move(name), version));

    Core::deferred_invoke([request] {
        request->run();
    });

    return request;
}

OpenRequest::OpenRequest(Factory& factory, String name, Optional<u64> version)
    : m_factory(factory)
    , m_name(move(name))
    , m_version(version)
{
}

OpenRequest::~OpenRequest() = default;

ExceptionOr<RefPtr<Connection>> OpenRequest::result() const
{
    if (m_ready_state != ReadyState::Done)
        return InvalidStateError::create("Cannot get the result of a request that is not done"_string);
    return m_result;
}

ExceptionOr<Optional<Exception>> OpenRequest::error() const
{
    if (m_ready_state != ReadyState::Done)
        return InvalidStateError::create("Cannot get the error of a request that is not done"_string);
    return m_error;
}

void OpenRequest::run()
{
    VERIFY(m_ready_state == ReadyState::Pending);

    if (is_delete_request())
        delete_database();
    else
        open_database();
}

// https://w3c.github.io/IndexedDB/#open-a-database-connection
void OpenRequest::open_database()
{
    auto database = m_factory->database_with_name(m_name);
    u64 old_version = database ? database->version() : 0;
    u64 version = *m_version;

    // 1. If db's version is greater than version, return a newly created "VersionError" DOMException.
    if (version < old_version) {
        dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Cannot open '{}' at version {}, it is at version {}", m_name, version, old_version);
        finish_with_error(VersionError::create(String::formatted("Requested version {} is lower than the current version {}", version, old_version)));
        return;
    }

    // 2. If db's version is version, return a new connection to db.
    if (version == old_version) {
        VERIFY(database);
        finish_with_success(Connection::create(*m_factory, database.release_nonnull(), version));
        return;
    }

    // 3. If db's version is less than version, then:
    //    1. Let openConnections be the set of all connections, except connection, associated with db.
    //    2. For each entry of openConnections that does not have its close pending flag set to true, queue a
    //       task to fire a version change event named versionchange at entry with db's version and version.
    //    3. If any of the connections in openConnections are still not closed, queue a task to fire a version
    //       change event named blocked at request with db's version and version.
    if (!close_other_connections(old_version))
        return;

    if (!database)
        database = Database::create(m_name);

    //    4. Run upgrade a database using connection, version and request.
    upgrade_database(database.release_nonnull(), old_version);
}

// https://w3c.github.io/IndexedDB/#upgrade-a-database
void OpenRequest::upgrade_database(NonnullRefPtr<Database> database, u64 old_version)
{
    u64 version = *m_version;
    auto connection = Connection::create(*m_factory, database, version);

    // 1. Let transaction be a new upgrade transaction with connection used as connection.
    //    The scope of transaction includes every object store in connection.
    auto transaction_or_error = connection->upgrade_transaction();
    if (transaction_or_error.is_error()) {
        finish_with_error(transaction_or_error.release_error());
        return;
    }
    auto transaction = transaction_or_error.release_value();

    // 2. Fire a version change event named upgradeneeded at request with old version and version, while
    //    transaction is running so the schema can be changed.
    if (auto request_or_error = transaction->request({}, VersionChangeOperation { *this, old_version, version }); request_or_error.is_error()) {
        finish_with_error(request_or_error.release_error());
        return;
    }

    if (auto result = connection->run(); result.is_error()) {
        finish_with_error(result.release_error());
        return;
    }

    // 3. If transaction was aborted, the database keeps its previous version and data, and connection is closed.
    if (transaction->is_aborted()) {
        dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Upgrade of '{}' to version {} was aborted", m_name, version);

        if (!connection->is_closed()) {
            if (auto result = connection->close(); result.is_error()) {
                finish_with_error(result.release_error());
                return;
            }
        }

        finish_with_error(AbortError::create("The upgrade transaction was aborted"_string));
        return;
    }

    // 4. Set the version of database to version. The transaction has already committed the new schema.
    database->set_version(version);
    m_factory->set_database({}, database);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Upgraded '{}' from version {} to {}", m_name, old_version, version);

    finish_with_success(move(connection));
}

void OpenRequest::upgrade_needed(Badge<Request>, Transaction& transaction, u64 old_version, u64 new_version)
{
    // The connection is readable as the result while the upgrade runs.
    m_result = transaction.connection();
    m_ready_state = ReadyState::Done;
    m_transaction = transaction;

    auto event = Event::create_version_change(EventType::UpgradeNeeded, old_version, new_version);
    dispatch_event(event);

    m_transaction = nullptr;
}

// https://w3c.github.io/IndexedDB/#delete-a-database
void OpenRequest::delete_database()
{
    auto database = m_factory->database_with_name(m_name);
    u64 old_version = database ? database->version() : 0;

    // 1. Let openConnections be the set of all connections associated with db.
    // 2. For each entry of openConnections that does not have its close pending flag set to true, queue a task
    //    to fire a version change event named versionchange at entry with db's version and null.
    // 3. If any of the connections in openConnections are still not closed, queue a task to fire a version change
    //    event named blocked at request with db's version and null.
    if (!close_other_connections(old_version))
        return;

    // 4. Delete db.
    m_factory->remove_database({}, m_name);

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Deleted database '{}'", m_name);

    finish_with_success(nullptr);
}

bool OpenRequest::close_other_connections(u64 old_version)
{
    auto connections = m_factory->connections_for(m_name);
    if (connections.is_empty())
        return true;

    for (auto& connection : connections) {
        if (connection->is_closed() || connection->is_closing())
            continue;

        auto event = Event::create_version_change(EventType::VersionChange, old_version, m_version);
        connection->dispatch_event(event);
    }

    if (m_factory->connections_for(m_name).is_empty())
        return true;

    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Request for '{}' is blocked by open connections", m_name);

    // Nothing retries the request, so it stays pending.
    auto event = Event::create_version_change(EventType::Blocked, old_version, m_version);
    dispatch_event(event);
    return false;
}

void OpenRequest::finish_with_success(RefPtr<Connection> connection)
{
    m_ready_state = ReadyState::Done;
    m_result = move(connection);
    m_error = {};

    Event event { EventType::Success };
    dispatch_event(event);
}

void OpenRequest::finish_with_error(Exception error)
{
    m_ready_state = ReadyState::Done;
    m_result = nullptr;
    m_error = move(error);

    Event event { EventType::Error, Event::Bubbles::Yes, Event::Cancelable::Yes };
    dispatch_event(event);
}

}
