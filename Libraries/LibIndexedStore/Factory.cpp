/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Database.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Factory.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Validation.h>

namespace IndexedStore {

NonnullRefPtr<Factory> Factory::create()
{
    return adopt_ref(*new Factory());
}

Factory::~Factory() = default;

// https://w3c.github.io/IndexedDB/#dom-idbfactory-open
ExceptionOr<NonnullRefPtr<OpenRequest>> Factory::open(String const& name, u64 version)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("open: '{}' is not a valid database name", name));

    // 1. If version is 0 (zero), throw a TypeError.
    if (!is_valid_version(version))
        return TypeError::create("open: Version must be a positive integer"_string);

    return OpenRequest::create(*this, name, version);
}

// https://w3c.github.io/IndexedDB/#dom-idbfactory-deletedatabase
ExceptionOr<NonnullRefPtr<OpenRequest>> Factory::delete_database(String const& name)
{
    if (!is_valid_identifier(name))
        return TypeError::create(String::formatted("deleteDatabase: '{}' is not a valid database name", name));

    return OpenRequest::create(*this, name, {});
}

int Factory::compare(Key const& a, Key const& b)
{
    return Key::compare_two_keys(a, b);
}

// https://w3c.github.io/IndexedDB/#dom-idbfactory-databases
Vector<String> Factory::database_names() const
{
    Vector<String> names;
    for (auto const& it : m_databases) {
        if (it.value->version() > 0)
            names.append(it.key);
    }
    return create_a_sorted_name_list(move(names));
}

void Factory::reset()
{
    dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Resetting {} database(s)", m_databases.size());

    m_databases.clear();
    m_connections.clear();
}

RefPtr<Database> Factory::database_with_name(String const& name) const
{
    auto it = m_databases.find(name);
    if (it == m_databases.end())
        return nullptr;
    return it->value;
}

void Factory::set_database(Badge<OpenRequest>, NonnullRefPtr<Database> database)
{
    auto name = database->name();
    m_databases.set(move(name), move(database));
}

void Factory::remove_database(Badge<OpenRequest>, String const& name)
{
    m_databases.remove(name);
    m_connections.remove(name);
}

Vector<NonnullRefPtr<Connection>> Factory::connections_for(String const& name) const
{
    auto it = m_connections.find(name);
    if (it == m_connections.end())
        return {};
    return it->value;
}

void Factory::register_connection(Badge<Connection>, NonnullRefPtr<Connection> connection)
{
    m_connections.ensure(connection->name()).append(move(connection));
}

void Factory::unregister_connection(Badge<Connection>, Connection& connection)
{
    auto it = m_connections.find(connection.name());
    if (it == m_connections.end())
        return;

    it->value.remove_all_matching([&](auto const& entry) { return entry.ptr() == &connection; });
    if (it->value.is_empty())
        m_connections.remove(connection.name());
}

}
