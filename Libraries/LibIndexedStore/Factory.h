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
#include <AK/Weakable.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>

namespace IndexedStore {

// https://w3c.github.io/IndexedDB/#factory-interface
// The registry of named databases and of the connections open to each of them. Everything opened
// through one factory shares its state; separate factories are independent.
class INDEXEDSTORE_API Factory final
    : public RefCounted<Factory>
    , public Weakable<Factory> {
public:
    static NonnullRefPtr<Factory> create();

    ~Factory();

    // Both requests run on the next turn of the event loop, so listeners can be added first.
    ExceptionOr<NonnullRefPtr<OpenRequest>> open(String const& name, u64 version);
    ExceptionOr<NonnullRefPtr<OpenRequest>> delete_database(String const& name);

    // https://w3c.github.io/IndexedDB/#dom-idbfactory-cmp
    static int compare(Key const&, Key const&);

    // The names of the databases that have been created, sorted.
    Vector<String> database_names() const;

    // Forgets every database and connection.
    void reset();

    RefPtr<Database> database_with_name(String const&) const;
    void set_database(Badge<OpenRequest>, NonnullRefPtr<Database>);
    void remove_database(Badge<OpenRequest>, String const& name);

    Vector<NonnullRefPtr<Connection>> connections_for(String const& name) const;
    void register_connection(Badge<Connection>, NonnullRefPtr<Connection>);
    void unregister_connection(Badge<Connection>, Connection&);

private:
    Factory() = default;

    HashMap<String, NonnullRefPtr<Database>> m_databases;
    HashMap<String, Vector<NonnullRefPtr<Connection>>> m_connections;
};

}
