/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/HashMap.h>
#include <AK/NonnullRefPtr.h>
#include <AK/RefCounted.h>
#include <AK/String.h>
#include <AK/Vector.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/StoreData.h>

namespace IndexedStore {

using StoreMap = HashMap<String, NonnullRefPtr<StoreData>>;

// The durable state of a named database, shared by every connection to it. Only a committing
// transaction writes to the store map.
class INDEXEDSTORE_API Database : public RefCounted<Database> {
public:
    static NonnullRefPtr<Database> create(String name, u64 version = 0);

    String const& name() const { return m_name; }

    // A database that has never been successfully opened has version 0.
    u64 version() const { return m_version; }
    void set_version(u64 version)
    {
        VERIFY(version >= m_version);
        m_version = version;
    }

    StoreMap& stores() { return m_stores; }
    StoreMap const& stores() const { return m_stores; }

    Vector<String> store_names() const;

private:
    Database(String name, u64 version)
        : m_name(move(name))
        , m_version(version)
    {
    }

    String m_name;
    u64 m_version { 0 };
    StoreMap m_stores;
};

}
