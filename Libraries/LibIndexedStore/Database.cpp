/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Database.h>

namespace IndexedStore {

NonnullRefPtr<Database> Database::create(String name, u64 version)
{
    return adopt_ref(*new Database(move(name), version));
}

Vector<String> Database::store_names() const
{
    return create_a_sorted_name_list(m_stores.keys());
}

}
