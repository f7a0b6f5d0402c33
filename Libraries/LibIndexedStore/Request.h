/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/JsonValue.h>
#include <AK/NonnullRefPtr.h>
#include <AK/Optional.h>
#include <AK/RefCounted.h>
#include <AK/Variant.h>
#include <AK/Vector.h>
#include <AK/Weakable.h>
#include <LibIndexedStore/Event.h>
#include <LibIndexedStore/Exception.h>
#include <LibIndexedStore/Export.h>
#include <LibIndexedStore/Forward.h>
#include <LibIndexedStore/Key.h>
#include <LibIndexedStore/Operation.h>

namespace IndexedStore {

// The object store or index handle a request was made against. Requests made by the implementation
// itself, such as the one that runs an upgrade, have no source.
using RequestSource = Variant<Empty, NonnullRefPtr<ObjectStore>, NonnullRefPtr<Index>>;

// The outcome of a successful request. Empty means "no result", e.g. get() without a matching record
// or a cursor that iterated past its last record.
using RequestResult = Variant<Empty, Key, JsonValue, u64, NonnullRefPtr<Cursor>, Vector<JsonValue>, Vector<Key>>;

// https://w3c.github.io/IndexedDB/#request-api
class INDEXEDSTORE_API Request final
    : public RefCounted<Request>
    , public Weakable<Request>
    , public EventTarget {
public:
    enum class ReadyState {
        Pending,
        Done,
    };

    static NonnullRefPtr<Request> create(NonnullRefPtr<Transaction>, RequestSource, Operation);

    virtual ~Request() override;

    ReadyState ready_state() const { return m_ready_state; }
    bool is_done() const { return m_ready_state == ReadyState::Done; }

    Transaction& transaction() { return *m_transaction; }
    RequestSource const& source() const { return m_source; }

    // Both fail with InvalidStateError until the request is done.
    ExceptionOr<RequestResult> result() const;
    ExceptionOr<Optional<Exception>> error() const;

    // Runs the operation against the transaction's working data and reports the outcome.
    void execute();

    // Queues the request on its transaction again, so it reports a cursor's new position.
    ExceptionOr<void> rerun();

    // Called for each request still queued when its transaction aborts.
    void abort_request();

private:
    Request(NonnullRefPtr<Transaction>, RequestSource, Operation);

    virtual EventTarget* parent_for_event_dispatch() override;

    ExceptionOr<RequestResult> execute_operation();
    ExceptionOr<NonnullRefPtr<StoreData>> store_data_for_source(StringView operation) const;
    ExceptionOr<Optional<String>> index_key_path_for_source(StoreData const&, StringView operation) const;

    NonnullRefPtr<Transaction> m_transaction;
    RequestSource m_source;
    Operation m_operation;

    ReadyState m_ready_state { ReadyState::Pending };
    RequestResult m_result;
    Optional<Exception> m_error;
};

}
