/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibIndexedStore/Algorithms.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Debug.h>
#include <LibIndexedStore/Index.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/StoreData.h>
#include <LibIndexedStore/Transaction.h>

namespace IndexedStore {

NonnullRefPtr<Request> Request::create(NonnullRefPtr<Transaction> transaction, RequestSource source, Operation operation)
{
    return adopt_ref(*new Request(move(transaction), move(source), move(operation)));
}

Request::Request(NonnullRefPtr<Transaction> transaction, RequestSource source, Operation operation)
    : m_transaction(move(transaction))
    , m_source(move(source))
    , m_operation(move(operation))
{
}

Request::~Request() = default;

EventTarget* Request::parent_for_event_dispatch()
{
    return m_transaction.ptr();
}

// https://w3c.github.io/IndexedDB/#dom-idbrequest-result
ExceptionOr<RequestResult> Request::result() const
{
    // 1. If this's done flag is false, then throw an "InvalidStateError" DOMException.
    if (m_ready_state != ReadyState::Done)
        return InvalidStateError::create("Cannot get the result of a request that is not done"_string);

    // 2. Otherwise, return this's result, or undefined if the request resulted in an error.
    return m_result;
}

// https://w3c.github.io/IndexedDB/#dom-idbrequest-error
ExceptionOr<Optional<Exception>> Request::error() const
{
    // 1. If this's done flag is false, then throw an "InvalidStateError" DOMException.
    if (m_ready_state != ReadyState::Done)
        return InvalidStateError::create("Cannot get the error of a request that is not done"_string);

    // 2. Otherwise, return this's error, or null if no error occurred.
    return m_error;
}

ExceptionOr<NonnullRefPtr<StoreData>> Request::store_data_for_source(StringView operation) const
{
    // The store may have been deleted by a request that ran after this one was made.
    auto const& store_name = m_source.visit(
        [](Empty) -> String const& { VERIFY_NOT_REACHED(); },
        [](NonnullRefPtr<ObjectStore> const& store) -> String const& { return store->name(); },
        [](NonnullRefPtr<Index> const& index) -> String const& { return index->object_store().name(); });

    auto store = m_transaction->store_data(store_name);
    if (!store)
        return InvalidStateError::create(String::formatted("{}: Object store '{}' does not exist", operation, store_name));
    return store.release_nonnull();
}

ExceptionOr<Optional<String>> Request::index_key_path_for_source(StoreData const& store, StringView operation) const
{
    if (!m_source.has<NonnullRefPtr<Index>>())
        return Optional<String> {};

    auto const& index = m_source.get<NonnullRefPtr<Index>>();
    auto descriptor = store.index_with_name(index->name());
    if (!descriptor.has_value())
        return InvalidStateError::create(String::formatted("{}: Index '{}' does not exist", operation, index->name()));
    return Optional<String> { descriptor->key_path };
}

ExceptionOr<RequestResult> Request::execute_operation()
{
    return m_operation.visit(
        [&](PutOperation& put) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("put"sv));
            return RequestResult { TRY(store_a_record_into_an_object_store(*store, move(put.value), move(put.key), put.no_overwrite)) };
        },
        [&](GetOperation const& get) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("get"sv));
            auto index_key_path = TRY(index_key_path_for_source(*store, "get"sv));

            // The first matching record in ascending key order.
            auto positions = collect_record_positions(*store, index_key_path, get.query, CursorDirection::Next);
            if (positions.is_empty())
                return RequestResult {};

            auto const& position = positions.first();
            if (get.type == RetrievalType::Key)
                return RequestResult { position.primary_key };

            auto record = store->record_with_key(position.primary_key);
            VERIFY(record.has_value());
            return RequestResult { record->value->value() };
        },
        [&](GetAllOperation const& get_all) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("getAll"sv));
            auto index_key_path = TRY(index_key_path_for_source(*store, "getAll"sv));

            auto positions = collect_record_positions(*store, index_key_path, get_all.query, CursorDirection::Next);

            // A count of zero means there is no limit.
            size_t limit = positions.size();
            if (get_all.count.has_value() && *get_all.count != 0)
                limit = min<size_t>(limit, *get_all.count);

            if (get_all.type == RetrievalType::Key) {
                Vector<Key> keys;
                keys.ensure_capacity(limit);
                for (size_t i = 0; i < limit; ++i)
                    keys.append(positions[i].primary_key);
                return RequestResult { move(keys) };
            }

            Vector<JsonValue> values;
            values.ensure_capacity(limit);
            for (size_t i = 0; i < limit; ++i) {
                auto record = store->record_with_key(positions[i].primary_key);
                VERIFY(record.has_value());
                values.append(record->value->value());
            }
            return RequestResult { move(values) };
        },
        [&](DeleteOperation const& delete_) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("delete"sv));
            store->delete_records_in_range(delete_.query);
            return RequestResult {};
        },
        [&](ClearOperation const&) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("clear"sv));
            store->clear();
            return RequestResult {};
        },
        [&](CountOperation const& count) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("count"sv));
            auto index_key_path = TRY(index_key_path_for_source(*store, "count"sv));
            return RequestResult { count_the_records_in_a_range(*store, index_key_path, count.query) };
        },
        [&](OpenCursorOperation const& open_cursor) -> ExceptionOr<RequestResult> {
            auto cursor = TRY(Cursor::create(*this, open_cursor.query, open_cursor.direction, open_cursor.key_only));
            if (cursor->is_exhausted())
                return RequestResult {};
            return RequestResult { move(cursor) };
        },
        [&](IterateCursorOperation const& iterate_cursor) -> ExceptionOr<RequestResult> {
            auto store = TRY(store_data_for_source("continue"sv));
            TRY(index_key_path_for_source(*store, "continue"sv));

            if (iterate_cursor.cursor->is_exhausted())
                return RequestResult {};
            return RequestResult { iterate_cursor.cursor };
        },
        [&](VersionChangeOperation const& version_change) -> ExceptionOr<RequestResult> {
            version_change.open_request->upgrade_needed({}, *m_transaction, version_change.old_version, version_change.new_version);
            return RequestResult {};
        });
}

void Request::execute()
{
    m_ready_state = ReadyState::Pending;

    auto result = execute_operation();

    m_ready_state = ReadyState::Done;

    if (result.is_error()) {
        dbgln_if(INDEXEDSTORE_DEBUG, "IndexedStore: Request failed: {}", result.error());

        m_result = Empty {};
        m_error = result.release_error();

        // https://w3c.github.io/IndexedDB/#fire-an-error-event
        Event event { EventType::Error, Event::Bubbles::Yes, Event::Cancelable::Yes };
        auto not_canceled = dispatch_event(event);

        // An error nobody handled aborts the transaction.
        if (not_canceled && !m_transaction->is_finished())
            MUST(m_transaction->abort());
        return;
    }

    m_result = result.release_value();
    m_error = {};

    // Later runs of a cursor request only report the cursor's position.
    if (m_operation.has<OpenCursorOperation>() && m_result.has<NonnullRefPtr<Cursor>>())
        m_operation = IterateCursorOperation { m_result.get<NonnullRefPtr<Cursor>>() };

    // https://w3c.github.io/IndexedDB/#fire-a-success-event
    Event event { EventType::Success };
    dispatch_event(event);
}

ExceptionOr<void> Request::rerun()
{
    TRY(m_transaction->requeue_request({}, *this));
    m_ready_state = ReadyState::Pending;
    return {};
}

void Request::abort_request()
{
    m_result = Empty {};
    m_error = AbortError::create("The transaction of this request was aborted"_string);
    m_ready_state = ReadyState::Done;

    Event event { EventType::Error, Event::Bubbles::Yes, Event::Cancelable::Yes };
    dispatch_event(event);
}

}
