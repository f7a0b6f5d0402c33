/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibCore/EventLoop.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Factory.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/Transaction.h>
#include <LibTest/TestCase.h>

#include "TestHelpers.h"

using namespace IndexedStore;
using namespace IndexedStore::Testing;

static ExceptionOr<NonnullRefPtr<Connection>> open_inventory(Core::EventLoop& event_loop, Factory& factory)
{
    return open_database(event_loop, factory, "inventory"_string, 1, [](Connection& connection, Transaction&, u64) {
        MUST(connection.create_object_store("parts"_string));
        MUST(connection.create_object_store("suppliers"_string));
    });
}

static ExceptionOr<Vector<JsonValue>> read_all_parts(Core::EventLoop& event_loop, Connection& connection)
{
    auto transaction = TRY(connection.transaction({ "parts"_string }));
    auto parts = TRY(transaction->object_store("parts"_string));
    auto get_all = TRY(parts->get_all());
    auto result = TRY(wait_for_request(event_loop, *get_all));
    return result.get<Vector<JsonValue>>();
}

static bool live_store_has_key(Connection& connection, String const& store_name, Key const& key)
{
    auto const& stores = connection.database().stores();
    auto it = stores.find(store_name);
    return it != stores.end() && it->value->has_record_with_key(key);
}

TEST_CASE(abort_after_writes_leaves_the_store_unchanged)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    {
        auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
        auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
        TRY_OR_FAIL(parts->put(JsonValue { "bolt"_string }, Key { 1.0 }));
        EXPECT(wait_for_transaction(event_loop, *transaction));
    }

    auto before = TRY_OR_FAIL(read_all_parts(event_loop, *connection));
    EXPECT_EQ(before.size(), 1u);

    for (size_t writes : { 0u, 1u, 5u }) {
        auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
        auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
        auto* transaction_ptr = transaction.ptr();

        if (writes == 0) {
            TRY_OR_FAIL(transaction->abort());
        } else {
            TRY_OR_FAIL(parts->clear());
            RefPtr<Request> last_write;
            for (size_t i = 0; i < writes; ++i)
                last_write = TRY_OR_FAIL(parts->put(JsonValue { "nut"_string }, Key { static_cast<double>(i + 10) }));
            last_write->add_event_listener(EventType::Success, [transaction_ptr](Event&) {
                MUST(transaction_ptr->abort());
            });
        }

        EXPECT(wait_for_transaction(event_loop, *transaction));
        EXPECT(transaction->is_aborted());

        auto after = TRY_OR_FAIL(read_all_parts(event_loop, *connection));
        EXPECT_EQ(after.size(), before.size());
        EXPECT(after.first().equals(before.first()));
    }
}

TEST_CASE(abort_fails_requests_that_did_not_run)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    auto* transaction_ptr = transaction.ptr();

    auto first = TRY_OR_FAIL(parts->put(JsonValue { 1 }, Key { 1.0 }));
    auto second = TRY_OR_FAIL(parts->put(JsonValue { 2 }, Key { 2.0 }));
    first->add_event_listener(EventType::Success, [transaction_ptr](Event&) {
        MUST(transaction_ptr->abort());
    });

    Vector<EventType> connection_events;
    connection->add_event_listener(EventType::Error, [&](Event& event) { connection_events.append(event.type()); });
    connection->add_event_listener(EventType::Abort, [&](Event& event) { connection_events.append(event.type()); });

    bool aborted = false;
    bool completed = false;
    transaction->add_event_listener(EventType::Abort, [&](Event&) { aborted = true; });
    transaction->add_event_listener(EventType::Complete, [&](Event&) { completed = true; });

    EXPECT(wait_for_transaction(event_loop, *transaction));
    EXPECT(aborted);
    EXPECT(!completed);

    EXPECT(!TRY_OR_FAIL(first->error()).has_value());
    EXPECT_EQ(TRY_OR_FAIL(second->error()).value().kind(), ErrorKind::Abort);

    // The error of the abandoned request and the abort of the transaction both bubble to the connection.
    EXPECT_EQ(connection_events, (Vector<EventType> { EventType::Error, EventType::Abort }));

    EXPECT_EQ(transaction->abort().error().kind(), ErrorKind::InvalidState);
}

TEST_CASE(complete_does_not_bubble)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    bool connection_saw_complete = false;
    connection->add_event_listener(EventType::Complete, [&](Event&) { connection_saw_complete = true; });

    auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }));
    bool completed = false;
    transaction->add_event_listener(EventType::Complete, [&](Event&) { completed = true; });

    EXPECT(wait_for_transaction(event_loop, *transaction));
    EXPECT(completed);
    EXPECT(!connection_saw_complete);
}

TEST_CASE(transactions_finish_in_the_order_they_were_made)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    Vector<int> finished;
    for (int i = 0; i < 3; ++i) {
        auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
        transaction->add_event_listener(EventType::Complete, [&finished, i](Event&) { finished.append(i); });
        auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
        TRY_OR_FAIL(parts->put(JsonValue { i }, Key { 1.0 }));
    }

    EXPECT(pump_until(event_loop, [&] { return finished.size() == 3; }));
    EXPECT_EQ(finished, (Vector<int> { 0, 1, 2 }));

    auto parts = TRY_OR_FAIL(read_all_parts(event_loop, *connection));
    EXPECT_EQ(parts.size(), 1u);
    EXPECT(parts.first().equals(JsonValue { 2 }));
}

TEST_CASE(changes_are_private_until_commit)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    auto put = TRY_OR_FAIL(parts->put(JsonValue { "gear"_string }, Key { 1.0 }));

    bool checked_while_running = false;
    bool visible_while_running = false;
    auto* connection_ptr = connection.ptr();
    put->add_event_listener(EventType::Success, [&, connection_ptr](Event&) {
        checked_while_running = true;
        visible_while_running = live_store_has_key(*connection_ptr, "parts"_string, Key { 1.0 });
    });

    EXPECT(wait_for_transaction(event_loop, *transaction));
    EXPECT(checked_while_running);
    EXPECT(!visible_while_running);
    EXPECT(live_store_has_key(*connection, "parts"_string, Key { 1.0 }));
}

TEST_CASE(requests_made_by_listeners_run_in_the_same_transaction)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    auto put = TRY_OR_FAIL(parts->put(JsonValue { "gear"_string }, Key { 1.0 }));

    RefPtr<Request> follow_up;
    auto* parts_ptr = parts.ptr();
    put->add_event_listener(EventType::Success, [&follow_up, parts_ptr](Event&) {
        follow_up = MUST(parts_ptr->count());
    });

    EXPECT(wait_for_transaction(event_loop, *transaction));
    EXPECT(!transaction->is_aborted());
    EXPECT(!follow_up.is_null());
    EXPECT_EQ(TRY_OR_FAIL(follow_up->result()).get<u64>(), 1u);
}

TEST_CASE(request_result_is_unavailable_until_done)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }));
    auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    auto count = TRY_OR_FAIL(parts->count());

    EXPECT_EQ(count->ready_state(), Request::ReadyState::Pending);
    EXPECT_EQ(count->result().error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(count->error().error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(&count->transaction(), transaction.ptr());
    EXPECT(count->source().has<NonnullRefPtr<ObjectStore>>());

    EXPECT_EQ(TRY_OR_FAIL(wait_for_request(event_loop, *count)).get<u64>(), 0u);
    EXPECT_EQ(count->ready_state(), Request::ReadyState::Done);
}

TEST_CASE(transaction_argument_errors)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    EXPECT_EQ(connection->transaction({}).error().kind(), ErrorKind::Type);
    EXPECT_EQ(connection->transaction({ "Parts"_string }).error().kind(), ErrorKind::Type);
    EXPECT_EQ(connection->transaction({ "parts"_string }, TransactionMode::VersionChange).error().kind(), ErrorKind::Type);
    EXPECT_EQ(connection->transaction({ "widgets"_string }).error().kind(), ErrorKind::NotFound);
}

TEST_CASE(transaction_scope)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "suppliers"_string, "parts"_string, "suppliers"_string }, TransactionMode::ReadWrite));
    EXPECT_EQ(transaction->object_store_names(), (Vector<String> { "parts"_string, "suppliers"_string }));
    EXPECT_EQ(transaction->mode(), TransactionMode::ReadWrite);
    EXPECT_EQ(&transaction->connection(), connection.ptr());

    auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    auto same_parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    EXPECT_EQ(parts.ptr(), same_parts.ptr());

    auto narrow = TRY_OR_FAIL(connection->transaction({ "parts"_string }));
    EXPECT_EQ(narrow->object_store("suppliers"_string).error().kind(), ErrorKind::NotFound);
    EXPECT_EQ(narrow->object_store("Bad"_string).error().kind(), ErrorKind::Type);
}

TEST_CASE(closed_connection_rejects_transactions)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    bool closed = false;
    connection->add_event_listener(EventType::Close, [&](Event&) { closed = true; });

    TRY_OR_FAIL(connection->close());
    EXPECT(closed);
    EXPECT(connection->is_closed());
    EXPECT_EQ(connection->transaction({ "parts"_string }).error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(connection->close().error().kind(), ErrorKind::InvalidState);
}

TEST_CASE(close_waits_for_queued_transactions)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    auto parts = TRY_OR_FAIL(transaction->object_store("parts"_string));
    TRY_OR_FAIL(parts->put(JsonValue { "washer"_string }, Key { 1.0 }));

    TRY_OR_FAIL(connection->close());
    EXPECT(connection->is_closed());
    EXPECT(transaction->is_finished());
    EXPECT(!transaction->is_aborted());
    EXPECT(live_store_has_key(*connection, "parts"_string, Key { 1.0 }));
}

TEST_CASE(close_from_a_listener_completes_after_the_run)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto first = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    auto second = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    TRY_OR_FAIL(TRY_OR_FAIL(second->object_store("parts"_string))->put(JsonValue { 1 }, Key { 1.0 }));

    auto* connection_ptr = connection.ptr();
    first->add_event_listener(EventType::Complete, [connection_ptr](Event&) {
        MUST(connection_ptr->close());
        EXPECT(connection_ptr->is_closing());
        EXPECT(!connection_ptr->is_closed());
    });

    EXPECT(pump_until(event_loop, [&] { return connection->is_closed(); }));
    EXPECT(second->is_finished());
    EXPECT(!second->is_aborted());
}

TEST_CASE(error_is_readable_once_finished)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto connection = TRY_OR_FAIL(open_inventory(event_loop, *factory));

    auto committed = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    TRY_OR_FAIL(TRY_OR_FAIL(committed->object_store("parts"_string))->put(JsonValue { "bolt"_string }, Key { 1.0 }));
    EXPECT_EQ(committed->error().error().kind(), ErrorKind::InvalidState);
    EXPECT(wait_for_transaction(event_loop, *committed));
    EXPECT(!TRY_OR_FAIL(committed->error()).has_value());

    auto aborted = TRY_OR_FAIL(connection->transaction({ "parts"_string }, TransactionMode::ReadWrite));
    TRY_OR_FAIL(aborted->abort());
    EXPECT(!TRY_OR_FAIL(aborted->error()).has_value());
}
