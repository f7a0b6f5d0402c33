/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibCore/EventLoop.h>
#include <LibIndexedStore/Connection.h>
#include <LibIndexedStore/Cursor.h>
#include <LibIndexedStore/Factory.h>
#include <LibIndexedStore/ObjectStore.h>
#include <LibIndexedStore/OpenRequest.h>
#include <LibIndexedStore/Request.h>
#include <LibIndexedStore/Transaction.h>
#include <LibTest/TestCase.h>

#include "TestHelpers.h"

using namespace IndexedStore;
using namespace IndexedStore::Testing;

// Waits for "success" or "error" at an open or delete request.
static bool wait_for_open_request(Core::EventLoop& event_loop, OpenRequest& request)
{
    bool finished = false;
    request.add_event_listener(EventType::Success, [&finished](Event&) { finished = true; });
    request.add_event_listener(EventType::Error, [&finished](Event&) { finished = true; });
    return pump_until(event_loop, [&finished] { return finished; });
}

static void create_store(Connection& connection, String const& name)
{
    if (auto result = connection.create_object_store(name); result.is_error())
        FAIL(result.release_error());
}

TEST_CASE(first_open_upgrades_from_version_zero)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    Vector<u64> old_versions;
    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [&](Connection& new_connection, Transaction& transaction, u64 old_version) {
        old_versions.append(old_version);
        EXPECT_EQ(new_connection.version(), 1u);
        EXPECT(transaction.is_upgrade_transaction());
        EXPECT_EQ(transaction.mode(), TransactionMode::VersionChange);
        create_store(new_connection, "messages"_string);
        EXPECT_EQ(new_connection.object_store_names(), (Vector<String> { "messages"_string }));
    }));

    EXPECT_EQ(old_versions, (Vector<u64> { 0 }));
    EXPECT_EQ(connection->name(), "mail"_string);
    EXPECT_EQ(connection->version(), 1u);
    EXPECT_EQ(connection->object_store_names(), (Vector<String> { "messages"_string }));
    EXPECT_EQ(factory->database_names(), (Vector<String> { "mail"_string }));
}

TEST_CASE(opening_a_higher_version_upgrades_once)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto first = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& connection, Transaction&, u64) {
        create_store(connection, "messages"_string);
    }));
    TRY_OR_FAIL(first->close());

    auto request = TRY_OR_FAIL(factory->open("mail"_string, 2));
    auto* open_request = request.ptr();

    int upgrades = 0;
    Optional<u64> old_version;
    Optional<u64> new_version;
    request->add_event_listener(EventType::UpgradeNeeded, [&, open_request](Event& event) {
        ++upgrades;
        old_version = event.old_version();
        new_version = event.new_version();

        EXPECT(!open_request->transaction().is_null());
        auto connection = MUST(open_request->result());
        create_store(*connection, "contacts"_string);
        TRY_OR_FAIL(connection->delete_object_store("messages"_string));
    });

    EXPECT(wait_for_open_request(event_loop, *request));
    EXPECT_EQ(upgrades, 1);
    EXPECT_EQ(old_version.value(), 1u);
    EXPECT_EQ(new_version.value(), 2u);
    EXPECT(!TRY_OR_FAIL(request->error()).has_value());
    EXPECT(request->transaction().is_null());

    auto connection = TRY_OR_FAIL(request->result());
    EXPECT_EQ(connection->version(), 2u);
    EXPECT_EQ(connection->object_store_names(), (Vector<String> { "contacts"_string }));
    EXPECT_EQ(factory->database_with_name("mail"_string)->version(), 2u);
}

TEST_CASE(opening_the_current_version_does_not_upgrade)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto first = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 3, [](Connection& connection, Transaction&, u64) {
        create_store(connection, "messages"_string);
    }));

    int upgrades = 0;
    auto second = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 3, [&](Connection&, Transaction&, u64) {
        ++upgrades;
    }));

    EXPECT_EQ(upgrades, 0);
    EXPECT_EQ(second->version(), 3u);
    EXPECT_EQ(second->object_store_names(), (Vector<String> { "messages"_string }));
    EXPECT(!first->is_closed());
}

TEST_CASE(opening_a_lower_version_fails)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 2, [](Connection& new_connection, Transaction&, u64) {
        create_store(new_connection, "messages"_string);
    }));

    auto transaction = TRY_OR_FAIL(connection->transaction({ "messages"_string }, TransactionMode::ReadWrite));
    TRY_OR_FAIL(TRY_OR_FAIL(transaction->object_store("messages"_string))->put(JsonValue { "hello"_string }, Key { 1.0 }));
    EXPECT(wait_for_transaction(event_loop, *transaction));

    auto older = open_database(event_loop, *factory, "mail"_string, 1);
    EXPECT(older.is_error());
    EXPECT_EQ(older.error().kind(), ErrorKind::Version);

    EXPECT_EQ(factory->database_with_name("mail"_string)->version(), 2u);

    auto reader = TRY_OR_FAIL(connection->transaction({ "messages"_string }));
    auto count = TRY_OR_FAIL(TRY_OR_FAIL(reader->object_store("messages"_string))->count());
    EXPECT_EQ(TRY_OR_FAIL(wait_for_request(event_loop, *count)).get<u64>(), 1u);
}

TEST_CASE(open_arguments_are_checked_synchronously)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    EXPECT_EQ(factory->open("Mail"_string, 1).error().kind(), ErrorKind::Type);
    EXPECT_EQ(factory->open(""_string, 1).error().kind(), ErrorKind::Type);
    EXPECT_EQ(factory->open("mail"_string, 0).error().kind(), ErrorKind::Type);
    EXPECT_EQ(factory->delete_database("Mail"_string).error().kind(), ErrorKind::Type);
}

TEST_CASE(open_request_runs_on_the_next_tick)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto request = TRY_OR_FAIL(factory->open("mail"_string, 1));
    EXPECT_EQ(request->ready_state(), OpenRequest::ReadyState::Pending);
    EXPECT_EQ(request->result().error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(request->error().error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(request->name(), "mail"_string);
    EXPECT_EQ(request->version().value(), 1u);
    EXPECT(!request->is_delete_request());

    EXPECT(wait_for_open_request(event_loop, *request));
    EXPECT(request->is_done());
    EXPECT(!TRY_OR_FAIL(request->result()).is_null());
}

TEST_CASE(other_connections_are_asked_to_close)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto old_connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& connection, Transaction&, u64) {
        create_store(connection, "messages"_string);
    }));

    Optional<u64> change_old_version;
    Optional<u64> change_new_version;
    auto* old_connection_ptr = old_connection.ptr();
    old_connection->add_event_listener(EventType::VersionChange, [&, old_connection_ptr](Event& event) {
        change_old_version = event.old_version();
        change_new_version = event.new_version();
        MUST(old_connection_ptr->close());
    });

    bool blocked = false;
    auto request = TRY_OR_FAIL(factory->open("mail"_string, 2));
    request->add_event_listener(EventType::Blocked, [&](Event&) { blocked = true; });

    EXPECT(wait_for_open_request(event_loop, *request));
    EXPECT(!blocked);
    EXPECT(old_connection->is_closed());
    EXPECT_EQ(change_old_version.value(), 1u);
    EXPECT_EQ(change_new_version.value(), 2u);
    EXPECT_EQ(TRY_OR_FAIL(request->result())->version(), 2u);
}

TEST_CASE(open_connection_blocks_an_upgrade)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto old_connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& connection, Transaction&, u64) {
        create_store(connection, "messages"_string);
    }));

    int version_changes = 0;
    old_connection->add_event_listener(EventType::VersionChange, [&](Event&) { ++version_changes; });

    Optional<u64> blocked_old_version;
    Optional<u64> blocked_new_version;
    bool upgraded = false;
    auto request = TRY_OR_FAIL(factory->open("mail"_string, 2));
    request->add_event_listener(EventType::Blocked, [&](Event& event) {
        blocked_old_version = event.old_version();
        blocked_new_version = event.new_version();
    });
    request->add_event_listener(EventType::UpgradeNeeded, [&](Event&) { upgraded = true; });

    EXPECT(pump_until(event_loop, [&] { return blocked_old_version.has_value(); }));
    pump_a_few_times(event_loop);

    EXPECT_EQ(version_changes, 1);
    EXPECT_EQ(blocked_old_version.value(), 1u);
    EXPECT_EQ(blocked_new_version.value(), 2u);
    EXPECT(!upgraded);
    EXPECT_EQ(request->ready_state(), OpenRequest::ReadyState::Pending);
    EXPECT_EQ(factory->database_with_name("mail"_string)->version(), 1u);
    EXPECT(!old_connection->is_closed());
}

TEST_CASE(aborted_upgrade_leaves_the_database_unchanged)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto first = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& connection, Transaction&, u64) {
        create_store(connection, "messages"_string);
    }));
    TRY_OR_FAIL(first->close());

    RefPtr<Connection> upgrade_connection;
    bool transaction_aborted = false;
    auto result = open_database(event_loop, *factory, "mail"_string, 2, [&](Connection& connection, Transaction& transaction, u64) {
        upgrade_connection = connection;
        transaction.add_event_listener(EventType::Abort, [&](Event&) { transaction_aborted = true; });
        create_store(connection, "drafts"_string);
        TRY_OR_FAIL(transaction.abort());
    });

    EXPECT(result.is_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::Abort);
    EXPECT(transaction_aborted);
    EXPECT(!upgrade_connection.is_null());
    EXPECT(upgrade_connection->is_closed());

    auto database = factory->database_with_name("mail"_string);
    EXPECT_EQ(database->version(), 1u);
    EXPECT_EQ(database->store_names(), (Vector<String> { "messages"_string }));
}

TEST_CASE(schema_changes_need_an_upgrade)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& new_connection, Transaction&, u64) {
        create_store(new_connection, "messages"_string);

        EXPECT_EQ(new_connection.create_object_store("messages"_string).error().kind(), ErrorKind::Constraint);
        EXPECT_EQ(new_connection.create_object_store("Messages"_string).error().kind(), ErrorKind::Type);
        EXPECT_EQ(new_connection.create_object_store("drafts"_string, { .key_path = "a..b"_string }).error().kind(), ErrorKind::Type);
        EXPECT_EQ(new_connection.delete_object_store("missing"_string).error().kind(), ErrorKind::NotFound);

        // Ordinary transactions cannot start while the upgrade runs.
        EXPECT_EQ(new_connection.transaction({ "messages"_string }).error().kind(), ErrorKind::InvalidState);
    }));

    EXPECT_EQ(connection->create_object_store("drafts"_string).error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(connection->delete_object_store("messages"_string).error().kind(), ErrorKind::InvalidState);
}

TEST_CASE(stores_created_during_an_upgrade_can_be_written_immediately)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& new_connection, Transaction&, u64) {
        auto messages = MUST(new_connection.create_object_store("messages"_string, { .auto_increment = true }));
        EXPECT_EQ(messages->name(), "messages"_string);
        EXPECT(messages->auto_increment());
        EXPECT(!messages->key_path().has_value());
        MUST(messages->put(JsonValue { "welcome"_string }));
    }));

    auto reader = TRY_OR_FAIL(connection->transaction({ "messages"_string }));
    auto get = TRY_OR_FAIL(TRY_OR_FAIL(reader->object_store("messages"_string))->get(Key { 1.0 }));
    EXPECT(TRY_OR_FAIL(wait_for_request(event_loop, *get)).get<JsonValue>().equals(JsonValue { "welcome"_string }));
}

TEST_CASE(delete_database)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 4, [](Connection& new_connection, Transaction&, u64) {
        create_store(new_connection, "messages"_string);
    }));

    Optional<u64> change_new_version { 99 };
    auto* connection_ptr = connection.ptr();
    connection->add_event_listener(EventType::VersionChange, [&, connection_ptr](Event& event) {
        change_new_version = event.new_version();
        MUST(connection_ptr->close());
    });

    auto request = TRY_OR_FAIL(factory->delete_database("mail"_string));
    EXPECT(request->is_delete_request());
    EXPECT(wait_for_open_request(event_loop, *request));

    EXPECT(!TRY_OR_FAIL(request->error()).has_value());
    EXPECT(TRY_OR_FAIL(request->result()).is_null());
    EXPECT(!change_new_version.has_value());
    EXPECT(connection->is_closed());
    EXPECT(factory->database_names().is_empty());
    EXPECT(factory->database_with_name("mail"_string).is_null());

    Optional<u64> reopened_from;
    TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [&](Connection&, Transaction&, u64 old_version) {
        reopened_from = old_version;
    }));
    EXPECT_EQ(reopened_from.value(), 0u);
}

TEST_CASE(deleting_a_missing_database_succeeds)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto request = TRY_OR_FAIL(factory->delete_database("nothing"_string));
    EXPECT(wait_for_open_request(event_loop, *request));
    EXPECT(!TRY_OR_FAIL(request->error()).has_value());
}

TEST_CASE(factories_are_independent_and_can_be_reset)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();
    auto other_factory = Factory::create();

    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1));
    TRY_OR_FAIL(open_database(event_loop, *factory, "news"_string, 1));

    EXPECT_EQ(factory->database_names(), (Vector<String> { "mail"_string, "news"_string }));
    EXPECT(other_factory->database_names().is_empty());
    EXPECT_EQ(factory->connections_for("mail"_string).size(), 1u);

    factory->reset();
    EXPECT(factory->database_names().is_empty());
    EXPECT(factory->connections_for("mail"_string).is_empty());

    int upgrades = 0;
    TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [&](Connection&, Transaction&, u64) { ++upgrades; }));
    EXPECT_EQ(upgrades, 1);
}

TEST_CASE(recreated_store_gets_a_fresh_handle)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    auto connection = TRY_OR_FAIL(open_database(event_loop, *factory, "mail"_string, 1, [](Connection& new_connection, Transaction&, u64) {
        auto in_line = MUST(new_connection.create_object_store("drafts"_string, { .key_path = "id"_string }));
        MUST(new_connection.delete_object_store("drafts"_string));

        auto out_of_line = MUST(new_connection.create_object_store("drafts"_string));
        EXPECT(in_line.ptr() != out_of_line.ptr());
        EXPECT(!out_of_line->key_path().has_value());
        EXPECT(!out_of_line->auto_increment());
        MUST(out_of_line->put(JsonValue { 5.0 }, Key { 1.0 }));
    }));

    auto reader = TRY_OR_FAIL(connection->transaction({ "drafts"_string }));
    auto drafts = TRY_OR_FAIL(reader->object_store("drafts"_string));
    EXPECT(!drafts->key_path().has_value());
    auto get = TRY_OR_FAIL(drafts->get(Key { 1.0 }));
    EXPECT(TRY_OR_FAIL(wait_for_request(event_loop, *get)).get<JsonValue>().equals(JsonValue { 5.0 }));
}

TEST_CASE(request_on_a_store_deleted_before_it_runs_fails)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    RefPtr<Request> queued_put;
    bool put_error_fired = false;
    auto result = open_database(event_loop, *factory, "mail"_string, 1, [&](Connection& new_connection, Transaction&, u64) {
        auto drafts = MUST(new_connection.create_object_store("drafts"_string));
        queued_put = MUST(drafts->put(JsonValue { "hello"_string }, Key { 1.0 }));
        queued_put->add_event_listener(EventType::Error, [&put_error_fired](Event&) { put_error_fired = true; });
        MUST(new_connection.delete_object_store("drafts"_string));
    });

    EXPECT(put_error_fired);
    auto put_error = TRY_OR_FAIL(queued_put->error());
    EXPECT(put_error.has_value());
    EXPECT_EQ(put_error->kind(), ErrorKind::InvalidState);

    // Nobody handled the error, so the upgrade was aborted.
    EXPECT(result.is_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::Abort);
}

TEST_CASE(cursor_on_a_store_deleted_before_it_continues_fails)
{
    Core::EventLoop event_loop;
    auto factory = Factory::create();

    RefPtr<Request> cursor_request;
    auto result = open_database(event_loop, *factory, "mail"_string, 1, [&](Connection& new_connection, Transaction&, u64) {
        auto drafts = MUST(new_connection.create_object_store("drafts"_string));
        MUST(drafts->put(JsonValue { "first"_string }, Key { 1.0 }));
        MUST(drafts->put(JsonValue { "second"_string }, Key { 2.0 }));

        cursor_request = MUST(drafts->open_cursor());
        auto* request_ptr = cursor_request.ptr();
        auto* connection_ptr = &new_connection;
        request_ptr->add_event_listener(EventType::Success, [request_ptr, connection_ptr](Event&) {
            auto cursor = MUST(request_ptr->result()).get<NonnullRefPtr<Cursor>>();
            MUST(cursor->continue_());
            MUST(connection_ptr->delete_object_store("drafts"_string));
        });
    });

    auto cursor_error = TRY_OR_FAIL(cursor_request->error());
    EXPECT(cursor_error.has_value());
    EXPECT_EQ(cursor_error->kind(), ErrorKind::InvalidState);
    EXPECT(result.is_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::Abort);
}
