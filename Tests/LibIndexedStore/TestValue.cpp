/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/JsonArray.h>
#include <AK/JsonObject.h>
#include <LibIndexedStore/Value.h>
#include <LibTest/TestCase.h>
#include <math.h>

#include "TestHelpers.h"

using namespace IndexedStore;
using IndexedStore::Testing::parse_json;

TEST_CASE(clone_is_deep_and_independent)
{
    auto original = parse_json(R"({"name":"pen","tags":["blue","cheap"],"stock":{"count":3}})"sv);
    auto copy = TRY_OR_FAIL(clone_value(original));

    EXPECT(copy.equals(original));

    copy.as_object().get("stock"sv)->as_object().set("count"sv, JsonValue { 4 });
    EXPECT(!copy.equals(original));
    EXPECT(original.as_object().get("stock"sv)->equals(parse_json(R"({"count":3})"sv)));
}

TEST_CASE(clone_rejects_non_finite_numbers)
{
    JsonObject object;
    object.set("price"sv, JsonValue { NAN });
    auto result = clone_value(JsonValue { move(object) });
    EXPECT(result.is_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::DataClone);

    JsonArray array;
    array.must_append(JsonValue { 1 });
    array.must_append(JsonValue { INFINITY });
    EXPECT_EQ(clone_value(JsonValue { move(array) }).error().kind(), ErrorKind::DataClone);
}

TEST_CASE(evaluate_nested_key_path)
{
    auto value = parse_json(R"({"address":{"city":"Oslo"},"id":5})"sv);

    auto city = evaluate_key_path_on_value(value, "address.city"sv);
    EXPECT(city.has_value());
    EXPECT_EQ(city->as_string(), "Oslo"sv);

    EXPECT(!evaluate_key_path_on_value(value, "address.street"sv).has_value());
    EXPECT(!evaluate_key_path_on_value(value, "id.value"sv).has_value());
}

TEST_CASE(extract_key)
{
    auto value = parse_json(R"({"id":5,"flags":[1,2],"missing":null})"sv);

    auto id = TRY_OR_FAIL(extract_key_from_value(value, "id"sv));
    EXPECT(id.has_value());
    EXPECT_EQ(*id, Key { 5.0 });

    auto absent = TRY_OR_FAIL(extract_key_from_value(value, "name"sv));
    EXPECT(!absent.has_value());

    EXPECT_EQ(extract_key_from_value(value, "flags"sv).error().kind(), ErrorKind::Data);
    EXPECT_EQ(extract_key_from_value(value, "missing"sv).error().kind(), ErrorKind::Data);
}

TEST_CASE(inject_key_creates_intermediate_objects)
{
    auto value = parse_json(R"({"name":"pen"})"sv);
    TRY_OR_FAIL(inject_key_into_value(value, "meta.id"sv, Key { 1.0 }));

    EXPECT(value.equals(parse_json(R"({"name":"pen","meta":{"id":1}})"sv)));
}

TEST_CASE(inject_key_into_a_non_object_fails)
{
    auto value = parse_json(R"({"meta":"text"})"sv);
    auto result = inject_key_into_value(value, "meta.id"sv, Key { 1.0 });
    EXPECT(result.is_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::Data);
}
