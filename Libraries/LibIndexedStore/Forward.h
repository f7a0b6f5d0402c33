/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

namespace IndexedStore {

class Connection;
class Cursor;
class Database;
class Event;
class EventTarget;
class Exception;
class Factory;
class Index;
class Key;
class KeyQuery;
class KeyRange;
class ObjectStore;
class OpenRequest;
class RecordValue;
class Request;
class StoreData;
class Transaction;

struct IndexDescriptor;
struct Record;

}
