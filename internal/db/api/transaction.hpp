#pragma once

namespace runvault::db {

// kRead transactions only select; writers serialize against each other.
enum class TxMode { kRead, kWrite };

/*
  One unit of work against a storage database.

  A store opens one per public call, checks the schema revision inside it
  and commits once at the end. An exception thrown in between leaves the
  transaction uncommitted and its destructor rolls back every statement,
  schema changes included. Only one writer per database holds a
  write transaction at a time on either backend.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws if the backend refuses; the transaction is finished either way.
  virtual void Commit() = 0;
};

} // namespace runvault::db
