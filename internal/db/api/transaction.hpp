#pragma once

namespace ingest::db {

/*
  Unit of work over the session, part and layer tables.

  Every ChunkReceiver step (accept a part, bump the session version,
  register a layer) runs inside one of these, so a crash leaves either
  all of the step's rows or none of them.

  Backends:
    memory    working copy swapped in on Commit; writers serialized
    sqlite    BEGIN IMMEDIATE on the shared connection
    postgres  pqxx::work on a pooled connection

  A destroyed, uncommitted transaction rolls back. Holding two
  transactions of one repository on the same thread is not supported.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace ingest::db
