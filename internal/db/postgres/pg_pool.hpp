#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace eventstore::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRegistry.

  - libpqxx connections are NOT thread-safe; each registry call holds one
    connection exclusively and returns it when the shared_ptr drops.
  - Prepared statements are installed per connection on creation.
  - Acquire() blocks while max_connections are all checked out.

  Lifetime:
    Registry owns shared_ptr<PgPool>
    each call holds shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace eventstore::db::postgres
