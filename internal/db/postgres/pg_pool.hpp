#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

namespace stageflow::db::postgres {

/*
  Bounded set of libpqxx connections for PgRepository.

  A pqxx::connection is single-threaded, so each PgTransaction borrows
  one for its lifetime and the shared_ptr deleter hands it back. Every
  connection carries the repository's prepared statements. Acquire()
  blocks once `size` connections are checked out.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  struct Stats {
    std::size_t open = 0;
    std::size_t idle = 0;
  };

  explicit PgPool(std::string conninfo, std::size_t size = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  Stats Snapshot() const;

  std::size_t Size() const {
    return size_;
  }

 private:
  std::unique_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);
  void                              Forget();

  const std::string conninfo_;
  const std::size_t size_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       returned_;
  std::deque<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                   open_ = 0;
};

} // namespace stageflow::db::postgres
