#include "pg_pool.hpp"

#include "internal/db/api/result.hpp"

namespace roster::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + acquire_timeout_;

  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();

      // a dropped server connection is replaced instead of handed out
      if (!conn->is_open()) {
        --live_connections_;
        continue;
      }
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(new pqxx::connection(conninfo_));
      } catch (const pqxx::broken_connection& e) {
        {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
        }
        cv_.notify_one();
        throw DbError(ErrorCode::Unavailable, e.what());
      } catch (...) {
        {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
        }
        cv_.notify_one();
        throw;
      }
    }

    if (!cv_.wait_until(lock, deadline, [this] { return !idle_.empty() || live_connections_ < max_connections_; })) {
      throw DbError(ErrorCode::Timeout, "timed out waiting for a postgres connection");
    }
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace roster::db::postgres
