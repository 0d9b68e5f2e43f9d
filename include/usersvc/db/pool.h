#pragma once
/**
 * @file pool.h
 * @brief Bounded blocking connection pool (thread-safe, RAII checkin).
 *
 *  - constructed from a fixed set of already-open connections
 *  - acquire() blocks until one is idle and returns a Lease
 *  - the Lease returns its connection when destroyed
 *
 * A connection is owned by at most one Lease at a time. The pool must
 * outlive every Lease it hands out.
 */
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

#include "usersvc/app/errors.h"

namespace usersvc {

template <typename Conn>
class ConnectionPool {
public:
    explicit ConnectionPool(std::vector<std::unique_ptr<Conn>> conns)
        : total_(conns.size()) {
        for (auto& c : conns) q_.push(std::move(c));
    }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<Conn> conn)
            : pool_(pool), conn_(std::move(conn)) {}
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& o) noexcept : pool_(o.pool_), conn_(std::move(o.conn_)) { o.pool_ = nullptr; }
        Lease& operator=(Lease&& o) noexcept {
            if (this != &o) {
                release();
                pool_ = o.pool_; conn_ = std::move(o.conn_);
                o.pool_ = nullptr;
            }
            return *this;
        }
        ~Lease() { release(); }

        Conn* operator->() const { return conn_.get(); }
        Conn& operator*() const { return *conn_; }
        Conn* get() const { return conn_.get(); }

        /// Give the connection back early; the lease becomes empty.
        void release() {
            if (pool_ && conn_) pool_->checkin(std::move(conn_));
            pool_ = nullptr;
        }

    private:
        ConnectionPool* pool_{nullptr};
        std::unique_ptr<Conn> conn_;
    };

    /// Blocks until a connection is idle. Throws PoolClosed after close().
    Lease acquire() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [&]{ return !q_.empty() || closed_; });
        if (closed_) throw PoolClosed();
        auto c = std::move(q_.front());
        q_.pop();
        return Lease(this, std::move(c));
    }

    /// Wakes every waiter; later acquire() calls throw.
    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t size() const { return total_; }

    std::size_t idle() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.size();
    }

private:
    void checkin(std::unique_ptr<Conn> c) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            q_.push(std::move(c));
        }
        cv_.notify_one();
    }

    const std::size_t total_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Conn>> q_;
    bool closed_{false};
};

} // namespace usersvc
