#pragma once

#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlbridge::testing {

/**
 * @brief Statements seen by every connection of one MockConnectionFactory
 */
class StatementLog {
public:
    void record(const std::string& sql) {
        std::lock_guard lock(mutex_);
        statements_.push_back(sql);
    }

    [[nodiscard]] std::vector<std::string> statements() const {
        std::lock_guard lock(mutex_);
        return statements_;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        statements_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> statements_;
};

/**
 * @brief Scripted IDbConnection
 *
 * Every statement is recorded; the handler decides the result (success
 * with no rows when unset). is_connected() follows the shared server flag.
 */
class MockConnection : public IDbConnection {
public:
    using Handler = std::function<DbResultSet(const std::string& sql, const SqlParams& params)>;

    MockConnection(std::shared_ptr<StatementLog> log,
                   Handler handler,
                   std::shared_ptr<std::atomic<bool>> server_up)
        : log_(std::move(log)), handler_(std::move(handler)), server_up_(std::move(server_up)) {}

    DbResultSet execute(const std::string& sql, const SqlParams& params) override {
        if (log_) log_->record(sql);
        if (handler_) return handler_(sql, params);
        DbResultSet ok;
        ok.success = true;
        return ok;
    }

    bool is_connected() const override {
        return !closed_ && (!server_up_ || server_up_->load());
    }

    void close() override { closed_ = true; }

private:
    std::shared_ptr<StatementLog> log_;
    Handler handler_;
    std::shared_ptr<std::atomic<bool>> server_up_;
    bool closed_ = false;
};

/**
 * @brief Factory producing MockConnections; refuses while the server is down
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& /*connection_string*/) override {
        if (!server_up->load()) {
            throw PoolCreationError("Error creating connection pool: mock server is down");
        }
        created.fetch_add(1, std::memory_order_relaxed);
        return std::make_unique<MockConnection>(log, handler, server_up);
    }

    std::shared_ptr<StatementLog> log = std::make_shared<StatementLog>();
    std::shared_ptr<std::atomic<bool>> server_up = std::make_shared<std::atomic<bool>>(true);
    MockConnection::Handler handler;
    std::atomic<int> created{0};
};

} // namespace sqlbridge::testing
