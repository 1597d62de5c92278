#include "db/transaction_scope.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlbridge {

TransactionScope::TransactionScope(IDbConnection& conn, bool transactional)
    : conn_(conn) {
    if (!transactional) {
        return;
    }

    const auto result = conn_.execute("BEGIN", {});
    if (!result.success) {
        throw QueryExecutionError(result.error_message);
    }
    active_ = true;
}

TransactionScope::~TransactionScope() {
    if (active_) {
        rollback();
    }
}

void TransactionScope::commit() {
    if (!active_) {
        return;
    }
    active_ = false;

    const auto result = conn_.execute("COMMIT", {});
    if (!result.success) {
        // A failed COMMIT can leave the transaction open on some engines
        const auto rb = conn_.execute("ROLLBACK", {});
        if (!rb.success) {
            utils::log::warn(std::format("ROLLBACK after failed COMMIT failed: {}", rb.error_message));
        }
        throw QueryExecutionError(result.error_message);
    }
}

void TransactionScope::rollback() noexcept {
    if (!active_) {
        return;
    }
    active_ = false;

    try {
        const auto result = conn_.execute("ROLLBACK", {});
        if (!result.success) {
            utils::log::warn(std::format("ROLLBACK failed: {}", result.error_message));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("ROLLBACK threw: {}", e.what()));
    }
}

} // namespace sqlbridge
