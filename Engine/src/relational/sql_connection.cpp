#include <relational/sql_connection.hpp>
#include <utils/logger.hpp>
#include <exception>

namespace Omnidb {

SqlConnection::Transaction::Transaction(SqlConnection& conn) : conn_(conn) {
    if (conn_.supports_transactions()) {
        conn_.begin();
        active_ = true;
    }
}

SqlConnection::Transaction::~Transaction() {
    if (!active_) return;
    try {
        conn_.rollback();
    } catch (const std::exception& e) {
        Logger::warn(std::string("rollback during unwind failed: ") + e.what());
    }
}

void SqlConnection::Transaction::commit() {
    if (!active_) return;
    active_ = false;
    conn_.commit();
}

void SqlConnection::Transaction::rollback() {
    if (!active_) return;
    active_ = false;
    conn_.rollback();
}

} // namespace Omnidb
