/**
 * @file consent_ledger.cpp
 * @brief Implementation of the SQLite consent ledger
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/consent_ledger.hpp"
#include "lad/utilities.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <stdexcept>

namespace lad {

namespace {

    std::string column_text(sqlite3_stmt* stmt, int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    std::optional<ConsentRecord> read_record(sqlite3_stmt* stmt) {
        auto decision = consent_decision_from_string(column_text(stmt, 2));
        if (!decision || *decision == ConsentDecision::DEFERRED) {
            return std::nullopt;
        }

        ConsentRecord record;
        record.agent_card_url = column_text(stmt, 0);
        record.agent_name = column_text(stmt, 1);
        record.decision = *decision;
        record.verified = sqlite3_column_int(stmt, 3) != 0;
        record.decided_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        return record;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ConsentLedger::ConsentLedger(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    if (database_path_ != ":memory:") {
        auto parent = std::filesystem::path(database_path_).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            std::filesystem::create_directories(parent, ec);
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);
    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open consent database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize consent database schema");
    }

    utilities::log_debug("ConsentLedger: Opened " + database_path_);
}

ConsentLedger::~ConsentLedger() {
    if (db_connection_) {
        sqlite3_close(static_cast<sqlite3*>(db_connection_));
        db_connection_ = nullptr;
    }
}

bool ConsentLedger::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_table = R"(
        CREATE TABLE IF NOT EXISTS consent_decisions (
            agent_card_url TEXT PRIMARY KEY,
            agent_name TEXT NOT NULL,
            decision TEXT NOT NULL,
            verified INTEGER NOT NULL,
            decided_at INTEGER NOT NULL,
            CONSTRAINT terminal_decision CHECK (decision IN ('approved', 'denied'))
        );
    )";

    int rc = sqlite3_exec(db, create_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error("ConsentLedger: Schema error: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }
    return true;
}

// ============================================================================
// Decisions
// ============================================================================

bool ConsentLedger::record_decision(const DiscoveredAgent& agent, ConsentDecision decision) {
    if (decision == ConsentDecision::DEFERRED) {
        return false;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO consent_decisions
        (agent_card_url, agent_name, decision, verified, decided_at)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        utilities::log_error("ConsentLedger: Prepare failed: " + std::string(sqlite3_errmsg(db)));
        return false;
    }

    std::string decision_text = to_string(decision);
    sqlite3_bind_text(stmt, 1, agent.descriptor.agent_card_url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, agent.descriptor.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, decision_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, agent.verified ? 1 : 0);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(utilities::current_unix_time()));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        utilities::log_error("ConsentLedger: Insert failed: " + std::string(sqlite3_errmsg(db)));
        return false;
    }
    return true;
}

std::optional<ConsentRecord> ConsentLedger::get_decision(const std::string& agent_card_url) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT agent_card_url, agent_name, decision, verified, decided_at
        FROM consent_decisions WHERE agent_card_url = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, agent_card_url.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<ConsentRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_record(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

bool ConsentLedger::forget(const std::string& agent_card_url) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM consent_decisions WHERE agent_card_url = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, agent_card_url.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

std::vector<ConsentRecord> ConsentLedger::list_decisions() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT agent_card_url, agent_name, decision, verified, decided_at
        FROM consent_decisions ORDER BY decided_at, agent_card_url
    )";

    std::vector<ConsentRecord> records;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return records;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto record = read_record(stmt);
        if (record) {
            records.push_back(std::move(*record));
        }
    }
    sqlite3_finalize(stmt);
    return records;
}

size_t ConsentLedger::size() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM consent_decisions", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace lad
