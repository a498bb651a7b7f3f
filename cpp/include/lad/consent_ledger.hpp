/**
 * @file consent_ledger.hpp
 * @brief SQLite store of remembered consent decisions
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Keeps approved/denied decisions keyed by agent card URL so a user is
 * not asked twice about the same agent. Deferred decisions are never
 * stored. Thread-safe.
 */

#pragma once

#include "lad/descriptor.hpp"

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>

namespace lad {

/**
 * @brief One remembered decision
 */
struct ConsentRecord {
    std::string agent_card_url;
    std::string agent_name;
    ConsentDecision decision = ConsentDecision::DENIED;
    bool verified = false;                  ///< Verification state when decided
    uint64_t decided_at = 0;                ///< Unix timestamp
};

/**
 * @brief ConsentLedger - Persistent consent decisions
 */
class ConsentLedger {
public:
    /**
     * @brief Open or create the ledger
     * @param database_path Path to SQLite database file (":memory:" allowed)
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit ConsentLedger(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~ConsentLedger();

    // Disable copy and move
    ConsentLedger(const ConsentLedger&) = delete;
    ConsentLedger& operator=(const ConsentLedger&) = delete;
    ConsentLedger(ConsentLedger&&) = delete;
    ConsentLedger& operator=(ConsentLedger&&) = delete;

    /**
     * @brief Remember a terminal decision
     * @param agent Agent the decision is about
     * @param decision APPROVED or DENIED
     * @return true if stored, false for DEFERRED or on database error
     */
    bool record_decision(const DiscoveredAgent& agent, ConsentDecision decision);

    /**
     * @brief Look up a remembered decision
     */
    std::optional<ConsentRecord> get_decision(const std::string& agent_card_url) const;

    /**
     * @brief Drop a remembered decision
     * @return true if a decision was removed
     */
    bool forget(const std::string& agent_card_url);

    std::vector<ConsentRecord> list_decisions() const;
    size_t size() const;

    const std::string& database_path() const { return database_path_; }

private:
    bool initialize_database();

    std::string database_path_;
    void* db_connection_;           ///< sqlite3*
    mutable std::mutex db_mutex_;
};

} // namespace lad
