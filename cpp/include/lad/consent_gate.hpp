/**
 * @file consent_gate.hpp
 * @brief User consent before connecting to discovered agents
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Per agent: pending -> approved | denied | deferred.
 * Approved and denied are terminal; deferred returns to pending.
 */

#pragma once

#include "lad/consent_ledger.hpp"
#include "lad/descriptor.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <functional>

namespace lad {

/**
 * @brief Caller-supplied decision function (UI prompt, policy, ...)
 */
using ConsentFunction = std::function<ConsentDecision(const ConsentRequest& request)>;

/**
 * @brief Consent state of one agent
 */
enum class ConsentState {
    PENDING,
    APPROVED,
    DENIED
};

std::string to_string(ConsentState state);

/**
 * @brief Gate settings
 */
struct ConsentGateOptions {
    bool require_verified = false;  ///< Drop unverified agents before asking
};

/**
 * @brief ConsentGate - Applies a decision function to discovered agents
 */
class ConsentGate {
public:
    /**
     * @brief Construct ConsentGate
     * @param decide Decision function (must not be empty)
     * @param options Gate settings
     * @param ledger Optional store of remembered decisions
     * @throws std::invalid_argument if decide is empty
     */
    explicit ConsentGate(
        ConsentFunction decide,
        ConsentGateOptions options = {},
        std::shared_ptr<ConsentLedger> ledger = nullptr
    );

    /**
     * @brief Approve verified agents and deny the rest
     */
    static ConsentFunction default_policy();

    /**
     * @brief Ask for consent for one agent
     *
     * Terminal and remembered decisions are returned without calling the
     * decision function. A throwing decision function leaves the agent
     * pending and reports DEFERRED.
     *
     * @param agent Agent to decide on
     * @return Decision (DENIED without asking for unverified agents under require_verified)
     */
    ConsentDecision request_consent(const DiscoveredAgent& agent);

    /**
     * @brief Keep only approved agents, in input order
     */
    std::vector<DiscoveredAgent> filter(const std::vector<DiscoveredAgent>& agents);

    ConsentState state(const std::string& agent_card_url) const;

    /**
     * @brief Return an agent to pending and drop any remembered decision
     */
    void reset(const std::string& agent_card_url);

    const ConsentGateOptions& options() const { return options_; }

private:
    ConsentFunction decide_;
    ConsentGateOptions options_;
    std::shared_ptr<ConsentLedger> ledger_;

    std::map<std::string, ConsentState> states_;
    mutable std::mutex states_mutex_;
};

} // namespace lad
