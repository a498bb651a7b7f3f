/**
 * @file consent_gate.cpp
 * @brief Implementation of the consent gate
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/consent_gate.hpp"
#include "lad/utilities.hpp"

#include <stdexcept>

namespace lad {

using namespace lad::utilities;

std::string to_string(ConsentState state) {
    switch (state) {
        case ConsentState::PENDING:  return "pending";
        case ConsentState::APPROVED: return "approved";
        case ConsentState::DENIED:   return "denied";
    }
    return "pending";
}

ConsentGate::ConsentGate(
    ConsentFunction decide,
    ConsentGateOptions options,
    std::shared_ptr<ConsentLedger> ledger
)
    : decide_(std::move(decide))
    , options_(options)
    , ledger_(std::move(ledger))
{
    if (!decide_) {
        throw std::invalid_argument("ConsentGate: decision function cannot be empty");
    }
}

ConsentFunction ConsentGate::default_policy() {
    return [](const ConsentRequest& request) {
        return request.verified ? ConsentDecision::APPROVED : ConsentDecision::DENIED;
    };
}

ConsentDecision ConsentGate::request_consent(const DiscoveredAgent& agent) {
    const std::string& url = agent.descriptor.agent_card_url;

    if (options_.require_verified && !agent.verified) {
        log_debug("ConsentGate: Skipping unverified agent " + agent.descriptor.name);
        return ConsentDecision::DENIED;
    }

    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        auto it = states_.find(url);
        if (it != states_.end() && it->second != ConsentState::PENDING) {
            return it->second == ConsentState::APPROVED ? ConsentDecision::APPROVED : ConsentDecision::DENIED;
        }
    }

    if (ledger_) {
        auto remembered = ledger_->get_decision(url);
        if (remembered) {
            std::lock_guard<std::mutex> lock(states_mutex_);
            states_[url] = remembered->decision == ConsentDecision::APPROVED
                ? ConsentState::APPROVED : ConsentState::DENIED;
            log_info("ConsentGate: Using remembered decision for " + agent.descriptor.name
                + ": " + to_string(remembered->decision));
            return remembered->decision;
        }
    }

    ConsentDecision decision = ConsentDecision::DEFERRED;
    try {
        decision = decide_(ConsentRequest::for_agent(agent));
    } catch (const std::exception& e) {
        log_error("ConsentGate: Decision function failed for " + agent.descriptor.name + ": " + e.what());
        std::lock_guard<std::mutex> lock(states_mutex_);
        states_[url] = ConsentState::PENDING;
        return ConsentDecision::DEFERRED;
    }

    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        switch (decision) {
            case ConsentDecision::APPROVED: states_[url] = ConsentState::APPROVED; break;
            case ConsentDecision::DENIED:   states_[url] = ConsentState::DENIED; break;
            case ConsentDecision::DEFERRED: states_[url] = ConsentState::PENDING; break;
        }
    }

    if (ledger_ && decision != ConsentDecision::DEFERRED && !ledger_->record_decision(agent, decision)) {
        log_warn("ConsentGate: Decision for " + agent.descriptor.name + " not remembered");
    }

    log_info("ConsentGate: " + agent.descriptor.name + " " + to_string(decision));
    return decision;
}

std::vector<DiscoveredAgent> ConsentGate::filter(const std::vector<DiscoveredAgent>& agents) {
    std::vector<DiscoveredAgent> approved;
    for (const auto& agent : agents) {
        if (options_.require_verified && !agent.verified) {
            continue;
        }
        if (request_consent(agent) == ConsentDecision::APPROVED) {
            approved.push_back(agent);
        }
    }
    return approved;
}

ConsentState ConsentGate::state(const std::string& agent_card_url) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = states_.find(agent_card_url);
    return it == states_.end() ? ConsentState::PENDING : it->second;
}

void ConsentGate::reset(const std::string& agent_card_url) {
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        states_.erase(agent_card_url);
    }
    if (ledger_ && ledger_->forget(agent_card_url)) {
        log_debug("ConsentGate: Forgot remembered decision for " + agent_card_url);
    }
}

} // namespace lad
