// SHARELEDGER - Governance Engine Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/governance/governance.h"
#include "shareledger/util/logging.h"

namespace shareledger {
namespace governance {

namespace {

template<typename T>
Result<T> Reject(LedgerError error, const std::string& message) {
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Rejected: "
        << LedgerErrorToString(error) << " (" << message << ")";
    return Result<T>::Failure(error, message);
}

std::string ProposalName(ProposalId id) {
    return "proposal " + std::to_string(id);
}

} // namespace

// ============================================================================
// Proposal State
// ============================================================================

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Open: return "Open";
        case ProposalState::Closed: return "Closed";
        case ProposalState::Finalized: return "Finalized";
        default: return "Unknown";
    }
}

std::optional<ProposalState> ParseProposalState(const std::string& str) {
    if (str == "Open" || str == "open") return ProposalState::Open;
    if (str == "Closed" || str == "closed") return ProposalState::Closed;
    if (str == "Finalized" || str == "finalized") return ProposalState::Finalized;
    return std::nullopt;
}

ProposalState GetProposalStateAt(const Proposal& proposal, BlockHeight height) {
    if (proposal.executed) {
        return ProposalState::Finalized;
    }
    return height < proposal.endHeight ? ProposalState::Open : ProposalState::Closed;
}

// ============================================================================
// Governance Engine
// ============================================================================

GovernanceEngine::GovernanceEngine(ledger::LedgerState& state,
                                   const ledger::LedgerParams& params,
                                   const registry::TokenLedger& tokens,
                                   const compliance::ComplianceGate& compliance)
    : state_(state), params_(params), tokens_(tokens), compliance_(compliance) {}

Result<ProposalId> GovernanceEngine::InitiateProposal(const CallContext& ctx, AssetId assetId,
                                                      const std::string& title,
                                                      BlockHeight duration,
                                                      Amount minimumThreshold) {
    if (duration < ledger::MIN_DURATION || duration > ledger::MAX_DURATION) {
        return Reject<ProposalId>(LedgerError::InvalidDuration,
                                  "duration " + std::to_string(duration));
    }
    if (minimumThreshold == 0 || minimumThreshold > ledger::SUPPLY_PER_ASSET) {
        return Reject<ProposalId>(LedgerError::InvalidVotes,
                                  "threshold " + std::to_string(minimumThreshold));
    }
    if (title.empty() || title.size() > ledger::MAX_TITLE_LENGTH) {
        return Reject<ProposalId>(LedgerError::InvalidTitle,
                                  "title length " + std::to_string(title.size()));
    }
    if (!tokens_.AssetExists(assetId)) {
        return Reject<ProposalId>(LedgerError::NotFound, "asset " + std::to_string(assetId));
    }
    Amount balance = tokens_.GetShareBalance(ctx.caller, assetId);
    if (balance < ledger::LedgerParams::ProposalThreshold()) {
        return Reject<ProposalId>(LedgerError::NotAuthorized,
                                  "proposer holds " + std::to_string(balance) + " shares");
    }
    auto gate = compliance_.CheckGate(ctx.caller, params_.proposeLevel, ctx.height);
    if (!gate) {
        return Result<ProposalId>::Failure(gate.Error(), gate.Message());
    }

    ProposalId id = ++state_.nextProposalId;

    Proposal proposal;
    proposal.id = id;
    proposal.assetId = assetId;
    proposal.proposer = ctx.caller;
    proposal.title = title;
    proposal.startHeight = ctx.height;
    proposal.endHeight = ctx.height + duration;
    proposal.minimumThreshold = minimumThreshold;
    state_.proposals.emplace(id, proposal);

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Opened " << ProposalName(id) << " on asset "
        << assetId << " \"" << title << "\" until height " << proposal.endHeight;
    return Result<ProposalId>::Success(id);
}

VoidResult GovernanceEngine::CastVote(const CallContext& ctx, ProposalId proposalId,
                                      bool support, Amount weight) {
    auto it = state_.proposals.find(proposalId);
    if (it == state_.proposals.end()) {
        return Reject<Unit>(LedgerError::NotFound, ProposalName(proposalId));
    }
    Proposal& proposal = it->second;
    if (GetProposalStateAt(proposal, ctx.height) != ProposalState::Open) {
        return Reject<Unit>(LedgerError::VoteEnded, ProposalName(proposalId) + " is closed");
    }
    ledger::VoteKey key(proposalId, ctx.caller);
    if (state_.votes.count(key) > 0) {
        return Reject<Unit>(LedgerError::VoteExists,
                            ctx.caller.ToHex() + " already voted on " + ProposalName(proposalId));
    }
    // A zero-weight vote would use up the voter's one record without moving
    // either tally, so it is refused rather than stored
    if (weight == 0) {
        return Reject<Unit>(LedgerError::InvalidVotes, "zero vote weight");
    }
    Amount balance = tokens_.GetShareBalance(ctx.caller, proposal.assetId);
    if (weight > balance) {
        return Reject<Unit>(LedgerError::InvalidAmount,
                            "weight " + std::to_string(weight) + " exceeds balance " +
                            std::to_string(balance));
    }
    auto gate = compliance_.CheckGate(ctx.caller, params_.voteLevel, ctx.height);
    if (!gate) {
        return gate;
    }

    VoteRecord vote;
    vote.weight = weight;
    vote.support = support;
    vote.castAt = ctx.height;
    state_.votes.emplace(key, vote);

    if (support) {
        proposal.votesFor += weight;
    } else {
        proposal.votesAgainst += weight;
    }

    LOG_DEBUG(util::LogCategory::GOVERNANCE) << ctx.caller.ToHex() << " voted "
        << (support ? "for " : "against ") << ProposalName(proposalId)
        << " with weight " << weight;
    return VoidResult::Success({});
}

Result<bool> GovernanceEngine::Finalize(const CallContext& ctx, ProposalId proposalId) {
    auto it = state_.proposals.find(proposalId);
    if (it == state_.proposals.end()) {
        return Reject<bool>(LedgerError::NotFound, ProposalName(proposalId));
    }
    Proposal& proposal = it->second;
    if (proposal.executed) {
        return Reject<bool>(LedgerError::AlreadyExecuted,
                            ProposalName(proposalId) + " already finalized");
    }
    if (ctx.height < proposal.endHeight) {
        return Reject<bool>(LedgerError::VotingActive,
                            ProposalName(proposalId) + " open until height " +
                            std::to_string(proposal.endHeight));
    }

    proposal.executed = true;
    // Inclusive: a tally equal to the threshold passes
    proposal.passed = proposal.votesFor >= proposal.minimumThreshold;

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Finalized " << ProposalName(proposalId)
        << ": " << (proposal.passed ? "passed" : "failed") << " (for " << proposal.votesFor
        << ", against " << proposal.votesAgainst << ", threshold "
        << proposal.minimumThreshold << ")";
    return Result<bool>::Success(proposal.passed);
}

Result<Proposal> GovernanceEngine::GetProposalDetails(ProposalId proposalId) const {
    auto it = state_.proposals.find(proposalId);
    if (it == state_.proposals.end()) {
        return Result<Proposal>::Failure(LedgerError::NotFound, ProposalName(proposalId));
    }
    return Result<Proposal>::Success(it->second);
}

Result<VoteRecord> GovernanceEngine::GetVoteRecord(ProposalId proposalId,
                                                   const Address& voter) const {
    auto it = state_.votes.find({proposalId, voter});
    if (it == state_.votes.end()) {
        return Result<VoteRecord>::Failure(LedgerError::NotFound,
                                           "no vote by " + voter.ToHex() + " on " +
                                           ProposalName(proposalId));
    }
    return Result<VoteRecord>::Success(it->second);
}

Result<ProposalState> GovernanceEngine::GetProposalState(ProposalId proposalId,
                                                         BlockHeight height) const {
    auto it = state_.proposals.find(proposalId);
    if (it == state_.proposals.end()) {
        return Result<ProposalState>::Failure(LedgerError::NotFound, ProposalName(proposalId));
    }
    return Result<ProposalState>::Success(GetProposalStateAt(it->second, height));
}

std::vector<Proposal> GovernanceEngine::GetProposalsForAsset(AssetId assetId) const {
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : state_.proposals) {
        if (proposal.assetId == assetId) {
            result.push_back(proposal);
        }
    }
    return result;
}

} // namespace governance
} // namespace shareledger
