// SHARELEDGER - Governance Engine
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Share-weighted proposals against a tokenized asset.
//
// Proposal lifecycle:
//   Open      - height < endHeight, accepting votes
//   Closed    - voting window over, not yet finalized
//   Finalized - outcome recorded; terminal
//
// A proposal passes when votesFor >= minimumThreshold. Each account votes
// at most once per proposal and its weight is fixed when the vote is cast.

#ifndef SHARELEDGER_GOVERNANCE_GOVERNANCE_H
#define SHARELEDGER_GOVERNANCE_GOVERNANCE_H

#include "shareledger/compliance/compliance.h"
#include "shareledger/core/result.h"
#include "shareledger/core/types.h"
#include "shareledger/ledger/params.h"
#include "shareledger/ledger/state.h"
#include "shareledger/registry/token_ledger.h"

#include <optional>
#include <string>
#include <vector>

namespace shareledger {
namespace governance {

using ledger::CallContext;
using ledger::Proposal;
using ledger::VoteRecord;

// ============================================================================
// Proposal State
// ============================================================================

enum class ProposalState : uint8_t {
    Open = 0,
    Closed = 1,
    Finalized = 2
};

/// Convert proposal state to string
const char* ProposalStateToString(ProposalState state);

/// Parse proposal state from string
std::optional<ProposalState> ParseProposalState(const std::string& str);

/// State of a proposal at a height
ProposalState GetProposalStateAt(const Proposal& proposal, BlockHeight height);

// ============================================================================
// Governance Engine
// ============================================================================

class GovernanceEngine {
public:
    GovernanceEngine(ledger::LedgerState& state, const ledger::LedgerParams& params,
                     const registry::TokenLedger& tokens,
                     const compliance::ComplianceGate& compliance);

    /**
     * Open a proposal on an asset. Voting runs from ctx.height until
     * ctx.height + duration.
     *
     * Errors, in order: InvalidDuration, InvalidVotes (threshold outside
     * 1..SUPPLY_PER_ASSET), InvalidTitle, NotFound (asset), NotAuthorized
     * (caller holds under 10% of the supply), KycRequired.
     */
    Result<ProposalId> InitiateProposal(const CallContext& ctx, AssetId assetId,
                                        const std::string& title, BlockHeight duration,
                                        Amount minimumThreshold);

    /**
     * Cast the caller's vote with the given weight.
     *
     * Errors, in order: NotFound, VoteEnded, VoteExists, InvalidVotes (zero
     * weight), InvalidAmount (weight above the caller's balance), KycRequired.
     */
    VoidResult CastVote(const CallContext& ctx, ProposalId proposalId, bool support,
                        Amount weight);

    /**
     * Record the outcome of a closed proposal.
     *
     * Errors, in order: NotFound, AlreadyExecuted, VotingActive.
     * @return Whether the proposal passed
     */
    Result<bool> Finalize(const CallContext& ctx, ProposalId proposalId);

    Result<Proposal> GetProposalDetails(ProposalId proposalId) const;

    Result<VoteRecord> GetVoteRecord(ProposalId proposalId, const Address& voter) const;

    Result<ProposalState> GetProposalState(ProposalId proposalId, BlockHeight height) const;

    /// Proposals on an asset in id order
    std::vector<Proposal> GetProposalsForAsset(AssetId assetId) const;

    uint64_t GetProposalCount() const { return state_.nextProposalId; }

private:
    ledger::LedgerState& state_;
    const ledger::LedgerParams& params_;
    const registry::TokenLedger& tokens_;
    const compliance::ComplianceGate& compliance_;
};

} // namespace governance
} // namespace shareledger

#endif // SHARELEDGER_GOVERNANCE_GOVERNANCE_H
