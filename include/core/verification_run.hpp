#pragma once

#include <string>
#include <vector>

enum class RunState
{
    RECEIVED,
    NORMALIZED,
    ANALYZED,
    SCORED,
    PERSISTED,
    PERSIST_FAILED, // Result produced but not durably stored
    ERRORED
};

struct RunTransition
{
    RunState state;
    std::string at; // ISO 8601
    std::string note;
};

/**
 * @brief Per-run state machine
 *
 * RECEIVED -> NORMALIZED -> ANALYZED -> SCORED -> PERSISTED | PERSIST_FAILED.
 * ERRORED is reachable from every non-terminal state.
 */
class VerificationRun
{
public:
    VerificationRun(const std::string &run_id, const std::string &complaint_id, const std::string &proof_id);

    /**
     * @brief Move to the next state
     * @throws std::logic_error on a transition the state machine does not allow
     */
    void advance(RunState next, const std::string &note = "");

    /// Move to ERRORED. No effect once the run is terminal.
    void fail(const std::string &reason);

    RunState state() const { return state_; }
    bool isTerminal() const;
    const std::vector<RunTransition> &history() const { return history_; }
    const std::string &runId() const { return run_id_; }
    const std::string &complaintId() const { return complaint_id_; }
    const std::string &proofId() const { return proof_id_; }
    const std::string &errorReason() const { return error_reason_; }

    static bool canTransition(RunState from, RunState to);
    static std::string stateName(RunState state);
    static std::string currentTimestamp();

private:
    std::string run_id_;
    std::string complaint_id_;
    std::string proof_id_;
    RunState state_ = RunState::RECEIVED;
    std::vector<RunTransition> history_;
    std::string error_reason_;
};
