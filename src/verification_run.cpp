#include "core/verification_run.hpp"
#include "logging/logger.hpp"
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>
#include <stdexcept>

VerificationRun::VerificationRun(const std::string &run_id, const std::string &complaint_id, const std::string &proof_id)
    : run_id_(run_id), complaint_id_(complaint_id), proof_id_(proof_id)
{
    history_.push_back(RunTransition{RunState::RECEIVED, currentTimestamp(), ""});
    Logger::info("[run " + run_id_ + "] RECEIVED complaint=" + complaint_id_ + " proof=" + proof_id_);
}

bool VerificationRun::canTransition(RunState from, RunState to)
{
    switch (from)
    {
    case RunState::RECEIVED:
        return to == RunState::NORMALIZED || to == RunState::ERRORED;
    case RunState::NORMALIZED:
        return to == RunState::ANALYZED || to == RunState::ERRORED;
    case RunState::ANALYZED:
        return to == RunState::SCORED || to == RunState::ERRORED;
    case RunState::SCORED:
        return to == RunState::PERSISTED || to == RunState::PERSIST_FAILED || to == RunState::ERRORED;
    case RunState::PERSISTED:
    case RunState::PERSIST_FAILED:
    case RunState::ERRORED:
        return false;
    }
    return false;
}

bool VerificationRun::isTerminal() const
{
    return state_ == RunState::PERSISTED || state_ == RunState::PERSIST_FAILED || state_ == RunState::ERRORED;
}

void VerificationRun::advance(RunState next, const std::string &note)
{
    if (!canTransition(state_, next))
    {
        throw std::logic_error("Invalid run transition " + stateName(state_) + " -> " + stateName(next) +
                               " for run " + run_id_);
    }
    state_ = next;
    history_.push_back(RunTransition{next, currentTimestamp(), note});
    Logger::info("[run " + run_id_ + "] " + stateName(next) + (note.empty() ? "" : ": " + note));
}

void VerificationRun::fail(const std::string &reason)
{
    if (isTerminal())
    {
        Logger::warn("[run " + run_id_ + "] ignoring failure after terminal state " + stateName(state_) + ": " + reason);
        return;
    }
    error_reason_ = reason;
    state_ = RunState::ERRORED;
    history_.push_back(RunTransition{RunState::ERRORED, currentTimestamp(), reason});
    Logger::error("[run " + run_id_ + "] ERRORED: " + reason);
}

std::string VerificationRun::stateName(RunState state)
{
    switch (state)
    {
    case RunState::RECEIVED:
        return "RECEIVED";
    case RunState::NORMALIZED:
        return "NORMALIZED";
    case RunState::ANALYZED:
        return "ANALYZED";
    case RunState::SCORED:
        return "SCORED";
    case RunState::PERSISTED:
        return "PERSISTED";
    case RunState::PERSIST_FAILED:
        return "PERSIST_FAILED";
    case RunState::ERRORED:
        return "ERRORED";
    }
    return "UNKNOWN";
}

std::string VerificationRun::currentTimestamp()
{
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}
