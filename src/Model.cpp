// Data types shared by indexer, matcher, executor and audit log.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Model.hpp"
#include "UnitTest.hpp"

namespace dupelink
{

ActionOutcome ActionOutcome::succeeded(ActionKind performed, FileSize bytesReclaimed)
{
    ActionOutcome r;
    r.kind = OutcomeKind::Succeeded;
    r.performed = performed;
    r.bytesReclaimed = bytesReclaimed;
    return r;
}

ActionOutcome ActionOutcome::failed(ActionKind performed, std::string reason)
{
    ActionOutcome r;
    r.kind = OutcomeKind::Failed;
    r.performed = performed;
    r.reason = std::move(reason);
    return r;
}

ActionOutcome ActionOutcome::skipped(ActionKind performed, std::string reason)
{
    ActionOutcome r;
    r.kind = OutcomeKind::Skipped;
    r.performed = performed;
    r.reason = std::move(reason);
    return r;
}

std::string actionName(ActionKind action)
{
    switch (action)
    {
        case ActionKind::Compare:
            return "compare";
        case ActionKind::Hardlink:
            return "hardlink";
        case ActionKind::Symlink:
            return "symlink";
        case ActionKind::Delete:
            return "delete";
    }
    return "unknown";
}

std::optional<ActionKind> parseActionKind(const std::string& name)
{
    for (ActionKind action : {ActionKind::Compare, ActionKind::Hardlink, ActionKind::Symlink, ActionKind::Delete})
    {
        if (actionName(action) == name)
        {
            return action;
        }
    }
    return std::nullopt;
}

std::string masterReasonText(MasterReason reason)
{
    switch (reason)
    {
        case MasterReason::InMasterTree:
            return "in master directory";
        case MasterReason::OldestFallback:
            return "no master-directory candidate, oldest chosen";
    }
    return "unknown";
}

std::string decisionName(ConfirmationDecision decision)
{
    switch (decision)
    {
        case ConfirmationDecision::Confirmed:
            return "confirmed";
        case ConfirmationDecision::Skipped:
            return "skipped";
        case ConfirmationDecision::AutoConfirmedRemaining:
            return "auto-confirmed";
        case ConfirmationDecision::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

bool isConfirmed(ConfirmationDecision decision)
{
    return decision == ConfirmationDecision::Confirmed || decision == ConfirmationDecision::AutoConfirmedRemaining;
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(Model_parseActionKind)
{
    ASSERT_EQ(parseActionKind("hardlink") == ActionKind::Hardlink, true);
    ASSERT_EQ(parseActionKind("delete") == ActionKind::Delete, true);
    ASSERT_EQ(parseActionKind("move").has_value(), false);
    ASSERT_EQ(actionName(ActionKind::Symlink), "symlink");
}
