// Interactive per-group confirmation.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Model.hpp"
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace dupelink
{

enum class ConfirmState
{
    Prompting,
    AutoConfirmRemaining,
    Cancelled,
    Done
};

enum class Response
{
    Yes,
    No,
    All,
    Quit,
    Invalid
};

/// Parse a user answer (y/yes, n/no, a/all, q/quit, case insensitive, surrounding whitespace ignored).
Response parseResponse(const std::string& input);

/// State machine deciding which groups get executed.
///
/// Prompting: y confirms the group, n declines it, a confirms it and auto-confirms all following
/// groups, q cancels everything that has not been decided yet. Any other answer leaves the state
/// unchanged so the caller asks again. Cancelled and Done are terminal.
class ConfirmationMachine
{
public:
    /// With blanketConfirm the machine starts in AutoConfirmRemaining and never prompts.
    explicit ConfirmationMachine(bool blanketConfirm = false);

    ConfirmState state() const { return currentState; }

    /// True if the current group needs an answer from the user.
    bool needsPrompt() const { return currentState == ConfirmState::Prompting; }

    /// Apply an answer for the current group (only valid while Prompting).
    /// Returns the decision, or std::nullopt if the answer was invalid and the group must be asked again.
    std::optional<ConfirmationDecision> onResponse(Response response);

    /// Decision for the current group in AutoConfirmRemaining.
    ConfirmationDecision autoConfirm();

    /// Interrupt signal: cancel unless already terminal.
    void interrupt();

    /// All groups decided (or cancelled).
    void finish();

private:
    ConfirmState currentState{ConfirmState::Prompting};
};

using ResponseReader = std::function<std::optional<std::string>(const std::string& prompt)>;
using GroupPresenter = std::function<void(size_t index, const DuplicateGroup& group)>;

/// Prompt text for group index (0 based) of total, e.g. "[1/3] Create hardlink? [y/n/a/q] ".
std::string promptText(size_t index, size_t total, ActionKind action);

/// Run the machine over all groups and return one decision per group.
/// readResponse returns std::nullopt at end of input, which counts as quit.
/// interrupted is polled before each group and after each answer.
std::vector<ConfirmationDecision> confirmGroups(const std::vector<DuplicateGroup>& groups, ActionKind action, ConfirmationMachine& machine,
                                                const ResponseReader& readResponse, const GroupPresenter& showGroup,
                                                const std::function<bool()>& interrupted, std::ostream& os);

/// Read one answer line from stdin after printing the prompt to os.
std::optional<std::string> readStdinResponse(const std::string& prompt, std::ostream& os = std::cout);

/// Throws SetupError if prompting is needed but stdin is not a terminal.
void requireInteractiveInput(bool stdinIsTty, bool blanketConfirm);

} // namespace dupelink
