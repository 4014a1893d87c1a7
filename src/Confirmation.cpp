// Interactive per-group confirmation.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Confirmation.hpp"
#include "ActionExecutor.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "Log.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <cctype>
#include <deque>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dupelink
{

Response parseResponse(const std::string& input)
{
    size_t begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return Response::Invalid;
    }
    size_t end = input.find_last_not_of(" \t\r\n");
    std::string word = input.substr(begin, end - begin + 1);
    for (char& c : word)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (word == "y" || word == "yes")
    {
        return Response::Yes;
    }
    if (word == "n" || word == "no")
    {
        return Response::No;
    }
    if (word == "a" || word == "all")
    {
        return Response::All;
    }
    if (word == "q" || word == "quit")
    {
        return Response::Quit;
    }
    return Response::Invalid;
}

ConfirmationMachine::ConfirmationMachine(bool blanketConfirm)
    : currentState(blanketConfirm ? ConfirmState::AutoConfirmRemaining : ConfirmState::Prompting)
{
}

std::optional<ConfirmationDecision> ConfirmationMachine::onResponse(Response response)
{
    if (currentState != ConfirmState::Prompting)
    {
        throw std::logic_error("Confirmation answer outside of the prompting state.");
    }
    switch (response)
    {
        case Response::Yes:
            return ConfirmationDecision::Confirmed;
        case Response::No:
            return ConfirmationDecision::Skipped;
        case Response::All:
            currentState = ConfirmState::AutoConfirmRemaining;
            return ConfirmationDecision::Confirmed;
        case Response::Quit:
            currentState = ConfirmState::Cancelled;
            return ConfirmationDecision::Cancelled;
        case Response::Invalid:
            break;
    }
    return std::nullopt;
}

ConfirmationDecision ConfirmationMachine::autoConfirm()
{
    if (currentState != ConfirmState::AutoConfirmRemaining)
    {
        throw std::logic_error("Auto confirmation outside of the auto confirm state.");
    }
    return ConfirmationDecision::AutoConfirmedRemaining;
}

void ConfirmationMachine::interrupt()
{
    if (currentState == ConfirmState::Prompting || currentState == ConfirmState::AutoConfirmRemaining)
    {
        currentState = ConfirmState::Cancelled;
    }
}

void ConfirmationMachine::finish()
{
    currentState = ConfirmState::Done;
}

std::string promptText(size_t index, size_t total, ActionKind action)
{
    std::string question;
    switch (action)
    {
        case ActionKind::Hardlink:
            question = "Create hardlink?";
            break;
        case ActionKind::Symlink:
            question = "Create symlink?";
            break;
        case ActionKind::Delete:
            question = "Delete duplicate?";
            break;
        case ActionKind::Compare:
            question = "Continue?";
            break;
    }
    return "[" + ut1::toStr(index + 1) + "/" + ut1::toStr(total) + "] " + question + " [y/n/a/q] ";
}

std::vector<ConfirmationDecision> confirmGroups(const std::vector<DuplicateGroup>& groups, ActionKind action, ConfirmationMachine& machine,
                                                const ResponseReader& readResponse, const GroupPresenter& showGroup,
                                                const std::function<bool()>& interrupted, std::ostream& os)
{
    std::vector<ConfirmationDecision> decisions(groups.size(), ConfirmationDecision::Cancelled);
    for (size_t i = 0; i < groups.size(); i++)
    {
        if (interrupted && interrupted())
        {
            machine.interrupt();
        }
        if (machine.state() == ConfirmState::Cancelled)
        {
            break;
        }
        if (!machine.needsPrompt())
        {
            decisions[i] = machine.autoConfirm();
            continue;
        }

        if (showGroup)
        {
            showGroup(i, groups[i]);
        }
        for (;;)
        {
            std::optional<std::string> input = readResponse(promptText(i, groups.size(), action));
            if (interrupted && interrupted())
            {
                machine.interrupt();
                break;
            }
            std::optional<ConfirmationDecision> decision = machine.onResponse(input ? parseResponse(*input) : Response::Quit);
            if (decision)
            {
                decisions[i] = *decision;
                break;
            }
            os << "Invalid response, please answer y, n, a or q." << std::endl;
        }
    }
    machine.finish();
    return decisions;
}

std::optional<std::string> readStdinResponse(const std::string& prompt, std::ostream& os)
{
    os << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line))
    {
        os << std::endl;
        return std::nullopt;
    }
    return line;
}

void requireInteractiveInput(bool stdinIsTty, bool blanketConfirm)
{
    if (!stdinIsTty && !blanketConfirm)
    {
        throw SetupError("Confirmation prompts need an interactive terminal on stdin. Use --yes to confirm all groups without prompting.");
    }
}

} // namespace dupelink

using namespace dupelink;

/// Feed canned answers and record the prompts.
class ScriptedInput
{
public:
    explicit ScriptedInput(std::deque<std::string> answers_): answers(std::move(answers_)) {}

    ResponseReader reader()
    {
        return [this](const std::string& prompt) -> std::optional<std::string>
        {
            prompts.push_back(prompt);
            if (answers.empty())
            {
                return std::nullopt;
            }
            std::string answer = answers.front();
            answers.pop_front();
            return answer;
        };
    }

    std::deque<std::string> answers;
    std::vector<std::string> prompts;
};

static std::vector<DuplicateGroup> dummyGroups(size_t n)
{
    std::vector<DuplicateGroup> groups(n);
    for (size_t i = 0; i < n; i++)
    {
        groups[i].hash = "hash" + ut1::toStr(i);
        groups[i].master.path = "/a/" + ut1::toStr(i);
        groups[i].duplicates.resize(1);
        groups[i].duplicates[0].path = "/b/" + ut1::toStr(i);
    }
    return groups;
}

UNIT_TEST(Confirmation_parseResponse)
{
    ASSERT_EQ(parseResponse("y") == Response::Yes, true);
    ASSERT_EQ(parseResponse(" YES\n") == Response::Yes, true);
    ASSERT_EQ(parseResponse("n") == Response::No, true);
    ASSERT_EQ(parseResponse("No") == Response::No, true);
    ASSERT_EQ(parseResponse("a") == Response::All, true);
    ASSERT_EQ(parseResponse("all") == Response::All, true);
    ASSERT_EQ(parseResponse("Q") == Response::Quit, true);
    ASSERT_EQ(parseResponse("quit") == Response::Quit, true);
    ASSERT_EQ(parseResponse("") == Response::Invalid, true);
    ASSERT_EQ(parseResponse("yy") == Response::Invalid, true);
    ASSERT_EQ(parseResponse("x") == Response::Invalid, true);
}

UNIT_TEST(Confirmation_yesNoAll)
{
    std::vector<DuplicateGroup> groups = dummyGroups(4);
    ScriptedInput input({"y", "n", "a"});
    ConfirmationMachine machine;
    std::ostringstream os;
    size_t shown = 0;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Hardlink, machine, input.reader(),
                                                        [&](size_t, const DuplicateGroup&) { shown++; }, nullptr, os);
    ASSERT_EQ(d.size(), size_t(4));
    ASSERT_EQ(d[0] == ConfirmationDecision::Confirmed, true);
    ASSERT_EQ(d[1] == ConfirmationDecision::Skipped, true);
    ASSERT_EQ(isConfirmed(d[2]), true);
    ASSERT_EQ(d[3] == ConfirmationDecision::AutoConfirmedRemaining, true);
    ASSERT_EQ(input.prompts.size(), size_t(3));
    ASSERT_EQ(input.prompts[0], "[1/4] Create hardlink? [y/n/a/q] ");
    ASSERT_EQ(shown, size_t(3));
    ASSERT_EQ(machine.state() == ConfirmState::Done, true);
}

UNIT_TEST(Confirmation_quitCancelsRemaining)
{
    std::vector<DuplicateGroup> groups = dummyGroups(3);
    ScriptedInput input({"y", "q", "y"});
    ConfirmationMachine machine;
    std::ostringstream os;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Delete, machine, input.reader(), nullptr, nullptr, os);
    ASSERT_EQ(d[0] == ConfirmationDecision::Confirmed, true);
    ASSERT_EQ(d[1] == ConfirmationDecision::Cancelled, true);
    ASSERT_EQ(d[2] == ConfirmationDecision::Cancelled, true);
    ASSERT_EQ(input.prompts.size(), size_t(2));
    ASSERT_EQ(input.prompts[1], "[2/3] Delete duplicate? [y/n/a/q] ");
}

UNIT_TEST(Confirmation_invalidAnswerPromptsAgain)
{
    std::vector<DuplicateGroup> groups = dummyGroups(1);
    ScriptedInput input({"maybe", "", " Y "});
    ConfirmationMachine machine;
    std::ostringstream os;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Symlink, machine, input.reader(), nullptr, nullptr, os);
    ASSERT_EQ(d[0] == ConfirmationDecision::Confirmed, true);
    ASSERT_EQ(input.prompts.size(), size_t(3));
    ASSERT_EQ(input.prompts[2], input.prompts[0]);
    ASSERT_EQ(os.str().find("Invalid response") != std::string::npos, true);
}

UNIT_TEST(Confirmation_endOfInputQuits)
{
    std::vector<DuplicateGroup> groups = dummyGroups(2);
    ScriptedInput input(std::deque<std::string>{});
    ConfirmationMachine machine;
    std::ostringstream os;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Hardlink, machine, input.reader(), nullptr, nullptr, os);
    ASSERT_EQ(d[0] == ConfirmationDecision::Cancelled, true);
    ASSERT_EQ(d[1] == ConfirmationDecision::Cancelled, true);
    ASSERT_EQ(input.prompts.size(), size_t(1));
}

UNIT_TEST(Confirmation_blanketConfirmNeverPrompts)
{
    std::vector<DuplicateGroup> groups = dummyGroups(3);
    ScriptedInput input(std::deque<std::string>{});
    ConfirmationMachine machine(true);
    std::ostringstream os;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Hardlink, machine, input.reader(), nullptr, nullptr, os);
    for (ConfirmationDecision decision : d)
    {
        ASSERT_EQ(decision == ConfirmationDecision::AutoConfirmedRemaining, true);
    }
    ASSERT_EQ(input.prompts.size(), size_t(0));
}

UNIT_TEST(Confirmation_interruptWhilePrompting)
{
    std::vector<DuplicateGroup> groups = dummyGroups(3);
    bool interrupted = false;
    ScriptedInput input({"y", "y", "y"});
    ResponseReader reader = input.reader();
    ResponseReader interruptingReader = [&](const std::string& prompt)
    {
        if (input.prompts.size() == 1)
        {
            // Ctrl-C arrives while waiting for the second answer.
            interrupted = true;
        }
        return reader(prompt);
    };
    ConfirmationMachine machine;
    std::ostringstream os;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Hardlink, machine, interruptingReader, nullptr,
                                                        [&] { return interrupted; }, os);
    ASSERT_EQ(d[0] == ConfirmationDecision::Confirmed, true);
    ASSERT_EQ(d[1] == ConfirmationDecision::Cancelled, true);
    ASSERT_EQ(d[2] == ConfirmationDecision::Cancelled, true);
}

UNIT_TEST(Confirmation_machineTransitions)
{
    ConfirmationMachine machine;
    ASSERT_EQ(machine.onResponse(Response::Invalid).has_value(), false);
    ASSERT_EQ(machine.state() == ConfirmState::Prompting, true);
    ASSERT_EQ(machine.onResponse(Response::All) == ConfirmationDecision::Confirmed, true);
    ASSERT_EQ(machine.state() == ConfirmState::AutoConfirmRemaining, true);
    ASSERT_EQ(machine.autoConfirm() == ConfirmationDecision::AutoConfirmedRemaining, true);
    machine.interrupt();
    ASSERT_EQ(machine.state() == ConfirmState::Cancelled, true);
    machine.finish();
    machine.interrupt();
    ASSERT_EQ(machine.state() == ConfirmState::Done, true);
    bool thrown = false;
    try
    {
        machine.onResponse(Response::Yes);
    }
    catch (const std::logic_error&)
    {
        thrown = true;
    }
    ASSERT_EQ(thrown, true);
}

UNIT_TEST(Confirmation_requireInteractiveInput)
{
    requireInteractiveInput(true, false);
    requireInteractiveInput(false, true);
    bool thrown = false;
    try
    {
        requireInteractiveInput(false, false);
    }
    catch (const SetupError& e)
    {
        thrown = std::string(e.what()).find("--yes") != std::string::npos;
    }
    ASSERT_EQ(thrown, true);
}

UNIT_TEST(Confirmation_quitStopsExecution)
{
    TempDir tmp;
    std::vector<DuplicateGroup> groups;
    for (int i = 0; i < 3; i++)
    {
        std::string name = "g" + ut1::toStr(i) + ".txt";
        fs::path master = writeTestFile(tmp / ("a/" + name), name);
        fs::path dup = writeTestFile(tmp / ("b/" + name), name);
        DuplicateGroup group;
        group.hash = hashFile(master, HashOptions());
        group.master = *lstatRecord(master);
        group.duplicates.push_back(*lstatRecord(dup));
        groups.push_back(group);
    }
    ScriptedInput input({"y", "q"});
    ConfirmationMachine machine;
    std::ostringstream os;
    std::vector<ConfirmationDecision> d = confirmGroups(groups, ActionKind::Hardlink, machine, input.reader(), nullptr, nullptr, os);
    bool cancelled = d.back() == ConfirmationDecision::Cancelled;

    Log log(0, true);
    ExecOptions options;
    ActionExecutor executor(options, log);
    ExecutionSummary summary = executor.executeBatch(groups, d);
    ASSERT_EQ(summary.succeeded, uint64_t(1));
    ASSERT_EQ(summary.cancelled, uint64_t(2));
    ASSERT_EQ(isHardlinkTo(tmp / "b/g0.txt", tmp / "a/g0.txt"), true);
    ASSERT_EQ(isHardlinkTo(tmp / "b/g1.txt", tmp / "a/g1.txt"), false);
    ASSERT_EQ(isHardlinkTo(tmp / "b/g2.txt", tmp / "a/g2.txt"), false);
    ASSERT_EQ(exitCode(summary, cancelled), kExitInterrupted);
}
