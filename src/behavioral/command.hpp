// File: src/behavioral/command.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace patcat {

/// Receiver: a light that reports every switch to a sink
class Light {
public:
    explicit Light(OutputSink& out) : out_(out) {}

    void TurnOn();
    void TurnOff();

    bool IsOn() const { return on_; }

private:
    OutputSink& out_;
    bool on_{false};
};

/// Abstract command bound to a receiver
class Command {
public:
    virtual ~Command() = default;

    virtual void Execute() = 0;

    /// Reverse the effect of the last Execute()
    virtual void Undo() = 0;
};

class LightOnCommand : public Command {
public:
    explicit LightOnCommand(Light& light) : light_(light) {}

    void Execute() override { light_.TurnOn(); }
    void Undo() override { light_.TurnOff(); }

private:
    Light& light_;
};

class LightOffCommand : public Command {
public:
    explicit LightOffCommand(Light& light) : light_(light) {}

    void Execute() override { light_.TurnOff(); }
    void Undo() override { light_.TurnOn(); }

private:
    Light& light_;
};

/// Invoker: named command slots plus an undo history
class RemoteControl {
public:
    explicit RemoteControl(OutputSink& out) : out_(out) {}

    /// Bind a command to a slot name, replacing any previous binding
    void Bind(const std::string& name, std::unique_ptr<Command> command);

    /// Execute the command bound to name
    /// @return false if nothing is bound to name
    bool Press(const std::string& name);

    /// Undo the most recently executed command
    /// @return false if the history is empty
    bool Undo();

    size_t HistorySize() const { return history_.size(); }

private:
    OutputSink& out_;
    std::map<std::string, std::unique_ptr<Command>> slots_;
    std::vector<Command*> history_;
};

/// Press each of input.Values() on a remote wired to a light
/// ("on", "off" and "undo" are understood)
void RunCommandDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
