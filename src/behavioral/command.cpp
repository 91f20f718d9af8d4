// File: src/behavioral/command.cpp
#include "behavioral/command.hpp"

namespace patcat {

void Light::TurnOn() {
    on_ = true;
    out_.WriteLine("Light is ON");
}

void Light::TurnOff() {
    on_ = false;
    out_.WriteLine("Light is OFF");
}

void RemoteControl::Bind(const std::string& name, std::unique_ptr<Command> command) {
    // Drop history entries pointing at the command being replaced
    auto it = slots_.find(name);
    if (it != slots_.end()) {
        Command* old = it->second.get();
        std::vector<Command*> kept;
        for (Command* cmd : history_) {
            if (cmd != old) kept.push_back(cmd);
        }
        history_.swap(kept);
    }
    slots_[name] = std::move(command);
}

bool RemoteControl::Press(const std::string& name) {
    auto it = slots_.find(name);
    if (it == slots_.end()) {
        out_.WriteLine("No command bound to '" + name + "'.");
        return false;
    }

    it->second->Execute();
    history_.push_back(it->second.get());
    return true;
}

bool RemoteControl::Undo() {
    if (history_.empty()) {
        out_.WriteLine("Nothing to undo.");
        return false;
    }

    Command* last = history_.back();
    history_.pop_back();
    last->Undo();
    return true;
}

void RunCommandDemo(const DemoInput& input, OutputSink& out) {
    Light light(out);
    RemoteControl remote(out);
    remote.Bind("on", std::make_unique<LightOnCommand>(light));
    remote.Bind("off", std::make_unique<LightOffCommand>(light));

    for (const auto& name : input.Values()) {
        if (name == "undo") {
            remote.Undo();
        } else {
            remote.Press(name);
        }
    }
}

} // namespace patcat
