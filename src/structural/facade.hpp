// File: src/structural/facade.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <string>

namespace patcat {

// Subsystems

class Lights {
public:
    explicit Lights(OutputSink& out) : out_(out) {}
    void Dim() { out_.WriteLine("Lights dimmed."); }

private:
    OutputSink& out_;
};

class Projector {
public:
    explicit Projector(OutputSink& out) : out_(out) {}
    void On() { out_.WriteLine("Projector on."); }

private:
    OutputSink& out_;
};

class SoundSystem {
public:
    explicit SoundSystem(OutputSink& out) : out_(out) {}
    void On() { out_.WriteLine("Sound system on."); }

private:
    OutputSink& out_;
};

/// Single entry point hiding the subsystem start-up sequence
class HomeTheaterFacade {
public:
    explicit HomeTheaterFacade(OutputSink& out);

    void WatchMovie(const std::string& title);

private:
    OutputSink& out_;
    Lights lights_;
    Projector projector_;
    SoundSystem sound_;
};

/// Watch the movie titled input.Text()
void RunFacadeDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
