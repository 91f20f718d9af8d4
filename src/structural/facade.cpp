// File: src/structural/facade.cpp
#include "structural/facade.hpp"

namespace patcat {

HomeTheaterFacade::HomeTheaterFacade(OutputSink& out)
    : out_(out), lights_(out), projector_(out), sound_(out) {}

void HomeTheaterFacade::WatchMovie(const std::string& title) {
    lights_.Dim();
    projector_.On();
    sound_.On();
    out_.WriteLine("Playing movie: " + title);
}

void RunFacadeDemo(const DemoInput& input, OutputSink& out) {
    HomeTheaterFacade theater(out);
    theater.WatchMovie(input.Text());
}

} // namespace patcat
