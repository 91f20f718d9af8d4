// File: src/structural/proxy.cpp
#include "structural/proxy.hpp"
#include <map>

namespace patcat {

RealImage::RealImage(std::string filename, OutputSink& out)
    : filename_(std::move(filename)), out_(out) {
    out_.WriteLine("Loading image: " + filename_);
}

void RealImage::Display() {
    out_.WriteLine("Displaying " + filename_);
}

void ImageProxy::Display() {
    if (!real_) {
        real_ = std::make_unique<RealImage>(filename_, out_);
    }
    real_->Display();
}

void RunProxyDemo(const DemoInput& input, OutputSink& out) {
    std::map<std::string, std::unique_ptr<ImageProxy>> gallery;

    for (const auto& filename : input.Values()) {
        auto it = gallery.find(filename);
        if (it == gallery.end()) {
            it = gallery.emplace(filename, std::make_unique<ImageProxy>(filename, out)).first;
        }
        it->second->Display();
    }
}

} // namespace patcat
