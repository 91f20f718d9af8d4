// File: src/structural/proxy.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <utility>

namespace patcat {

class Image {
public:
    virtual ~Image() = default;
    virtual void Display() = 0;
};

/// Expensive subject: loads its file on construction
class RealImage : public Image {
public:
    RealImage(std::string filename, OutputSink& out);

    void Display() override;

private:
    std::string filename_;
    OutputSink& out_;
};

/// Virtual proxy: defers loading until the first Display()
class ImageProxy : public Image {
public:
    ImageProxy(std::string filename, OutputSink& out)
        : filename_(std::move(filename)), out_(out) {}

    void Display() override;

    bool IsLoaded() const { return real_ != nullptr; }

private:
    std::string filename_;
    OutputSink& out_;
    std::unique_ptr<RealImage> real_;
};

/// Display each file in input.Values(); a file is loaded only once
void RunProxyDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
