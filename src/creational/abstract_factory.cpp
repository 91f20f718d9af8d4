// File: src/creational/abstract_factory.cpp
#include "creational/abstract_factory.hpp"
#include <utility>

namespace patcat {

namespace {

class PlatformButton : public Button {
public:
    explicit PlatformButton(std::string platform) : platform_(std::move(platform)) {}
    std::string Render() const override { return "Rendering " + platform_ + " button."; }

private:
    std::string platform_;
};

class PlatformCheckbox : public Checkbox {
public:
    explicit PlatformCheckbox(std::string platform) : platform_(std::move(platform)) {}
    std::string Render() const override { return "Rendering " + platform_ + " checkbox."; }

private:
    std::string platform_;
};

} // namespace

std::unique_ptr<Button> WindowsWidgetFactory::CreateButton() const {
    return std::make_unique<PlatformButton>("Windows");
}

std::unique_ptr<Checkbox> WindowsWidgetFactory::CreateCheckbox() const {
    return std::make_unique<PlatformCheckbox>("Windows");
}

std::unique_ptr<Button> MacWidgetFactory::CreateButton() const {
    return std::make_unique<PlatformButton>("Mac");
}

std::unique_ptr<Checkbox> MacWidgetFactory::CreateCheckbox() const {
    return std::make_unique<PlatformCheckbox>("Mac");
}

std::unique_ptr<WidgetFactory> MakeWidgetFactory(const std::string& platform) {
    if (platform == "windows") return std::make_unique<WindowsWidgetFactory>();
    if (platform == "mac") return std::make_unique<MacWidgetFactory>();
    return nullptr;
}

void RunAbstractFactoryDemo(const DemoInput& input, OutputSink& out) {
    auto factory = MakeWidgetFactory(input.Text());
    if (!factory) {
        out.WriteLine("Unknown platform: " + input.Text());
        return;
    }
    out.WriteLine(factory->CreateButton()->Render());
    out.WriteLine(factory->CreateCheckbox()->Render());
}

} // namespace patcat
