// File: src/creational/abstract_factory.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>

namespace patcat {

class Button {
public:
    virtual ~Button() = default;
    virtual std::string Render() const = 0;
};

class Checkbox {
public:
    virtual ~Checkbox() = default;
    virtual std::string Render() const = 0;
};

/// Abstract factory for a family of matching widgets
class WidgetFactory {
public:
    virtual ~WidgetFactory() = default;

    virtual std::unique_ptr<Button> CreateButton() const = 0;
    virtual std::unique_ptr<Checkbox> CreateCheckbox() const = 0;
};

class WindowsWidgetFactory : public WidgetFactory {
public:
    std::unique_ptr<Button> CreateButton() const override;
    std::unique_ptr<Checkbox> CreateCheckbox() const override;
};

class MacWidgetFactory : public WidgetFactory {
public:
    std::unique_ptr<Button> CreateButton() const override;
    std::unique_ptr<Checkbox> CreateCheckbox() const override;
};

/// Factory for "windows" or "mac"
/// @return nullptr for any other platform
std::unique_ptr<WidgetFactory> MakeWidgetFactory(const std::string& platform);

/// Render a button and a checkbox for platform input.Text()
void RunAbstractFactoryDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
