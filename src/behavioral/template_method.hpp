// File: src/behavioral/template_method.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>

namespace patcat {

/// Fixed open/extract/parse/close skeleton with format-specific steps
class DocumentMiner {
public:
    virtual ~DocumentMiner() = default;

    /// Template method: runs every step in order
    void Mine(OutputSink& out) const;

protected:
    /// Short format name used by the default steps ("CSV", "PDF")
    virtual std::string FormatName() const = 0;

    virtual void OpenFile(OutputSink& out) const;
    virtual void ExtractData(OutputSink& out) const;
    virtual void CloseFile(OutputSink& out) const;

    // Shared by every format
    void ParseData(OutputSink& out) const;
};

class CsvMiner : public DocumentMiner {
protected:
    std::string FormatName() const override { return "CSV"; }
};

class PdfMiner : public DocumentMiner {
protected:
    std::string FormatName() const override { return "PDF"; }
};

/// Create a miner for "csv" or "pdf"
/// @return nullptr for any other format
std::unique_ptr<DocumentMiner> MakeDocumentMiner(const std::string& format);

/// Mine a document of format input.Text()
void RunTemplateMethodDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
