// File: src/behavioral/template_method.cpp
#include "behavioral/template_method.hpp"

namespace patcat {

void DocumentMiner::Mine(OutputSink& out) const {
    OpenFile(out);
    ExtractData(out);
    ParseData(out);
    CloseFile(out);
}

void DocumentMiner::OpenFile(OutputSink& out) const {
    out.WriteLine("Opening " + FormatName() + " file.");
}

void DocumentMiner::ExtractData(OutputSink& out) const {
    out.WriteLine("Extracting " + FormatName() + " data.");
}

void DocumentMiner::CloseFile(OutputSink& out) const {
    out.WriteLine("Closing " + FormatName() + " file.");
}

void DocumentMiner::ParseData(OutputSink& out) const {
    out.WriteLine("Parsing data.");
}

std::unique_ptr<DocumentMiner> MakeDocumentMiner(const std::string& format) {
    if (format == "csv") return std::make_unique<CsvMiner>();
    if (format == "pdf") return std::make_unique<PdfMiner>();
    return nullptr;
}

void RunTemplateMethodDemo(const DemoInput& input, OutputSink& out) {
    auto miner = MakeDocumentMiner(input.Text());
    if (!miner) {
        out.WriteLine("Unsupported document format: " + input.Text());
        return;
    }
    miner->Mine(out);
}

} // namespace patcat
