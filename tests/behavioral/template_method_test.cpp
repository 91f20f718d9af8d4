// File: tests/behavioral/template_method_test.cpp
#include "behavioral/template_method.hpp"
#include <gtest/gtest.h>

namespace patcat {
namespace {

Trace RunDemo(const std::string& format) {
    TraceSink sink;
    RunTemplateMethodDemo(DemoInput{format}, sink);
    return sink.GetTrace();
}

TEST(TemplateMethodDemoTest, CsvSkeleton) {
    Trace expected = {
        "Opening CSV file.",
        "Extracting CSV data.",
        "Parsing data.",
        "Closing CSV file.",
    };
    EXPECT_EQ(expected, RunDemo("csv"));
}

TEST(TemplateMethodDemoTest, PdfSharesParseStep) {
    Trace expected = {
        "Opening PDF file.",
        "Extracting PDF data.",
        "Parsing data.",
        "Closing PDF file.",
    };
    EXPECT_EQ(expected, RunDemo("pdf"));
}

TEST(TemplateMethodDemoTest, UnsupportedFormat) {
    EXPECT_EQ(Trace{"Unsupported document format: docx"}, RunDemo("docx"));
}

TEST(DocumentMinerTest, FactoryRejectsUnknownFormat) {
    EXPECT_NE(nullptr, MakeDocumentMiner("csv"));
    EXPECT_EQ(nullptr, MakeDocumentMiner("CSV"));
}

} // namespace
} // namespace patcat
