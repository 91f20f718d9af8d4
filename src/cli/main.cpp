// File: src/cli/main.cpp
//
// Entry point for the patcat command-line tool

#include "cli/catalog_cli.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        patcat::CatalogCli cli;
        return cli.Execute(args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return patcat::kExitFailure;
    }
}
