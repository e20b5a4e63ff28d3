/**
 * Test runner: quakemigrate_tests [--list] [Suite | Suite.Name]
 */

#include "test_framework.hpp"
#include <cstring>
#include <iostream>
#include <string>

using namespace quakemigrate::test;

int main(int argc, char* argv[]) {
    std::string filter;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            std::cout << "Usage: " << argv[0] << " [--list] [Suite | Suite.Name]\n";
            return 0;
        }
        if (std::strcmp(argv[i], "-l") == 0 || std::strcmp(argv[i], "--list") == 0) {
            for (const auto& name : TestRegistry::instance().suiteNames()) {
                std::cout << name << "\n";
            }
            return 0;
        }
        if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            return 2;
        }
        filter = argv[i];
    }

    auto results = TestRegistry::instance().run(filter);
    return printSummary(results) == 0 ? 0 : 1;
}
