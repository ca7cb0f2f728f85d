#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include <stdlib.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        std::string tmpl = (fs::temp_directory_path() / "dredge-tests-XXXXXX").string();
        if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
        const fs::path scratch(tmpl);

        setenv("XDG_DATA_HOME", scratch.c_str(), 1);
        dredge::config::ConfigRegistry::init(scratch / "config.yaml");
        dredge::log::Registry::init(scratch / "logs");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize dredge test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
