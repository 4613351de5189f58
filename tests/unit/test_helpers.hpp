#pragma once

#include <codeatlas/config.hpp>
#include <codeatlas/extractor.hpp>
#include <codeatlas/resolver.hpp>

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace codeatlas::test {

namespace fs = std::filesystem;

// Fixture owning a scratch directory removed after each test
class TempDirTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                ("codeatlas_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                 std::to_string(::getpid()));
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path write_file(const std::string &rel_path, const std::string &content) {
        fs::path path = root_ / rel_path;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

// Extract in-memory sources in the given order
inline AnalysisBatch make_batch(const std::vector<std::pair<std::string, std::string>> &sources,
                                const Config &config = {}) {
    EntityExtractor extractor(config.extraction, config.complexity);
    AnalysisBatch batch;
    for (const auto &[path, content] : sources) {
        batch.push_back(extractor.extract(path, content));
    }
    return batch;
}

} // namespace codeatlas::test
