#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "browser_app.h"

namespace fs = std::filesystem;

// Runs each test from a scratch working directory.
class ResourceLookupTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/minifin-lookup-XXXXXX";
        char *dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        root_ = fs::canonical(dir);
        previous_ = fs::current_path();
        fs::current_path(root_);
        suffix_ = "minifin-resources-" + std::to_string(getpid());
    }

    void TearDown() override {
        std::error_code ec;
        fs::current_path(previous_, ec);
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    fs::path previous_;
    std::string suffix_;
    BrowserApp app_{nullptr};
};

TEST_F(ResourceLookupTest, FindsDirectoryHoldingMarker) {
    fs::create_directories(root_ / suffix_);
    std::ofstream(root_ / suffix_ / "icudtl.dat") << "x";
    EXPECT_EQ(app_.find_existing_path(suffix_.c_str(), "icudtl.dat"), (root_ / suffix_).string());
}

TEST_F(ResourceLookupTest, MissingMarkerIsNoMatch) {
    fs::create_directories(root_ / suffix_);
    std::ofstream(root_ / suffix_ / "other.pak") << "x";
    EXPECT_EQ(app_.find_existing_path(suffix_.c_str(), "icudtl.dat"), "");
}

TEST_F(ResourceLookupTest, EmptyDirectoryIsNoMatchWithoutMarker) {
    fs::create_directories(root_ / suffix_);
    EXPECT_EQ(app_.find_existing_path(suffix_.c_str(), nullptr), "");

    std::ofstream(root_ / suffix_ / "en-US.pak") << "x";
    EXPECT_EQ(app_.find_existing_path(suffix_.c_str(), nullptr), (root_ / suffix_).string());
}
