#include <gtest/gtest.h>

#include "cube_entrypoint/bootstrap/environment.hpp"
#include "cube_entrypoint/common/config.hpp"
#include "fake_host.hpp"

namespace cube_entrypoint {
namespace {

using bootstrap::EnvironmentActivator;
using core::BootstrapErrorCode;
using test_support::FakeHost;
using test_support::TempDir;

class EnvironmentActivatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_root_ = std::make_unique<TempDir>("env_root");
        workdir_ = std::make_unique<TempDir>("env_workdir");
        env_root_->touch("bin/activate");

        config_ = common::Config::createDefaultConfig().environment;
        config_.root = env_root_->str();

        base_env_ = {
            {"PATH", "/usr/local/bin:/usr/bin"},
            {"PYTHONHOME", "/usr"},
            {"HOME", "/home/runner"},
        };

        // rasterio is not importable unless a test says otherwise
        host_.fail("python");
        host_.fail("gdal-config");
    }

    std::string bin(const std::string& tool) const {
        return (env_root_->path() / "bin" / tool).string();
    }

    FakeHost host_;
    common::EnvironmentConfig config_;
    common::Environment base_env_;
    std::unique_ptr<TempDir> env_root_;
    std::unique_ptr<TempDir> workdir_;
};

TEST_F(EnvironmentActivatorTest, NoMarkerLeavesEnvironmentAlone) {
    TempDir empty_root("env_empty");
    config_.root = empty_root.str();
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    EXPECT_TRUE(activation.result.ok());
    EXPECT_FALSE(activation.activated);
    EXPECT_EQ(activation.env, base_env_);
    EXPECT_TRUE(host_.calls.empty());
}

TEST_F(EnvironmentActivatorTest, AlreadyActiveSkipsInstallAndGdal) {
    workdir_->touch("setup.py");
    base_env_["VIRTUAL_ENV"] = "/elsewhere";
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    EXPECT_TRUE(activation.result.ok());
    EXPECT_FALSE(activation.activated);
    EXPECT_EQ(activation.env.at("VIRTUAL_ENV"), "/elsewhere");
    EXPECT_EQ(activation.env.count("GDAL_DATA"), 0u);
    EXPECT_TRUE(host_.calls.empty());
}

TEST_F(EnvironmentActivatorTest, FreshActivationRewritesEnvironment) {
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    ASSERT_TRUE(activation.result.ok());
    EXPECT_TRUE(activation.activated);
    EXPECT_EQ(activation.env.at("VIRTUAL_ENV"), env_root_->str());
    EXPECT_EQ(activation.env.at("PATH"), (env_root_->path() / "bin").string() + ":/usr/local/bin:/usr/bin");
    EXPECT_EQ(activation.env.count("PYTHONHOME"), 0u);
    EXPECT_EQ(host_.countCalls("pip"), 0u);
}

TEST_F(EnvironmentActivatorTest, InstallsManifestWithExtrasAndDriver) {
    workdir_->touch("setup.py");
    workdir_->touch("tests/drivers/fail_drivers/setup.py");
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    ASSERT_TRUE(activation.result.ok());

    auto installs = host_.callsTo("pip");
    ASSERT_EQ(installs.size(), 2u);
    EXPECT_EQ(installs[0].argv, (std::vector<std::string>{
        bin("pip"), "install", "-e", ".[test,cf,celery,s3,performance,distributed]"}));
    EXPECT_EQ(installs[1].argv, (std::vector<std::string>{
        bin("pip"), "install", "-e", "tests/drivers/fail_drivers"}));
    ASSERT_TRUE(installs[0].env.has_value());
    EXPECT_EQ(installs[0].env->at("VIRTUAL_ENV"), env_root_->str());
}

TEST_F(EnvironmentActivatorTest, InstallFailureStillResolvesGdalData) {
    workdir_->touch("setup.py");
    workdir_->touch("tests/drivers/fail_drivers/setup.py");
    host_.fail("pip");
    host_.respond("gdal-config", "/usr/share/gdal\n");
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    EXPECT_EQ(activation.result.code, BootstrapErrorCode::DEPENDENCY_INSTALL_FAILED);
    EXPECT_TRUE(activation.activated);
    EXPECT_EQ(host_.countCalls("pip"), 2u);
    EXPECT_EQ(host_.countCalls("python"), 1u);
    EXPECT_EQ(activation.env.at("VIRTUAL_ENV"), env_root_->str());
    EXPECT_EQ(activation.env.at("GDAL_DATA"), "/usr/share/gdal");
}

TEST_F(EnvironmentActivatorTest, EditableTargetFormatting) {
    EXPECT_EQ(EnvironmentActivator::editableTarget({}), ".");
    EXPECT_EQ(EnvironmentActivator::editableTarget({"test"}), ".[test]");
    EXPECT_EQ(EnvironmentActivator::editableTarget({"test", "s3"}), ".[test,s3]");
}

TEST_F(EnvironmentActivatorTest, PresetGdalDataIsPreserved) {
    base_env_["GDAL_DATA"] = "/preset/gdal";
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    ASSERT_TRUE(activation.result.ok());
    EXPECT_EQ(activation.env.at("GDAL_DATA"), "/preset/gdal");
    EXPECT_EQ(host_.countCalls("python"), 0u);
    EXPECT_EQ(host_.countCalls("gdal-config"), 0u);
}

TEST_F(EnvironmentActivatorTest, RasterioBundledDataWins) {
    TempDir site("env_site");
    site.mkdir("rasterio/gdal_data");
    host_.respond("python", (site.path() / "rasterio").string() + "\n");
    host_.respond("gdal-config", "/usr/share/gdal\n");
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    ASSERT_TRUE(activation.result.ok());
    EXPECT_EQ(activation.env.at("GDAL_DATA"), (site.path() / "rasterio" / "gdal_data").string());
    EXPECT_EQ(host_.countCalls("gdal-config"), 0u);

    auto probe = host_.callsTo("python").front();
    EXPECT_EQ(probe.argv.front(), bin("python"));
    EXPECT_TRUE(probe.capture_output);
}

TEST_F(EnvironmentActivatorTest, FallsBackToGdalConfig) {
    TempDir site("env_site_nodata");
    site.mkdir("rasterio");
    host_.respond("python", (site.path() / "rasterio").string() + "\n");
    host_.respond("gdal-config", "/usr/share/gdal\n");
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    ASSERT_TRUE(activation.result.ok());
    EXPECT_EQ(activation.env.at("GDAL_DATA"), "/usr/share/gdal");
    EXPECT_EQ(host_.callsTo("gdal-config").front().argv,
              (std::vector<std::string>{"gdal-config", "--datadir"}));
}

TEST_F(EnvironmentActivatorTest, UnresolvedGdalDataStaysUnset) {
    EnvironmentActivator activator(host_);

    auto activation = activator.activate(config_, base_env_, workdir_->str());
    ASSERT_TRUE(activation.result.ok());
    EXPECT_FALSE(activation.gdal_data.has_value());
    EXPECT_EQ(activation.env.count("GDAL_DATA"), 0u);
}

} // namespace
} // namespace cube_entrypoint
