#include <gtest/gtest.h>

#include <memory>

#include "cube_entrypoint/bootstrap/sequencer.hpp"
#include "cube_entrypoint/common/constants.hpp"
#include "fake_host.hpp"
#include "log_capture.hpp"

namespace cube_entrypoint {
namespace {

using bootstrap::BootstrapSequencer;
using common::BootstrapState;
using common::HandoffKind;
using test_support::FakeHost;
using test_support::LogCapture;
using test_support::TempDir;
using test_support::readFile;

class BootstrapSequencerTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = std::make_unique<TempDir>("seq_home");
        workdir_ = std::make_unique<TempDir>("seq_workdir");
        env_root_ = std::make_unique<TempDir>("seq_env");
        data_dir_ = std::make_unique<TempDir>("seq_pg");
        env_root_->touch("bin/activate");

        config_ = common::Config::createDefaultConfig();
        config_.environment.root = env_root_->str();
        config_.database.data_dir = data_dir_->str();
        config_.database.bin_dir = "/opt/pg/bin";

        host_.addAccount("postgres", 101, 102, "/var/lib/postgresql");
        host_.addAccount("runner", 1000, 1000, home_->str());
        host_.fail("python");
        host_.respond("gdal-config", "/usr/share/gdal\n");
        host_.hooks["usermod"] = [this](const system::CommandSpec& spec) {
            auto& account = host_.accounts["runner"];
            account.uid = static_cast<uid_t>(std::stoul(spec.argv[2]));
            account.gid = static_cast<gid_t>(std::stoul(spec.argv[4]));
        };

        ctx_.cwd = workdir_->str();
        ctx_.self_exe = "/usr/local/bin/cube-entrypoint";
        ctx_.argv = {"/usr/local/bin/cube-entrypoint", "pytest", "-k", "foo"};
        ctx_.env = {{"HOME", home_->str()}, {"PATH", "/usr/bin"}};
    }

    void elevate(uid_t cwd_uid, gid_t cwd_gid) {
        ctx_.uid = 0;
        ctx_.gid = 0;
        ctx_.cwd_owner = {cwd_uid, cwd_gid};
        ctx_.env["HOME"] = "/root";
    }

    void dropTo(uid_t uid, gid_t gid) {
        ctx_.uid = uid;
        ctx_.gid = gid;
        ctx_.cwd_owner = {uid, gid};
    }

    std::filesystem::path integrationConfig() const {
        return home_->path() / ".datacube_integration.conf";
    }

    FakeHost host_;
    common::BootstrapConfig config_;
    common::ExecutionContext ctx_;
    std::unique_ptr<TempDir> home_;
    std::unique_ptr<TempDir> workdir_;
    std::unique_ptr<TempDir> env_root_;
    std::unique_ptr<TempDir> data_dir_;
};

TEST_F(BootstrapSequencerTest, UnprivilegedSkipsDatabaseAndIdentity) {
    dropTo(1000, 1000);
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest", "-k", "foo"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.state, BootstrapState::RUNNING_AS_USER);
    EXPECT_FALSE(outcome.database_attempted);
    EXPECT_FALSE(outcome.reconciler_entered);
    EXPECT_EQ(host_.countCalls("initdb"), 0u);
    EXPECT_EQ(host_.countCalls("pg_ctl"), 0u);
    EXPECT_EQ(host_.countCalls("usermod"), 0u);
    EXPECT_TRUE(std::filesystem::exists(integrationConfig()));
}

TEST_F(BootstrapSequencerTest, CommandIsPassedThroughWithActivatedEnvironment) {
    dropTo(1000, 1000);
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest", "-k", "foo"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXEC_COMMAND);
    EXPECT_EQ(outcome.handoff.program, "pytest");
    EXPECT_EQ(outcome.handoff.argv, (std::vector<std::string>{"pytest", "-k", "foo"}));
    EXPECT_EQ(outcome.handoff.env.at("VIRTUAL_ENV"), env_root_->str());
    EXPECT_EQ(outcome.handoff.env.at("GDAL_DATA"), "/usr/share/gdal");
}

TEST_F(BootstrapSequencerTest, EmptyCommandExitsAfterSetup) {
    dropTo(1000, 1000);
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXIT);
    EXPECT_TRUE(std::filesystem::exists(integrationConfig()));
}

TEST_F(BootstrapSequencerTest, RootOwnedDirectoryStaysRoot) {
    elevate(0, 0);
    ctx_.env["HOME"] = home_->str();
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.state, BootstrapState::RUNNING_AS_ROOT);
    EXPECT_TRUE(outcome.database_attempted);
    EXPECT_TRUE(outcome.reconciler_entered);
    EXPECT_EQ(host_.countCalls("groupmod"), 0u);
    EXPECT_EQ(host_.countCalls("usermod"), 0u);
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXEC_COMMAND);
    EXPECT_TRUE(std::filesystem::exists(integrationConfig()));
}

TEST_F(BootstrapSequencerTest, ElevatedEntryRemapsAndReexecsWithoutWritingConfig) {
    elevate(1234, 1234);
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest", "-k", "foo"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.state, BootstrapState::REEXEC);
    EXPECT_TRUE(outcome.database_attempted);
    EXPECT_EQ(host_.countCalls("pg_ctl"), 1u);
    EXPECT_EQ(host_.countCalls("usermod"), 1u);

    EXPECT_EQ(outcome.handoff.kind, HandoffKind::REEXEC);
    EXPECT_EQ(outcome.handoff.program, ctx_.self_exe);
    EXPECT_EQ(outcome.handoff.argv, ctx_.argv);
    EXPECT_EQ(outcome.handoff.env.at("HOME"), home_->str());
    EXPECT_FALSE(std::filesystem::exists(integrationConfig()));
    EXPECT_EQ(host_.countCalls("pip"), 0u);
}

TEST_F(BootstrapSequencerTest, ReexecChainEndsRunningAsUser) {
    elevate(1234, 1234);
    BootstrapSequencer first(config_, host_);
    auto entry = first.run(ctx_, {"pytest", "-k", "foo"});
    ASSERT_EQ(entry.state, BootstrapState::REEXEC);

    // the re-executed process inherits the handoff's argv, env and identity
    common::ExecutionContext child = ctx_;
    child.uid = entry.handoff.account->uid;
    child.gid = entry.handoff.account->gid;
    child.argv = entry.handoff.argv;
    child.env = entry.handoff.env;

    host_.calls.clear();
    BootstrapSequencer second(config_, host_);
    auto outcome = second.run(child, {"pytest", "-k", "foo"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.state, BootstrapState::RUNNING_AS_USER);
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXEC_COMMAND);
    EXPECT_EQ(outcome.handoff.argv, (std::vector<std::string>{"pytest", "-k", "foo"}));
    EXPECT_EQ(host_.countCalls("pg_ctl"), 0u);
    EXPECT_EQ(host_.countCalls("usermod"), 0u);
    EXPECT_NE(readFile(integrationConfig()).find("[no_such_driver_env]"), std::string::npos);
}

TEST_F(BootstrapSequencerTest, SkipDbBypassesDatabase) {
    config_.database.skip = true;
    elevate(1000, 1000);
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_FALSE(outcome.database_attempted);
    EXPECT_TRUE(outcome.reconciler_entered);
    EXPECT_EQ(host_.countCalls("initdb"), 0u);
    EXPECT_EQ(host_.countCalls("pg_ctl"), 0u);
    EXPECT_EQ(host_.countCalls("createuser"), 0u);
}

TEST_F(BootstrapSequencerTest, DatabaseFailureDoesNotAbort) {
    host_.fail("initdb");
    host_.fail("pg_ctl");
    elevate(1000, 1000);
    BootstrapSequencer sequencer(config_, host_);

    LogCapture log;
    auto outcome = sequencer.run(ctx_, {"pytest"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_TRUE(outcome.database_attempted);
    EXPECT_EQ(outcome.state, BootstrapState::REEXEC);
    EXPECT_EQ(log.warnings(constants::messages::DB_LAUNCH_WARNING), 1u);
    ASSERT_EQ(outcome.tolerated.size(), 1u);
    EXPECT_EQ(outcome.tolerated.front().code, core::BootstrapErrorCode::DB_INIT_FAILED);
}

TEST_F(BootstrapSequencerTest, RootOwnedDirectoryWarnsOnce) {
    config_.database.skip = true;
    elevate(0, 0);
    ctx_.env["HOME"] = home_->str();
    BootstrapSequencer sequencer(config_, host_);

    LogCapture log;
    auto outcome = sequencer.run(ctx_, {"pytest"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(log.warnings(constants::messages::ROOT_WARNING), 1u);
    EXPECT_EQ(log.count("[warning]"), 1u);
}

TEST_F(BootstrapSequencerTest, TakenGroupIdStillReexecs) {
    host_.fail("groupmod");
    elevate(501, 20);
    BootstrapSequencer sequencer(config_, host_);

    LogCapture log;
    auto outcome = sequencer.run(ctx_, {"pytest"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.state, BootstrapState::REEXEC);
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::REEXEC);
    EXPECT_EQ(host_.countCalls("usermod"), 1u);
    EXPECT_EQ(outcome.handoff.account->gid, 20u);
    EXPECT_EQ(log.count("stage=identity.remap"), 1u);
}

TEST_F(BootstrapSequencerTest, InstallFailureStillExecsCommand) {
    dropTo(1000, 1000);
    workdir_->touch("setup.py");
    host_.fail("pip");
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest", "-k", "foo"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXEC_COMMAND);
    EXPECT_EQ(outcome.handoff.argv, (std::vector<std::string>{"pytest", "-k", "foo"}));
    EXPECT_EQ(outcome.handoff.env.at("GDAL_DATA"), "/usr/share/gdal");
    ASSERT_EQ(outcome.tolerated.size(), 1u);
    EXPECT_EQ(outcome.tolerated.front().code, core::BootstrapErrorCode::DEPENDENCY_INSTALL_FAILED);
}

TEST_F(BootstrapSequencerTest, UnwritableHomeStillExecsCommand) {
    dropTo(1000, 1000);
    ctx_.env["HOME"] = "/nonexistent/home/runner";
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest"});
    ASSERT_FALSE(outcome.failed());
    EXPECT_EQ(outcome.state, BootstrapState::RUNNING_AS_USER);
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXEC_COMMAND);
    ASSERT_EQ(outcome.tolerated.size(), 1u);
    EXPECT_EQ(outcome.tolerated.front().code, core::BootstrapErrorCode::CONFIG_ARTIFACT_WRITE_FAILED);
}

TEST_F(BootstrapSequencerTest, MissingRunnerAccountFails) {
    host_.accounts.erase("runner");
    elevate(1234, 1234);
    BootstrapSequencer sequencer(config_, host_);

    auto outcome = sequencer.run(ctx_, {"pytest"});
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.result.code, core::BootstrapErrorCode::ACCOUNT_NOT_FOUND);
    EXPECT_EQ(outcome.handoff.kind, HandoffKind::EXIT);
    EXPECT_EQ(host_.countCalls("usermod"), 0u);
}

} // namespace
} // namespace cube_entrypoint
