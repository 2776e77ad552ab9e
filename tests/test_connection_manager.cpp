#include <gtest/gtest.h>
#include <managers/connection_manager.hpp>
#include <ssh/connection_id.hpp>
#include <core/constants.hpp>
#include "fake_ssh_client.hpp"
#include <thread>

using namespace testing_support;

class ConnectionManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    SshSettings settings;
    std::unique_ptr<ControlSocketStore> store;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<HealthChecker> health;
    std::unique_ptr<StaleConnectionSweeper> sweeper;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<ConnectionManager> manager;
    FakeSshClient client;

    void SetUp() override {
        test_dir = make_scratch_dir("mgr");
        settings.control_dir = test_dir.string();
        settings.max_connections = 3;

        EstablishPolicy policy;
        policy.max_attempts = 5;
        policy.interval_ms = 10;
        policy.settle_ms = 0;
        policy.reconnect_pause_ms = 0;

        store = std::make_unique<ControlSocketStore>(test_dir);
        registry = std::make_unique<ConnectionRegistry>(test_dir);
        health = std::make_unique<HealthChecker>(*store, client, 5, SOCKET_FRESHNESS_SECS);
        sweeper = std::make_unique<StaleConnectionSweeper>(*store, *registry, *health);
        pool = std::make_unique<ConnectionPool>(*registry, *store, client, *sweeper, 5);
        manager = std::make_unique<ConnectionManager>(settings, *store, client, *health,
                                                      *registry, *pool, policy);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConnectionManagerTest, EstablishRegisters) {
    auto r = manager->establish("admin@192.0.2.10:2200");
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_TRUE(store->exists("admin@192.0.2.10:2200"));
    EXPECT_EQ(client.start_calls, 1);
    auto target = registry->lookup_target(connection_id("admin@192.0.2.10:2200"));
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, "admin@192.0.2.10:2200");
}

TEST_F(ConnectionManagerTest, EstablishIsIdempotent) {
    ASSERT_TRUE(manager->establish("root@h").is_ok());
    ASSERT_TRUE(manager->establish("root@h").is_ok());

    EXPECT_EQ(client.start_calls, 1);
    EXPECT_EQ(registry->size(), 1u);
    EXPECT_EQ(store->list().size(), 1u);
}

TEST_F(ConnectionManagerTest, EstablishRejectsBadTarget) {
    auto r = manager->establish("bad-target");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidTargetFormat);
    EXPECT_EQ(client.start_calls, 0);
    EXPECT_TRUE(store->list().empty());
}

TEST_F(ConnectionManagerTest, EstablishReplacesDeadSocket) {
    ASSERT_TRUE(make_dead_socket(store->path_for("root@h").string()));

    auto r = manager->establish("root@h");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(client.start_calls, 1);
    EXPECT_TRUE(client.is_live(store->path_for("root@h").string()));
}

TEST_F(ConnectionManagerTest, EstablishTimesOut) {
    client.never_binds = true;

    auto r = manager->establish("root@unreachable");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionTimeout);
    EXPECT_EQ(registry->size(), 0u);
    // Nothing bound, so only the launcher is reaped
    EXPECT_EQ(client.exit_calls, 0);
    EXPECT_EQ(client.terminate_calls, 1);
}

TEST_F(ConnectionManagerTest, EstablishFailsWhenMasterExits) {
    client.master_exit_code = 255;

    auto r = manager->establish("root@refused");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionFailed);
}

TEST_F(ConnectionManagerTest, EstablishFailsWhenSpawnFails) {
    client.fail_spawn = true;

    auto r = manager->establish("root@h");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionFailed);
}

TEST_F(ConnectionManagerTest, EstablishEnforcesCapacity) {
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(manager->establish("user@host" + std::to_string(i)).is_ok());
    }
    EXPECT_LE(registry->size(), 3u);
    EXPECT_LE(store->list().size(), 3u);
    // Most recent connection always survives
    EXPECT_TRUE(store->exists("user@host4"));
}

TEST_F(ConnectionManagerTest, CancelAbortsWait) {
    client.never_binds = true;
    EstablishPolicy slow;
    slow.max_attempts = 1000;
    slow.interval_ms = 50;
    ConnectionManager slow_manager(settings, *store, client, *health, *registry, *pool, slow);

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        slow_manager.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = slow_manager.establish("root@slow");
    canceller.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_EQ(client.terminate_calls, 1);
}

TEST_F(ConnectionManagerTest, RegistryFailureShutsMasterDown) {
    // A directory where the lock file belongs makes every registry write fail
    fs::create_directories(test_dir / REGISTRY_LOCK_FILE);
    std::string socket = store->path_for("root@h").string();

    auto r = manager->establish("root@h");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RegistryIOError);
    EXPECT_EQ(client.exit_calls, 1);
    EXPECT_EQ(client.terminate_calls, 1);
    EXPECT_FALSE(client.is_live(socket));
    EXPECT_FALSE(store->exists("root@h"));
}

TEST_F(ConnectionManagerTest, TimeoutShutsBoundButUnhealthyMasterDown) {
    // Socket appears but -O check never answers
    client.check_fails = true;
    std::string socket = store->path_for("root@h").string();

    auto r = manager->establish("root@h");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionTimeout);
    EXPECT_EQ(client.exit_calls, 1);
    EXPECT_EQ(client.terminate_calls, 1);
    EXPECT_FALSE(client.is_live(socket));
    EXPECT_FALSE(store->exists("root@h"));
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(ConnectionManagerTest, CloseGraceful) {
    ASSERT_TRUE(manager->establish("root@h").is_ok());

    auto r = manager->close("root@h");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, CloseOutcome::Graceful);
    EXPECT_FALSE(store->exists("root@h"));
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(ConnectionManagerTest, CloseForcedWhenMasterDead) {
    ASSERT_TRUE(manager->establish("root@h").is_ok());
    client.kill_master(store->path_for("root@h").string());

    auto r = manager->close("root@h");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, CloseOutcome::Forced);
    EXPECT_FALSE(store->exists("root@h"));
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(ConnectionManagerTest, CloseWithoutSocket) {
    auto r = manager->close("root@h");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionNotFound);
}

TEST_F(ConnectionManagerTest, ReconnectStartsFreshMaster) {
    ASSERT_TRUE(manager->establish("root@h").is_ok());
    ASSERT_TRUE(manager->reconnect("root@h").is_ok());

    EXPECT_EQ(client.start_calls, 2);
    EXPECT_EQ(client.exit_calls, 1);
    EXPECT_TRUE(store->exists("root@h"));
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(ConnectionManagerTest, ReconnectWithoutExistingConnection) {
    ASSERT_TRUE(manager->reconnect("root@h").is_ok());
    EXPECT_EQ(client.exit_calls, 0);
    EXPECT_TRUE(store->exists("root@h"));
}

TEST_F(ConnectionManagerTest, ExecuteReturnsRemoteResult) {
    ASSERT_TRUE(manager->establish("root@h").is_ok());
    client.exec_result = {3, "out\n", "err\n"};

    auto r = manager->execute("root@h", "uname -a");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_code, 3);
    EXPECT_EQ(r.value.stdout_data, "out\n");
    EXPECT_EQ(r.value.stderr_data, "err\n");
    ASSERT_EQ(client.exec_commands.size(), 1u);
    EXPECT_EQ(client.exec_commands[0], "uname -a");
}

TEST_F(ConnectionManagerTest, ExecuteWithoutConnection) {
    auto r = manager->execute("root@h", "true");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionNotFound);
    EXPECT_TRUE(client.exec_commands.empty());
}

TEST_F(ConnectionManagerTest, ExecuteOnDeadMaster) {
    ASSERT_TRUE(manager->establish("root@h").is_ok());
    client.kill_master(store->path_for("root@h").string());

    auto r = manager->execute("root@h", "true");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionUnhealthy);
    EXPECT_TRUE(client.exec_commands.empty());
}
