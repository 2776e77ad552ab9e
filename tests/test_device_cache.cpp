#include <gtest/gtest.h>
#include <managers/device_cache.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <chrono>

namespace fs = std::filesystem;

class DeviceCacheTest : public ::testing::Test {
protected:
    fs::path test_dir;
    CacheSettings settings;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "hostmux_cache_test";
        fs::remove_all(test_dir);
        settings.dir = (test_dir / "devices").string();
        settings.expiry_secs = 86400;
        settings.max_size = 1000;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    // Write an entry by hand with an arbitrary timestamp and version.
    void write_entry(const DeviceTypeCache& cache, const std::string& target,
                     const std::string& type, int64_t timestamp,
                     const std::string& version = "1.0") {
        fs::create_directories(settings.dir);
        std::ofstream(cache.path_for(target))
            << "device_type: " << type << "\n"
            << "timestamp: " << timestamp << "\n"
            << "method: rule\n"
            << "version: \"" << version << "\"\n"
            << "target: \"" << target << "\"\n";
    }
};

TEST_F(DeviceCacheTest, SaveAndLoad) {
    DeviceTypeCache cache(settings);
    int64_t before = now_epoch();
    ASSERT_TRUE(cache.save("root@h", "linux", "ai").is_ok());

    auto entry = cache.load("root@h");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->device_type, "linux");
    EXPECT_EQ(entry->method, "ai");
    EXPECT_EQ(entry->version, CACHE_VERSION);
    EXPECT_EQ(entry->target, "root@h");
    EXPECT_GE(entry->timestamp, before);

    auto valid = cache.get_valid("root@h");
    ASSERT_TRUE(valid.is_ok());
    EXPECT_EQ(valid.value, "linux");
}

TEST_F(DeviceCacheTest, FileNamedByConnectionId) {
    DeviceTypeCache cache(settings);
    ASSERT_TRUE(cache.save("root@h", "linux").is_ok());
    std::string name = cache.path_for("root@h").filename().string();
    EXPECT_EQ(name.rfind("device-", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 6), ".cache");
    EXPECT_TRUE(fs::exists(cache.path_for("root@h")));
}

TEST_F(DeviceCacheTest, DefaultMethodIsManual) {
    DeviceTypeCache cache(settings);
    ASSERT_TRUE(cache.save("root@h", "linux").is_ok());
    EXPECT_EQ(cache.load("root@h")->method, "manual");
}

TEST_F(DeviceCacheTest, MissIsAbsent) {
    DeviceTypeCache cache(settings);
    EXPECT_FALSE(cache.load("nobody@h").has_value());
    EXPECT_TRUE(cache.is_expired("nobody@h"));
    EXPECT_EQ(cache.get_valid("nobody@h").kind, ErrorKind::CacheMiss);
}

TEST_F(DeviceCacheTest, ExpiryBoundary) {
    DeviceTypeCache cache(settings);
    write_entry(cache, "old@h", "linux", now_epoch() - 90000);
    write_entry(cache, "fresh@h", "linux", now_epoch() - 1000);

    EXPECT_TRUE(cache.is_expired("old@h"));
    EXPECT_EQ(cache.get_valid("old@h").kind, ErrorKind::CacheMiss);
    // Expired entries stay on disk until cleanup
    EXPECT_TRUE(fs::exists(cache.path_for("old@h")));

    EXPECT_FALSE(cache.is_expired("fresh@h"));
    EXPECT_TRUE(cache.get_valid("fresh@h").is_ok());
}

TEST_F(DeviceCacheTest, VersionMismatchIsDeleted) {
    DeviceTypeCache cache(settings);
    write_entry(cache, "root@h", "linux", now_epoch(), "0.9");

    EXPECT_FALSE(cache.load("root@h").has_value());
    EXPECT_FALSE(fs::exists(cache.path_for("root@h")));
}

TEST_F(DeviceCacheTest, MissingFieldIsDeleted) {
    DeviceTypeCache cache(settings);
    fs::create_directories(settings.dir);
    std::ofstream(cache.path_for("root@h")) << "device_type: linux\nversion: \"1.0\"\n";

    EXPECT_FALSE(cache.load("root@h").has_value());
    EXPECT_FALSE(fs::exists(cache.path_for("root@h")));
}

TEST_F(DeviceCacheTest, EmptyAndGarbageFilesAreDeleted) {
    DeviceTypeCache cache(settings);
    fs::create_directories(settings.dir);
    std::ofstream(cache.path_for("empty@h")) << "";
    std::ofstream(cache.path_for("junk@h")) << "{{{ not yaml";

    EXPECT_FALSE(cache.load("empty@h").has_value());
    EXPECT_FALSE(cache.load("junk@h").has_value());
    EXPECT_FALSE(fs::exists(cache.path_for("empty@h")));
    EXPECT_FALSE(fs::exists(cache.path_for("junk@h")));
}

TEST_F(DeviceCacheTest, NormalizesDeviceType) {
    EXPECT_EQ(DeviceTypeCache::normalize_device_type("  Linux \n"), "linux");
    EXPECT_EQ(DeviceTypeCache::normalize_device_type(""), "unknown");
    EXPECT_EQ(DeviceTypeCache::normalize_device_type("NULL"), "unknown");

    DeviceTypeCache cache(settings);
    ASSERT_TRUE(cache.save("root@h", "Cisco_IOS").is_ok());
    EXPECT_EQ(cache.get_valid("root@h").value, "cisco_ios");
}

TEST_F(DeviceCacheTest, RejectsInvalidDeviceType) {
    DeviceTypeCache cache(settings);
    EXPECT_EQ(cache.save("root@h", "linux; rm -rf /").kind, ErrorKind::InvalidDeviceType);
    EXPECT_EQ(cache.save("root@h", std::string(51, 'a')).kind, ErrorKind::InvalidDeviceType);
    EXPECT_TRUE(cache.save("root@h", std::string(50, 'a')).is_ok());
    EXPECT_TRUE(DeviceTypeCache::is_valid_device_type("junos-18.4_r1"));
    EXPECT_FALSE(DeviceTypeCache::is_valid_device_type("Linux"));
}

TEST_F(DeviceCacheTest, RejectsEmptyTarget) {
    DeviceTypeCache cache(settings);
    EXPECT_EQ(cache.save("", "linux").kind, ErrorKind::InvalidTargetFormat);
}

TEST_F(DeviceCacheTest, OverwriteReplacesEntry) {
    DeviceTypeCache cache(settings);
    ASSERT_TRUE(cache.save("root@h", "linux").is_ok());
    ASSERT_TRUE(cache.save("root@h", "freebsd").is_ok());
    EXPECT_EQ(cache.get_valid("root@h").value, "freebsd");
    EXPECT_EQ(cache.list_all().size(), 1u);
}

TEST_F(DeviceCacheTest, Clear) {
    DeviceTypeCache cache(settings);
    ASSERT_TRUE(cache.save("root@h", "linux").is_ok());
    EXPECT_TRUE(cache.clear("root@h").is_ok());
    EXPECT_FALSE(fs::exists(cache.path_for("root@h")));
    EXPECT_EQ(cache.clear("root@h").kind, ErrorKind::CacheMiss);
}

TEST_F(DeviceCacheTest, SizeCapEvictsOldestWithSlack) {
    settings.max_size = 20;
    DeviceTypeCache cache(settings);

    auto base = fs::file_time_type::clock::now() - std::chrono::hours(1);
    for (int i = 0; i < 25; i++) {
        std::string target = "user@host" + std::to_string(i);
        write_entry(cache, target, "linux", now_epoch());
        fs::last_write_time(cache.path_for(target), base + std::chrono::seconds(i));
    }

    int deleted = cache.manage_size();
    // 25 - 20 + 10 slack
    EXPECT_EQ(deleted, 15);
    EXPECT_EQ(cache.stats().total, 10);

    // The oldest went, the newest stayed
    EXPECT_FALSE(fs::exists(cache.path_for("user@host0")));
    EXPECT_FALSE(fs::exists(cache.path_for("user@host14")));
    EXPECT_TRUE(fs::exists(cache.path_for("user@host15")));
    EXPECT_TRUE(fs::exists(cache.path_for("user@host24")));
}

TEST_F(DeviceCacheTest, SizeCapIsNoopWithinLimit) {
    settings.max_size = 5;
    DeviceTypeCache cache(settings);
    for (int i = 0; i < 5; i++) {
        write_entry(cache, "u@h" + std::to_string(i), "linux", now_epoch());
    }
    EXPECT_EQ(cache.manage_size(), 0);
}

TEST_F(DeviceCacheTest, StatsPartition) {
    DeviceTypeCache cache(settings);
    write_entry(cache, "valid@h", "linux", now_epoch());
    write_entry(cache, "expired@h", "linux", now_epoch() - 90000);
    write_entry(cache, "foreign@h", "linux", now_epoch(), "2.0");
    std::ofstream(cache.path_for("junk@h")) << "";

    auto s = cache.stats();
    EXPECT_EQ(s.total, 4);
    EXPECT_EQ(s.valid, 1);
    EXPECT_EQ(s.expired, 1);
    EXPECT_EQ(s.invalid, 2);
    EXPECT_EQ(s.valid + s.expired + s.invalid, s.total);
    EXPECT_EQ(s.expiry_secs, 86400);
    EXPECT_EQ(s.cache_dir, settings.dir);
}

TEST_F(DeviceCacheTest, CleanupExpired) {
    DeviceTypeCache cache(settings);
    write_entry(cache, "valid@h", "linux", now_epoch());
    write_entry(cache, "expired@h", "linux", now_epoch() - 90000);
    std::ofstream(cache.path_for("junk@h")) << "";

    auto report = cache.cleanup_expired();
    EXPECT_EQ(report.total, 3);
    EXPECT_EQ(report.cleaned, 2);
    EXPECT_TRUE(fs::exists(cache.path_for("valid@h")));
    EXPECT_FALSE(fs::exists(cache.path_for("expired@h")));
}

TEST_F(DeviceCacheTest, ListAll) {
    DeviceTypeCache cache(settings);
    write_entry(cache, "b@h", "linux", now_epoch() - 60);
    write_entry(cache, "a@h:2222", "ios", now_epoch() - 90000);

    auto entries = cache.list_all();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].target, "a@h:2222");
    EXPECT_TRUE(entries[0].expired);
    EXPECT_EQ(entries[1].target, "b@h");
    EXPECT_FALSE(entries[1].expired);
    EXPECT_GE(entries[1].age_secs, 60);
}

TEST_F(DeviceCacheTest, Counters) {
    DeviceTypeCache cache(settings);
    ASSERT_TRUE(cache.save("root@h", "linux").is_ok());
    cache.get_valid("root@h");
    cache.get_valid("root@h");
    cache.get_valid("other@h");

    const auto& c = cache.counters();
    EXPECT_EQ(c.writes, 1u);
    EXPECT_EQ(c.hits, 2u);
    EXPECT_EQ(c.misses, 1u);
    EXPECT_EQ(c.hit_rate(), 66);
}

TEST_F(DeviceCacheTest, WarmReadsRecentFiles) {
    DeviceTypeCache cache(settings);
    EXPECT_EQ(cache.warm(), 0);
    for (int i = 0; i < 25; i++) {
        ASSERT_TRUE(cache.save("u@h" + std::to_string(i), "linux").is_ok());
    }
    EXPECT_EQ(cache.warm(), CACHE_WARM_MAX_FILES);
}
