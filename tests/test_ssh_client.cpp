#include <gtest/gtest.h>
#include <ssh/ssh_client.hpp>
#include <ssh/target.hpp>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <chrono>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

// OpenSshClient pointed at a script that records its argv, one per line.
class OpenSshClientTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path argv_log;
    fs::path fake_ssh;
    SshTarget target;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("hmx_sshc_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        argv_log = test_dir / "argv";
        fake_ssh = test_dir / "ssh";

        std::ofstream(fake_ssh) << "#!/bin/sh\n"
                                << "for a in \"$@\"; do echo \"$a\" >> " << argv_log.string()
                                << "; done\n"
                                << "echo fake-out\n"
                                << "exit 0\n";
        fs::permissions(fake_ssh, fs::perms::owner_all);

        auto parsed = parse_target("admin@router.lan:2200");
        ASSERT_TRUE(parsed.is_ok());
        target = parsed.value;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::vector<std::string> recorded() const {
        std::vector<std::string> args;
        std::ifstream in(argv_log);
        std::string line;
        while (std::getline(in, line)) args.push_back(line);
        return args;
    }

    static bool has(const std::vector<std::string>& args, const std::string& v) {
        return std::find(args.begin(), args.end(), v) != args.end();
    }

    // True when `flag` is immediately followed by `value`.
    static bool has_pair(const std::vector<std::string>& args, const std::string& flag,
                         const std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); i++) {
            if (args[i] == flag && args[i + 1] == value) return true;
        }
        return false;
    }
};

TEST_F(OpenSshClientTest, CheckArguments) {
    OpenSshClient client(fake_ssh.string());
    auto r = client.check("/tmp/ctl/ssh-abc", target, 7);
    EXPECT_EQ(r.exit_code, 0);

    auto args = recorded();
    EXPECT_TRUE(has_pair(args, "-O", "check"));
    EXPECT_TRUE(has_pair(args, "-o", "ControlPath=/tmp/ctl/ssh-abc"));
    EXPECT_TRUE(has_pair(args, "-o", "ConnectTimeout=7"));
    EXPECT_TRUE(has_pair(args, "-p", "2200"));
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.back(), "admin@router.lan");
}

TEST_F(OpenSshClientTest, ExitArguments) {
    OpenSshClient client(fake_ssh.string());
    auto r = client.exit("/tmp/ctl/ssh-abc", target, 10);
    EXPECT_EQ(r.exit_code, 0);

    auto args = recorded();
    EXPECT_TRUE(has_pair(args, "-O", "exit"));
    EXPECT_TRUE(has_pair(args, "-o", "ControlPath=/tmp/ctl/ssh-abc"));
    EXPECT_TRUE(has_pair(args, "-p", "2200"));
    EXPECT_FALSE(has_pair(args, "-O", "check"));
}

TEST_F(OpenSshClientTest, ExecPassesCommandLastAndReturnsOutput) {
    OpenSshClient client(fake_ssh.string());
    auto r = client.exec("/tmp/ctl/ssh-abc", target, "uname -a", 10, 5);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "fake-out\n");

    auto args = recorded();
    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[args.size() - 1], "uname -a");
    EXPECT_EQ(args[args.size() - 2], "admin@router.lan");
    EXPECT_TRUE(has_pair(args, "-o", "ControlPath=/tmp/ctl/ssh-abc"));
    EXPECT_TRUE(has_pair(args, "-o", "ConnectTimeout=10"));
    EXPECT_TRUE(has_pair(args, "-o", "LogLevel=ERROR"));
    EXPECT_TRUE(has_pair(args, "-p", "2200"));
    EXPECT_FALSE(has(args, "-O"));
}

TEST_F(OpenSshClientTest, MasterArguments) {
    OpenSshClient client(fake_ssh.string(), (test_dir / "master.log").string());
    SshSettings settings;
    settings.control_persist = 600;
    settings.connect_timeout = 30;

    auto master = client.start_master("/tmp/ctl/ssh-abc", target, settings);
    ASSERT_NE(master, nullptr);

    int code = -1;
    bool done = false;
    for (int i = 0; i < 50 && !done; i++) {
        done = master->exited(code);
        if (!done) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ASSERT_TRUE(done);
    EXPECT_EQ(code, 0);

    auto args = recorded();
    EXPECT_TRUE(has_pair(args, "-o", "ControlMaster=yes"));
    EXPECT_TRUE(has_pair(args, "-o", "ControlPath=/tmp/ctl/ssh-abc"));
    EXPECT_TRUE(has_pair(args, "-o", "ControlPersist=600"));
    EXPECT_TRUE(has_pair(args, "-o", "ConnectTimeout=30"));
    EXPECT_TRUE(has_pair(args, "-o", "StrictHostKeyChecking=no"));
    EXPECT_TRUE(has_pair(args, "-o", "UserKnownHostsFile=/dev/null"));
    EXPECT_TRUE(has_pair(args, "-o", "LogLevel=ERROR"));
    EXPECT_TRUE(has_pair(args, "-o", "BatchMode=yes"));
    EXPECT_TRUE(has_pair(args, "-p", "2200"));
    EXPECT_TRUE(has(args, "-N"));
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.back(), "admin@router.lan");
}

TEST_F(OpenSshClientTest, MissingBinaryFailsCheck) {
    OpenSshClient client((test_dir / "no-such-ssh").string());
    auto r = client.check("/tmp/ctl/ssh-abc", target, 1);
    EXPECT_TRUE(r.failed());
}
