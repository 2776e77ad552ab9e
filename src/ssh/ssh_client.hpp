#pragma once

#include <string>
#include <memory>
#include <core/types.hpp>
#include <platform/process.hpp>

// Background control master started by SshClient::start_master().
class MasterProcess {
public:
    virtual ~MasterProcess() = default;

    // True once the launching process has exited; stores its exit code.
    // With ControlPersist the launcher may exit 0 while the master lives on.
    virtual bool exited(int& exit_code) = 0;

    // Kill and reap the launching process if it is still running.
    virtual void terminate() = 0;
};

// Thin wrapper over the installed OpenSSH client in ControlMaster mode.
// Every operation names the control socket explicitly; nothing is read from
// ~/.ssh/config ControlPath settings.
class SshClient {
public:
    virtual ~SshClient() = default;

    // ssh -O check. Exit code 0 means the master answered.
    virtual SSHResult check(const std::string& socket, const SshTarget& target,
                            int timeout_secs) = 0;

    // ssh -O exit. Asks the master to shut down.
    virtual SSHResult exit(const std::string& socket, const SshTarget& target,
                           int timeout_secs) = 0;

    // Launch a persistent master bound to `socket`. nullptr if it could not be spawned.
    virtual std::unique_ptr<MasterProcess> start_master(const std::string& socket,
                                                        const SshTarget& target,
                                                        const SshSettings& settings) = 0;

    // Run a remote command over the master. timeout_secs <= 0 waits indefinitely.
    virtual SSHResult exec(const std::string& socket, const SshTarget& target,
                           const std::string& command, int connect_timeout_secs,
                           int timeout_secs) = 0;
};

class OpenSshClient : public SshClient {
public:
    explicit OpenSshClient(std::string binary = "ssh", std::string master_log = "");

    SSHResult check(const std::string& socket, const SshTarget& target,
                    int timeout_secs) override;
    SSHResult exit(const std::string& socket, const SshTarget& target,
                   int timeout_secs) override;
    std::unique_ptr<MasterProcess> start_master(const std::string& socket,
                                                const SshTarget& target,
                                                const SshSettings& settings) override;
    SSHResult exec(const std::string& socket, const SshTarget& target,
                   const std::string& command, int connect_timeout_secs,
                   int timeout_secs) override;

private:
    std::string binary_;
    std::string master_log_;  // stderr of spawned masters

    SSHResult control_command(const char* op, const std::string& socket,
                              const SshTarget& target, int timeout_secs);
};
