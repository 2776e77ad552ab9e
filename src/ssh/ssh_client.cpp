#include "ssh_client.hpp"
#include "target.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <vector>

namespace {

class SpawnedMaster : public MasterProcess {
public:
    explicit SpawnedMaster(platform::ProcessHandle proc) : proc_(std::move(proc)) {}

    bool exited(int& exit_code) override { return proc_.try_wait(exit_code); }
    void terminate() override { proc_.terminate(); }

private:
    platform::ProcessHandle proc_;
};

std::string join_args(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& a : args) out += " " + a;
    return out;
}

} // namespace

OpenSshClient::OpenSshClient(std::string binary, std::string master_log)
    : binary_(std::move(binary)), master_log_(std::move(master_log)) {}

SSHResult OpenSshClient::control_command(const char* op, const std::string& socket,
                                         const SshTarget& target, int timeout_secs) {
    std::vector<std::string> args = {
        "-o", "ControlPath=" + socket,
        "-o", fmt::format("ConnectTimeout={}", timeout_secs),
        "-p", std::to_string(target.port),
        "-O", op,
        ssh_destination(target),
    };
    auto r = platform::run_capture(binary_, args,
                                   (timeout_secs + SSH_CONTROL_CMD_GRACE_SECS) * 1000);
    hostmux_log_ssh(fmt::format("ssh -O {}", op), join_args(binary_, args), r);
    return r;
}

SSHResult OpenSshClient::check(const std::string& socket, const SshTarget& target,
                               int timeout_secs) {
    return control_command("check", socket, target, timeout_secs);
}

SSHResult OpenSshClient::exit(const std::string& socket, const SshTarget& target,
                              int timeout_secs) {
    return control_command("exit", socket, target, timeout_secs);
}

std::unique_ptr<MasterProcess> OpenSshClient::start_master(const std::string& socket,
                                                           const SshTarget& target,
                                                           const SshSettings& settings) {
    std::vector<std::string> args = {
        "-o", "ControlMaster=yes",
        "-o", "ControlPath=" + socket,
        "-o", fmt::format("ControlPersist={}", settings.control_persist),
        "-o", fmt::format("ConnectTimeout={}", settings.connect_timeout),
        "-o", SSH_OPT_NO_HOSTKEY,
        "-o", SSH_OPT_NO_KNOWNHOSTS,
        "-o", SSH_OPT_LOGLEVEL,
        "-o", "BatchMode=yes",
        "-p", std::to_string(target.port),
        "-N",
        ssh_destination(target),
    };
    hostmux_log(fmt::format("start master: {}", join_args(binary_, args)));

    auto proc = platform::spawn(binary_, args, master_log_, true);
    if (!proc.valid()) {
        hostmux_log(fmt::format("start master: spawn failed for {}", target.raw));
        return nullptr;
    }
    return std::make_unique<SpawnedMaster>(std::move(proc));
}

SSHResult OpenSshClient::exec(const std::string& socket, const SshTarget& target,
                              const std::string& command, int connect_timeout_secs,
                              int timeout_secs) {
    std::vector<std::string> args = {
        "-o", "ControlPath=" + socket,
        "-o", fmt::format("ConnectTimeout={}", connect_timeout_secs),
        "-o", SSH_OPT_LOGLEVEL,
        "-p", std::to_string(target.port),
        ssh_destination(target),
        command,
    };
    auto r = platform::run_capture(binary_, args, timeout_secs > 0 ? timeout_secs * 1000 : 0);
    hostmux_log_ssh("exec", join_args(binary_, args), r);
    return r;
}
