#include "vfsup/pre_run_checker.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sys/statvfs.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace vfsup {

namespace {

class PosixSystemOps final : public InstallerPreRunChecker::ISystemOps {
  public:
    bool IsElevated() const override { return ::geteuid() == 0; }

    std::vector<std::string> FindRunningProcesses(
        const std::vector<std::string>& names) const override {
        std::vector<std::string> found;
        std::error_code ec;
        for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
            const std::string pid = it->path().filename().string();
            const bool numeric = !pid.empty() && std::all_of(pid.begin(), pid.end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            });
            if (!numeric) continue;
            if (std::to_string(::getpid()) == pid) continue;

            std::ifstream comm(it->path() / "comm");
            std::string name;
            if (!std::getline(comm, name)) continue;

            if (std::find(names.begin(), names.end(), name) != names.end() &&
                std::find(found.begin(), found.end(), name) == found.end()) {
                found.push_back(name);
            }
        }
        return found;
    }

    std::expected<std::uint64_t, std::string> AvailableDiskBytes(
        const std::string& path) const override {
        // The download directory may not exist yet; measure its nearest ancestor.
        fs::path probe(path);
        std::error_code ec;
        while (!probe.empty() && !fs::exists(probe, ec)) {
            probe = probe.parent_path();
        }
        if (probe.empty()) probe = "/";

        struct statvfs st{};
        if (::statvfs(probe.c_str(), &st) != 0) {
            return std::unexpected("statvfs(" + probe.string() + ") failed: " + std::strerror(errno));
        }
        return static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
    }
};

std::string Join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

} // namespace

std::shared_ptr<const InstallerPreRunChecker::ISystemOps> InstallerPreRunChecker::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

InstallerPreRunChecker::InstallerPreRunChecker(Options opt, std::shared_ptr<IProcessLauncher> launcher)
    : InstallerPreRunChecker(std::move(opt), std::move(launcher), nullptr) {}

InstallerPreRunChecker::InstallerPreRunChecker(Options opt,
                                               std::shared_ptr<IProcessLauncher> launcher,
                                               std::shared_ptr<const ISystemOps> system_ops)
    : opt_(std::move(opt)),
      launcher_(launcher ? std::move(launcher) : std::make_shared<PosixProcessLauncher>()),
      system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

Result InstallerPreRunChecker::RunPreUpgradeChecks(std::string_view command_to_rerun) {
    const std::string rerun(command_to_rerun);

    if (!system_ops_->IsElevated()) {
        LogWarn("Pre-upgrade check failed: not elevated");
        return Result::Fail("The installer needs to be run with elevated permissions. Run `sudo " +
                            rerun + "` to upgrade.");
    }

    const auto blocking = system_ops_->FindRunningProcesses(opt_.blocking_processes);
    if (!blocking.empty()) {
        LogWarn("Pre-upgrade check failed: blocking processes running: %s", Join(blocking).c_str());
        return Result::Fail("Blocking processes are running: " + Join(blocking) +
                            ". Close them and run `" + rerun + "` again.");
    }

    if (opt_.min_free_disk_bytes > 0) {
        auto free_bytes = system_ops_->AvailableDiskBytes(opt_.download_directory);
        if (!free_bytes) {
            return Result::Fail("Unable to determine free disk space: " + free_bytes.error());
        }
        if (*free_bytes < opt_.min_free_disk_bytes) {
            LogWarn("Pre-upgrade check failed: %llu bytes free, %llu required",
                    (unsigned long long)*free_bytes,
                    (unsigned long long)opt_.min_free_disk_bytes);
            return Result::Fail("Not enough free disk space in " + opt_.download_directory + " (" +
                                std::to_string(*free_bytes / (1024 * 1024)) + " MiB free, " +
                                std::to_string(opt_.min_free_disk_bytes / (1024 * 1024)) +
                                " MiB required). Free up space and run `" + rerun + "` again.");
        }
    }

    LogInfo("Pre-upgrade checks passed");
    return Result::Ok();
}

Result InstallerPreRunChecker::UnmountAllRepositories() {
    return RunServiceCommand("--unmount-all", "unmount");
}

Result InstallerPreRunChecker::MountAllRepositories() {
    return RunServiceCommand("--mount-all", "mount");
}

Result InstallerPreRunChecker::RunServiceCommand(const char* flag, const char* action) {
    LogInfo("Running %s service %s", opt_.product_cli.c_str(), flag);

    auto exit_code = RunToCompletion(*launcher_, opt_.product_cli, {"service", flag});
    if (!exit_code) {
        return Result::Fail("Unable to " + std::string(action) + " repositories: " + exit_code.error());
    }
    if (*exit_code != 0) {
        return Result::Fail(*exit_code,
                            "Unable to " + std::string(action) + " repositories (" + opt_.product_cli +
                                " exited with " + std::to_string(*exit_code) + ")");
    }
    return Result::Ok();
}

} // namespace vfsup
