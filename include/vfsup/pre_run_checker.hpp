#pragma once

#include "system/process_launcher.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vfsup {

class IPreRunChecker {
  public:
    virtual ~IPreRunChecker() = default;
    virtual Result RunPreUpgradeChecks(std::string_view command_to_rerun) = 0;
    virtual Result UnmountAllRepositories() = 0;
    virtual Result MountAllRepositories() = 0;
};

class InstallerPreRunChecker final : public IPreRunChecker {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual bool IsElevated() const = 0;
        // Names of running processes whose command name is in names.
        virtual std::vector<std::string> FindRunningProcesses(
            const std::vector<std::string>& names) const = 0;
        virtual std::expected<std::uint64_t, std::string> AvailableDiskBytes(
            const std::string& path) const = 0;
    };

    struct Options {
        std::string product_cli;
        std::string download_directory;
        std::uint64_t min_free_disk_bytes = 0;
        std::vector<std::string> blocking_processes;
    };

    InstallerPreRunChecker(Options opt, std::shared_ptr<IProcessLauncher> launcher);
    InstallerPreRunChecker(Options opt,
                           std::shared_ptr<IProcessLauncher> launcher,
                           std::shared_ptr<const ISystemOps> system_ops);

    Result RunPreUpgradeChecks(std::string_view command_to_rerun) override;
    Result UnmountAllRepositories() override;
    Result MountAllRepositories() override;

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    Result RunServiceCommand(const char* flag, const char* action);

    Options opt_;
    std::shared_ptr<IProcessLauncher> launcher_;
    std::shared_ptr<const ISystemOps> system_ops_;
};

} // namespace vfsup
