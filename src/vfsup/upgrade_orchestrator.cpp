#include "vfsup/upgrade_orchestrator.hpp"

#include "util/logger.hpp"
#include "util/scope_exit.hpp"

#include <iostream>
#include <unistd.h>

#ifndef VFSUP_PRODUCT_VERSION
#define VFSUP_PRODUCT_VERSION "0.0.0"
#endif

namespace vfsup {

namespace {

constexpr const char* kNoneRingAlert =
    "Upgrade ring set to \"None\". No upgrade check was performed.";
constexpr const char* kInvalidRingAlert =
    "Upgrade ring is not set to a valid value. No upgrade check was performed.";
constexpr const char* kSuccessMessage = "Upgrade completed successfully!";
constexpr const char* kPressEnterMessage = "Press Enter to exit.";

constexpr const char* kUpgradeStepKey = "UpgradeStep";
constexpr const char* kErrorKey = "Error";

} // namespace

const char* ToString(UpgradeStage stage) {
    switch (stage) {
        case UpgradeStage::LoadRing:                 return "LoadRing";
        case UpgradeStage::CheckAvailable:           return "CheckAvailable";
        case UpgradeStage::ResolveDependencyVersion: return "ResolveDependencyVersion";
        case UpgradeStage::PreflightChecks:          return "PreflightChecks";
        case UpgradeStage::Download:                 return "Download";
        case UpgradeStage::Unmount:                  return "Unmount";
        case UpgradeStage::InstallDependency:        return "InstallDependency";
        case UpgradeStage::InstallProduct:           return "InstallProduct";
        case UpgradeStage::Remount:                  return "Remount";
        case UpgradeStage::Cleanup:                  return "Cleanup";
    }
    return "Unknown";
}

const char* ToString(UpgradeStatus status) {
    switch (status) {
        case UpgradeStatus::Success:               return "Success";
        case UpgradeStatus::NoRingConfigured:      return "NoRingConfigured";
        case UpgradeStatus::InvalidRingConfigured: return "InvalidRingConfigured";
        case UpgradeStatus::Failed:                return "Failed";
    }
    return "Unknown";
}

UpgradeOrchestrator::UpgradeOrchestrator(std::shared_ptr<IProductUpgrader> upgrader,
                                         std::shared_ptr<IPreRunChecker> pre_run_checker,
                                         std::istream& input,
                                         std::ostream& output,
                                         Options opt)
    : upgrader_(std::move(upgrader)),
      pre_run_checker_(std::move(pre_run_checker)),
      input_(input),
      output_(output),
      opt_(std::move(opt)),
      reporter_(std::make_unique<ConsoleStatusReporter>(output_, opt_.animate_progress)) {}

std::unique_ptr<UpgradeOrchestrator> UpgradeOrchestrator::CreateDefault(const config::UpgraderConfig& cfg) {
    auto launcher = std::make_shared<PosixProcessLauncher>();

    ProductUpgrader::Options upgrader_opt;
    upgrader_opt.ring_config_path = cfg.ring_config_path;
    upgrader_opt.release_feed_url = cfg.release_feed_url;
    upgrader_opt.download_directory = cfg.download_directory;
    upgrader_opt.current_version =
        cfg.current_version.empty() ? std::string(VFSUP_PRODUCT_VERSION) : cfg.current_version;
    upgrader_opt.dependency_cli = cfg.dependency_cli;
    upgrader_opt.dependency_asset_prefix = cfg.dependency_asset_prefix;
    upgrader_opt.product_asset_prefix = cfg.product_asset_prefix;
    upgrader_opt.installer_entry = cfg.installer_entry;

    InstallerPreRunChecker::Options checker_opt;
    checker_opt.product_cli = cfg.product_cli;
    checker_opt.download_directory = cfg.download_directory;
    checker_opt.min_free_disk_bytes = cfg.min_free_disk_bytes;
    checker_opt.blocking_processes = cfg.blocking_processes;

    Options opt;
    opt.product_name = cfg.product_name;
    opt.dependency_name = cfg.dependency_name;
    opt.product_cli = cfg.product_cli;
    opt.rerun_command = cfg.rerun_command;
    opt.wait_for_acknowledgement = ::isatty(STDIN_FILENO) != 0;
    opt.animate_progress = ::isatty(STDOUT_FILENO) != 0;

    return std::make_unique<UpgradeOrchestrator>(
        std::make_shared<ProductUpgrader>(
            std::move(upgrader_opt), std::make_shared<CurlHttpClient>(), launcher),
        std::make_shared<InstallerPreRunChecker>(std::move(checker_opt), launcher),
        std::cin,
        std::cout,
        std::move(opt));
}

UpgradeOutcome UpgradeOrchestrator::Execute() {
    outcome_ = UpgradeOutcome{};
    current_stage_ = UpgradeStage::LoadRing;
    remount_ = false;

    auto ring = TryLoadUpgradeRing();
    if (!ring) {
        outcome_.status = UpgradeStatus::Failed;
        outcome_.error = ring.error();
    } else if (*ring == RingType::None) {
        outcome_.status = UpgradeStatus::NoRingConfigured;
    } else if (*ring == RingType::Invalid) {
        outcome_.status = UpgradeStatus::InvalidRingConfigured;
    } else {
        RunWithTail([&] { RunUpgradeInstall(*ring); }, [&] { RunTail(); });
    }

    LogInfo("Upgrade finished: %s", ToString(outcome_.status));
    ReportOutcome();
    WaitForAcknowledgement();
    return outcome_;
}

template <typename Step>
std::expected<void, StageError> UpgradeOrchestrator::RunStage(std::string_view label, Step&& step) {
    std::expected<void, StageError> result;
    reporter_->ShowStatusWhileRunning(
        [&] {
            result = step();
            return result.has_value();
        },
        label);
    return result;
}

std::expected<RingType, StageError> UpgradeOrchestrator::TryLoadUpgradeRing() {
    current_stage_ = UpgradeStage::LoadRing;

    auto ring = upgrader_->LoadRingConfig();
    if (!ring) {
        return std::unexpected(RecordStageFailure(UpgradeStage::LoadRing, ring.error()));
    }

    LogInfo("Upgrade ring: %s", ToString(*ring));
    return *ring;
}

void UpgradeOrchestrator::RunUpgradeInstall(RingType ring) {
    std::expected<ProductVersion, StageError> installed;
    try {
        installed = TryRunUpgradeInstall(ring);
    } catch (const std::exception& e) {
        installed = std::unexpected(
            RecordStageFailure(current_stage_, std::string("Unexpected error: ") + e.what()));
    } catch (...) {
        installed = std::unexpected(
            RecordStageFailure(current_stage_, "Unexpected error: unknown exception"));
    }

    if (installed) {
        outcome_.status = UpgradeStatus::Success;
    } else {
        outcome_.status = UpgradeStatus::Failed;
        outcome_.error = installed.error();
    }
}

std::expected<ProductVersion, StageError> UpgradeOrchestrator::TryRunUpgradeInstall(RingType ring) {
    ProductVersion new_version;
    DependencyVersion new_dependency_version;

    auto checked = RunStage("Checking for upgrades", [&]() -> std::expected<void, StageError> {
        auto version = TryCheckIfUpgradeAvailable(ring);
        if (!version) return std::unexpected(version.error());
        new_version = *version;

        auto dependency = TryGetNewDependencyVersion();
        if (!dependency) return std::unexpected(dependency.error());
        new_dependency_version = *dependency;
        return {};
    });
    if (!checked) return std::unexpected(checked.error());

    LogInstalledVersionInfo();
    LogVersionInfo(new_version, new_dependency_version, "Available Version");

    if (auto r = RunStage("Running pre-upgrade checks", [&] { return TryRunPreUpgradeChecks(); }); !r)
        return std::unexpected(r.error());

    if (auto r = RunStage("Downloading", [&] { return TryDownloadUpgrade(new_version); }); !r)
        return std::unexpected(r.error());

    if (auto r = RunStage("Unmounting repositories", [&] { return TryUnmountRepositories(); }); !r)
        return std::unexpected(r.error());

    const std::string dependency_label =
        "Installing " + opt_.dependency_name + " version: " + new_dependency_version.ToString();
    if (auto r = RunStage(dependency_label,
                          [&] { return TryInstallDependency(new_dependency_version); });
        !r)
        return std::unexpected(r.error());

    const std::string product_label =
        "Installing " + opt_.product_name + " version: " + new_version.ToString();
    if (auto r = RunStage(product_label, [&] { return TryInstallProduct(new_version); }); !r)
        return std::unexpected(r.error());

    LogVersionInfo(new_version, new_dependency_version, "Newly Installed Version");
    return new_version;
}

std::expected<ProductVersion, StageError> UpgradeOrchestrator::TryCheckIfUpgradeAvailable(RingType ring) {
    current_stage_ = UpgradeStage::CheckAvailable;

    auto newest = upgrader_->GetNewerVersion(ring);
    if (!newest) {
        return std::unexpected(RecordStageFailure(UpgradeStage::CheckAvailable, newest.error()));
    }

    if (!newest->has_value()) {
        // Not a malfunction, but it ends the run as Failed.
        return std::unexpected(RecordStageFailure(UpgradeStage::CheckAvailable,
                                                  std::string("No upgrades available in ring: ") +
                                                      ToString(ring),
                                                  "No new upgrade releases available",
                                                  LogLevel::Info));
    }

    LogInfo("Successfully checked for new release: %s", (*newest)->ToString().c_str());
    return **newest;
}

std::expected<DependencyVersion, StageError> UpgradeOrchestrator::TryGetNewDependencyVersion() {
    current_stage_ = UpgradeStage::ResolveDependencyVersion;

    auto version = upgrader_->GetDependencyVersion();
    if (!version) {
        return std::unexpected(
            RecordStageFailure(UpgradeStage::ResolveDependencyVersion, version.error()));
    }

    LogInfo("Successfully read %s version %s", opt_.dependency_name.c_str(), version->ToString().c_str());
    return *version;
}

std::expected<void, StageError> UpgradeOrchestrator::TryRunPreUpgradeChecks() {
    current_stage_ = UpgradeStage::PreflightChecks;

    auto r = pre_run_checker_->RunPreUpgradeChecks(opt_.rerun_command);
    if (!r.is_ok()) {
        return std::unexpected(RecordStageFailure(UpgradeStage::PreflightChecks, r.message()));
    }
    return {};
}

std::expected<void, StageError> UpgradeOrchestrator::TryDownloadUpgrade(const ProductVersion& version) {
    current_stage_ = UpgradeStage::Download;

    auto r = upgrader_->DownloadNewestVersion();
    if (!r.is_ok()) {
        return std::unexpected(RecordStageFailure(UpgradeStage::Download,
                                                  r.message(),
                                                  "version " + version.ToString()));
    }

    LogInfo("Successfully downloaded version: %s", version.ToString().c_str());
    return {};
}

std::expected<void, StageError> UpgradeOrchestrator::TryUnmountRepositories() {
    current_stage_ = UpgradeStage::Unmount;

    auto r = pre_run_checker_->UnmountAllRepositories();
    if (!r.is_ok()) {
        return std::unexpected(RecordStageFailure(UpgradeStage::Unmount, r.message()));
    }

    remount_ = true;
    return {};
}

std::expected<void, StageError> UpgradeOrchestrator::TryInstallDependency(const DependencyVersion& version) {
    current_stage_ = UpgradeStage::InstallDependency;

    auto installed = upgrader_->RunDependencyInstaller(version);
    if (!installed) {
        return std::unexpected(RecordStageFailure(UpgradeStage::InstallDependency,
                                                  installed.error(),
                                                  "version " + version.ToString()));
    }
    if (!*installed) {
        std::string message = opt_.dependency_name + " installer failed.";
        const std::string log_path = Logger::Instance().LogFilePath();
        if (!log_path.empty()) message += " See " + log_path + " for details.";
        return std::unexpected(RecordStageFailure(UpgradeStage::InstallDependency,
                                                  std::move(message),
                                                  "version " + version.ToString()));
    }

    LogInfo("Successfully installed %s version: %s",
            opt_.dependency_name.c_str(), version.ToString().c_str());
    return {};
}

std::expected<void, StageError> UpgradeOrchestrator::TryInstallProduct(const ProductVersion& version) {
    current_stage_ = UpgradeStage::InstallProduct;

    auto installed = upgrader_->RunProductInstaller(version);
    if (!installed) {
        return std::unexpected(RecordStageFailure(UpgradeStage::InstallProduct,
                                                  installed.error(),
                                                  "version " + version.ToString()));
    }
    if (!*installed) {
        std::string message = opt_.product_name + " installer failed.";
        const std::string log_path = Logger::Instance().LogFilePath();
        if (!log_path.empty()) message += " See " + log_path + " for details.";
        return std::unexpected(RecordStageFailure(UpgradeStage::InstallProduct,
                                                  std::move(message),
                                                  "version " + version.ToString()));
    }

    LogInfo("Successfully installed %s version: %s",
            opt_.product_name.c_str(), version.ToString().c_str());
    return {};
}

void UpgradeOrchestrator::RunTail() noexcept {
    // May run while an exception unwinds: nothing thrown in here may escape.
    try {
        TryRemountRepositories();
    } catch (const std::exception& e) {
        const std::string message = std::string("Unexpected error while remounting: ") + e.what();
        RecordStageFailure(UpgradeStage::Remount, message);
        WarnRemountFailed(message);
    } catch (...) {
        const std::string message = "Unexpected error while remounting: unknown exception";
        RecordStageFailure(UpgradeStage::Remount, message);
        WarnRemountFailed(message);
    }

    try {
        DeleteDownloadedAssets();
    } catch (const std::exception& e) {
        RecordStageFailure(UpgradeStage::Cleanup, std::string("Unexpected error: ") + e.what());
    } catch (...) {
        RecordStageFailure(UpgradeStage::Cleanup, "Unexpected error: unknown exception");
    }
}

void UpgradeOrchestrator::TryRemountRepositories() {
    if (!remount_) return;

    std::string remount_error;
    const bool mounted = reporter_->ShowStatusWhileRunning(
        [&] {
            current_stage_ = UpgradeStage::Remount;
            auto r = pre_run_checker_->MountAllRepositories();
            if (!r.is_ok()) {
                RecordStageFailure(UpgradeStage::Remount, r.message());
                remount_error = r.message();
                return false;
            }
            return true;
        },
        "Mounting repositories");

    if (!mounted) WarnRemountFailed(remount_error);
}

void UpgradeOrchestrator::WarnRemountFailed(const std::string& error) {
    // Downgraded to a warning: the installed payload stays the dominant result.
    outcome_.warnings.push_back(error);
    output_ << "\nWARNING: " << error << "\n"
            << "Run `" << opt_.product_cli << " service --mount-all` to mount your repositories."
            << std::endl;
}

void UpgradeOrchestrator::DeleteDownloadedAssets() {
    current_stage_ = UpgradeStage::Cleanup;

    auto r = upgrader_->Cleanup();
    if (!r.is_ok()) {
        RecordStageFailure(UpgradeStage::Cleanup, r.message());
    }
}

StageError UpgradeOrchestrator::RecordStageFailure(UpgradeStage stage,
                                                   std::string message,
                                                   std::string detail,
                                                   LogLevel level) {
    EventMetadata metadata;
    metadata.emplace_back(kUpgradeStepKey, ToString(stage));
    metadata.emplace_back(kErrorKey, message);
    if (!detail.empty()) metadata.emplace_back("Detail", detail);

    Logger::Instance().LogEvent(level, std::string(ToString(stage)) + " failed.", metadata);
    return StageError{stage, std::move(message), std::move(detail)};
}

void UpgradeOrchestrator::LogInstalledVersionInfo() {
    EventMetadata metadata{{"installedVersion", upgrader_->CurrentVersion()}};
    if (auto dependency = upgrader_->InstalledDependencyVersion()) {
        metadata.emplace_back("installedDependencyVersion", *dependency);
    }
    Logger::Instance().LogEvent(LogLevel::Info, "Installed Version", metadata);
}

void UpgradeOrchestrator::LogVersionInfo(const ProductVersion& product,
                                         const DependencyVersion& dependency,
                                         std::string_view message) {
    Logger::Instance().LogEvent(LogLevel::Info,
                                message,
                                {{"productVersion", product.ToString()},
                                 {"dependencyVersion", dependency.ToString()}});
}

void UpgradeOrchestrator::ReportOutcome() {
    const std::string set_ring_hint = "To set or change the upgrade ring, run `" + opt_.product_cli +
                                      " config upgrade.ring [\"Fast\"|\"Slow\"|\"None\"]`.";

    switch (outcome_.status) {
        case UpgradeStatus::NoRingConfigured:
            output_ << kNoneRingAlert << "\n" << set_ring_hint << std::endl;
            break;
        case UpgradeStatus::InvalidRingConfigured:
            output_ << kInvalidRingAlert << std::endl;
            break;
        case UpgradeStatus::Failed:
            // An unreadable ring config means no upgrade check was performed either.
            if (outcome_.error && outcome_.error->stage == UpgradeStage::LoadRing) {
                output_ << kInvalidRingAlert << std::endl;
            }
            output_ << "\nERROR: " << (outcome_.error ? outcome_.error->message : "Upgrade failed.")
                    << std::endl;
            break;
        case UpgradeStatus::Success:
            output_ << "\n" << kSuccessMessage << std::endl;
            break;
    }
}

void UpgradeOrchestrator::WaitForAcknowledgement() {
    if (!opt_.wait_for_acknowledgement) return;

    output_ << kPressEnterMessage << std::endl;
    std::string line;
    std::getline(input_, line);
}

} // namespace vfsup
