#pragma once

#include "util/logger.hpp"
#include "util/upgrader_config.hpp"
#include "vfsup/pre_run_checker.hpp"
#include "vfsup/product_upgrader.hpp"
#include "vfsup/status_reporter.hpp"

#include <expected>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace vfsup {

enum class UpgradeStage {
    LoadRing,
    CheckAvailable,
    ResolveDependencyVersion,
    PreflightChecks,
    Download,
    Unmount,
    InstallDependency,
    InstallProduct,
    Remount,
    Cleanup,
};

const char* ToString(UpgradeStage stage);

struct StageError {
    UpgradeStage stage = UpgradeStage::LoadRing;
    // Operator-facing text.
    std::string message;
    // Extra diagnostic context for the log only.
    std::string detail;
};

enum class UpgradeStatus {
    Success,
    NoRingConfigured,
    InvalidRingConfigured,
    Failed,
};

const char* ToString(UpgradeStatus status);

struct UpgradeOutcome {
    UpgradeStatus status = UpgradeStatus::Success;
    std::optional<StageError> error;
    std::vector<std::string> warnings;

    // 0 for success and the informational ring outcomes, 1 for Failed.
    int ExitCode() const { return status == UpgradeStatus::Failed ? 1 : 0; }
};

// Runs one upgrade: ring -> newer version -> Git version -> pre-upgrade checks ->
// download -> unmount -> install Git -> install product. Remount (if unmount
// happened) and cleanup of downloads run afterwards on every path.
class UpgradeOrchestrator {
  public:
    struct Options {
        std::string product_name = "VFSForGit";
        std::string dependency_name = "Git";
        std::string product_cli = "gvfs";
        std::string rerun_command = "gvfs upgrade --confirm";

        // Block for one line of input after the report.
        bool wait_for_acknowledgement = false;
        bool animate_progress = false;
    };

    UpgradeOrchestrator(std::shared_ptr<IProductUpgrader> upgrader,
                        std::shared_ptr<IPreRunChecker> pre_run_checker,
                        std::istream& input,
                        std::ostream& output,
                        Options opt);

    UpgradeOrchestrator(const UpgradeOrchestrator&) = delete;
    UpgradeOrchestrator& operator=(const UpgradeOrchestrator&) = delete;

    // Real collaborators on std::cin/std::cout.
    static std::unique_ptr<UpgradeOrchestrator> CreateDefault(const config::UpgraderConfig& cfg);

    UpgradeOutcome Execute();

    const UpgradeOutcome& Outcome() const { return outcome_; }
    // True once repositories were unmounted during the current run.
    bool RemountRequired() const { return remount_; }

  private:
    template <typename Step>
    std::expected<void, StageError> RunStage(std::string_view label, Step&& step);

    std::expected<RingType, StageError> TryLoadUpgradeRing();
    void RunUpgradeInstall(RingType ring);
    std::expected<ProductVersion, StageError> TryRunUpgradeInstall(RingType ring);

    std::expected<ProductVersion, StageError> TryCheckIfUpgradeAvailable(RingType ring);
    std::expected<DependencyVersion, StageError> TryGetNewDependencyVersion();
    std::expected<void, StageError> TryRunPreUpgradeChecks();
    std::expected<void, StageError> TryDownloadUpgrade(const ProductVersion& version);
    std::expected<void, StageError> TryUnmountRepositories();
    std::expected<void, StageError> TryInstallDependency(const DependencyVersion& version);
    std::expected<void, StageError> TryInstallProduct(const ProductVersion& version);

    void RunTail() noexcept;
    void TryRemountRepositories();
    void WarnRemountFailed(const std::string& error);
    void DeleteDownloadedAssets();

    StageError RecordStageFailure(UpgradeStage stage,
                                  std::string message,
                                  std::string detail = {},
                                  LogLevel level = LogLevel::Error);
    void LogInstalledVersionInfo();
    void LogVersionInfo(const ProductVersion& product,
                        const DependencyVersion& dependency,
                        std::string_view message);

    void ReportOutcome();
    void WaitForAcknowledgement();

    std::shared_ptr<IProductUpgrader> upgrader_;
    std::shared_ptr<IPreRunChecker> pre_run_checker_;
    std::istream& input_;
    std::ostream& output_;
    Options opt_;
    std::unique_ptr<IStatusReporter> reporter_;

    UpgradeOutcome outcome_;
    UpgradeStage current_stage_ = UpgradeStage::LoadRing;
    bool remount_ = false;
};

} // namespace vfsup
