#pragma once

#include <expected>
#include <string>
#include <sys/types.h>
#include <vector>

namespace vfsup {

// Starts one child process at a time. Start() may be called again once the
// previous child has been waited for.
class IProcessLauncher {
  public:
    virtual ~IProcessLauncher() = default;
    virtual bool Start(const std::string& path, const std::vector<std::string>& args) = 0;
    virtual void WaitForExit() = 0;
    virtual bool HasExited() const = 0;
    virtual int ExitCode() const = 0;
};

class PosixProcessLauncher final : public IProcessLauncher {
  public:
    PosixProcessLauncher() = default;
    PosixProcessLauncher(const PosixProcessLauncher&) = delete;
    PosixProcessLauncher& operator=(const PosixProcessLauncher&) = delete;
    ~PosixProcessLauncher() override;

    bool Start(const std::string& path, const std::vector<std::string>& args) override;
    void WaitForExit() override;
    bool HasExited() const override { return exited_; }
    int ExitCode() const override { return exit_code_; }

  private:
    pid_t pid_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;
};

// Start + wait. Yields the exit code, or an error when the child could not be
// started or did not report an exit.
std::expected<int, std::string> RunToCompletion(IProcessLauncher& launcher,
                                                const std::string& path,
                                                const std::vector<std::string>& args);

// Runs path to completion and returns what it wrote to stdout. A non-zero exit
// is an error.
std::expected<std::string, std::string> ReadCommandOutput(const std::string& path,
                                                          const std::vector<std::string>& args);

} // namespace vfsup
