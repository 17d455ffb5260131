#pragma once

#include <chrono>
#include <functional>
#include <ostream>
#include <string_view>

namespace vfsup {

class IStatusReporter {
  public:
    virtual ~IStatusReporter() = default;

    // Returns action's result unchanged; only the presentation differs.
    virtual bool ShowStatusWhileRunning(const std::function<bool()>& action,
                                        std::string_view label) = 0;
};

// Writes "<label>..." and then "Succeeded"/"Failed". When animate is set a
// spinner is drawn on a helper thread while the action runs.
class ConsoleStatusReporter final : public IStatusReporter {
  public:
    ConsoleStatusReporter(std::ostream& out, bool animate);

    bool ShowStatusWhileRunning(const std::function<bool()>& action,
                                std::string_view label) override;

    void SetFrameInterval(std::chrono::milliseconds interval) { frame_interval_ = interval; }

  private:
    bool RunAnimated(const std::function<bool()>& action, std::string_view label);

    std::ostream& out_;
    bool animate_ = false;
    std::chrono::milliseconds frame_interval_{100};
};

} // namespace vfsup
