#include "vfsup/status_reporter.hpp"

#include "util/scope_exit.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace vfsup {

namespace {

constexpr char kSpinnerFrames[] = {'|', '/', '-', '\\'};
constexpr const char* kSucceeded = "Succeeded";
constexpr const char* kFailed = "Failed";

} // namespace

ConsoleStatusReporter::ConsoleStatusReporter(std::ostream& out, bool animate)
    : out_(out), animate_(animate) {}

bool ConsoleStatusReporter::ShowStatusWhileRunning(const std::function<bool()>& action,
                                                   std::string_view label) {
    if (animate_) return RunAnimated(action, label);

    out_ << label << "..." << std::flush;
    bool ok = false;
    {
        // Finish the line even when the action throws.
        auto finish = MakeScopeExit([&] { out_ << (ok ? kSucceeded : kFailed) << std::endl; });
        ok = action();
    }
    return ok;
}

bool ConsoleStatusReporter::RunAnimated(const std::function<bool()>& action, std::string_view label) {
    const std::string prefix = std::string(label) + "...";

    std::mutex mu;
    std::condition_variable cv;
    bool done = false;

    std::thread spinner([&] {
        size_t frame = 0;
        std::unique_lock<std::mutex> lk(mu);
        while (!done) {
            out_ << '\r' << prefix << kSpinnerFrames[frame++ % sizeof(kSpinnerFrames)] << std::flush;
            cv.wait_for(lk, frame_interval_, [&] { return done; });
        }
    });

    bool ok = false;
    {
        auto finish = MakeScopeExit([&] {
            {
                std::lock_guard<std::mutex> lk(mu);
                done = true;
            }
            cv.notify_all();
            spinner.join();
            out_ << '\r' << prefix << (ok ? kSucceeded : kFailed) << std::endl;
        });
        ok = action();
    }
    return ok;
}

} // namespace vfsup
