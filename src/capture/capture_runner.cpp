#include <netscope/capture/capture_runner.h>

#include <exception>

namespace netscope::capture {

void run_captured(CaptureLifecycle& lifecycle, const std::string& test_name,
                  const std::function<void()>& body) {
    lifecycle.before_test(test_name);
    try {
        body();
    } catch (...) {
        // Rethrows the original exception.
        lifecycle.on_test_exception(std::current_exception());
    }
    lifecycle.after_test();
}

} // namespace netscope::capture
