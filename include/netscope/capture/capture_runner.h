#pragma once
#include <netscope/capture/capture_lifecycle.h>
#include <functional>
#include <string>

namespace netscope::capture {

// Drive the hook protocol around `body` for runners without their own
// fixture support: before_test, then the body, then exactly one of
// after_test or on_test_exception. A body exception reaches the caller
// unchanged after the flush.
void run_captured(CaptureLifecycle& lifecycle, const std::string& test_name,
                  const std::function<void()>& body);

} // namespace netscope::capture
