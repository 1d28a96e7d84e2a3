#pragma once
#include <string>
#include <vector>

namespace Gleaner {
namespace Browser {
namespace Launcher {

class BrowserLauncher {
public:
    // First existing Chromium/Chrome binary, or "" when none is installed.
    static std::string find_browser();

    // Starts one debugging browser for the whole process; later calls are no-ops.
    static bool launch(const std::string& path, int port, bool headless);
    static void cleanup();

private:
    static std::vector<std::string> get_search_paths();
};

}  // namespace Launcher
}  // namespace Browser
}  // namespace Gleaner
