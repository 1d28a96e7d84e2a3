#include "browser_launcher.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "../../core/logger/logger.hpp"

namespace Gleaner {
namespace Browser {
namespace Launcher {

using namespace Gleaner::Core;

namespace {

std::mutex launch_mutex;
pid_t      browser_pid = -1;
std::string user_data_path;

}  // namespace

std::vector<std::string> BrowserLauncher::get_search_paths() {
#ifdef __APPLE__
    return {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
            "/Applications/Chromium.app/Contents/MacOS/Chromium",
            "/opt/homebrew/bin/chromium",
            "/usr/local/bin/chromium"};
#else
    return {"/usr/bin/google-chrome",
            "/usr/bin/google-chrome-stable",
            "/usr/bin/chromium-browser",
            "/usr/bin/chromium",
            "/snap/bin/chromium"};
#endif
}

std::string BrowserLauncher::find_browser() {
    for (const auto& path : get_search_paths()) {
        if (std::filesystem::exists(path))
            return path;
    }
    return "";
}

bool BrowserLauncher::launch(const std::string& path, int port, bool headless) {
    std::lock_guard<std::mutex> lock(launch_mutex);
    if (browser_pid != -1)
        return true;

    if (!std::filesystem::exists(path)) {
        Logger::error("Browser path does not exist: " + path);
        return false;
    }

    user_data_path = "/tmp/gleaner_browser_" + std::to_string(getpid());
    std::error_code ec;
    std::filesystem::create_directories(user_data_path, ec);

    // Proxies are set per browser context, so the process itself runs direct.
    std::vector<std::string> arg_strings = {path,
                                            "--headless=new",
                                            "--disable-gpu",
                                            "--disable-extensions",
                                            "--disable-background-networking",
                                            "--disable-renderer-backgrounding",
                                            "--disable-blink-features=AutomationControlled",
                                            "--window-size=1920,1080",
                                            "--hide-scrollbars",
                                            "--disable-notifications",
                                            "--no-first-run",
                                            "--no-sandbox",
                                            "--remote-debugging-port=" + std::to_string(port),
                                            "--user-data-dir=" + user_data_path,
                                            "--remote-allow-origins=*",
                                            "about:blank"};

    if (!headless) {
        auto it = std::find(arg_strings.begin(), arg_strings.end(), "--headless=new");
        if (it != arg_strings.end())
            arg_strings.erase(it);
    }

    browser_pid = fork();
    if (browser_pid < 0) {
        browser_pid = -1;
        Logger::error("Failed to fork browser process");
        return false;
    }

    if (browser_pid == 0) {
        std::vector<char*> args;
        for (auto& s : arg_strings)
            args.push_back(s.data());
        args.push_back(nullptr);

        if (freopen("/dev/null", "w", stdout) == nullptr) {
        }
        if (freopen("/dev/null", "w", stderr) == nullptr) {
        }

        execv(path.c_str(), args.data());
        _exit(1);
    }
    Logger::info("Launched browser: " + path + " (PID: " + std::to_string(browser_pid) + ")");

    // DevTools needs a moment before it accepts connections.
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    return true;
}

void BrowserLauncher::cleanup() {
    std::lock_guard<std::mutex> lock(launch_mutex);
    if (browser_pid <= 0)
        return;

    Logger::info("Closing browser (PID: " + std::to_string(browser_pid) + ")...");
    kill(browser_pid, SIGTERM);
    waitpid(browser_pid, nullptr, 0);
    browser_pid = -1;

    std::error_code ec;
    std::filesystem::remove_all(user_data_path, ec);
}

}  // namespace Launcher
}  // namespace Browser
}  // namespace Gleaner
