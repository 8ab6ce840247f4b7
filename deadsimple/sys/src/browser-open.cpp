#include "deadsimple/browser-open.hpp"

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <thread>

#include "deadsimple/log.hpp"

extern char** environ;

namespace deadsimple {

bool OpenInBrowser(std::string_view url) noexcept {
  try {
    std::string launcher("xdg-open");
    std::string target(url);
    char* argv[] = {launcher.data(), target.data(), nullptr};

    pid_t pid{};
    const int rc = ::posix_spawnp(&pid, launcher.c_str(), nullptr, nullptr, argv, environ);
    if (rc != 0) {
      log::debug("Unable to launch {} for {}: {}", launcher, url, std::strerror(rc));
      return false;
    }

    // Reap the launcher in the background so that it does not linger as a zombie
    std::thread([pid]() {
      int status{};
      if (::waitpid(pid, &status, 0) == -1) {
        log::debug("waitpid failed for browser launcher pid {}: {}", pid, std::strerror(errno));
      }
    }).detach();
    return true;
  } catch (const std::exception& ex) {
    log::debug("Unable to open {} in a browser: {}", url, ex.what());
    return false;
  }
}

}  // namespace deadsimple
