#pragma once

#include <string_view>

namespace deadsimple {

// Ask the desktop environment to open url in the default browser (xdg-open).
// Best effort: returns false if the launcher could not be started, never throws.
// The launcher exit status is not waited for by the caller.
bool OpenInBrowser(std::string_view url) noexcept;

}  // namespace deadsimple
