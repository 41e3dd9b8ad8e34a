#include "UploaderConfig.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

std::filesystem::path DefaultStateDir()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "gphoto-uploader" / "uploads";

    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".config" / "gphoto-uploader" / "uploads";

    return fs::path(".gphoto-uploader") / "uploads";
}
