#pragma once

#include <string>

namespace sonance::core {

struct FileSystem {
    static bool exists(const std::string& path);

    // Returns an empty string when the file is missing or unreadable
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace sonance::core
