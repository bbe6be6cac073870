#include <sonance/core/filesystem.hpp>
#include <fstream>
#include <iterator>

namespace sonance::core {

bool FileSystem::exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) return false;
    file << text;
    return file.good();
}

} // namespace sonance::core
