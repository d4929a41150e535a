#include "archname/utils/FileUtils.h"
#include "archname/Exceptions.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace arn {

namespace fs = std::filesystem;

std::string FileUtils::readTextFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FileNotFoundException(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ReadException("Cannot open file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ReadException("Cannot read file: " + path.string());
    }
    return buffer.str();
}

void FileUtils::writeTextFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw WriteException("Cannot create file: " + path.string());
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw WriteException("Cannot write file: " + path.string());
    }
}

std::vector<std::string> FileUtils::readLines(const fs::path& path) {
    const std::string content = readTextFile(path);

    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string FileUtils::getExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool FileUtils::hasExtension(const fs::path& path, const std::string& ext) {
    std::string pathExt = getExtension(path);
    std::string checkExt = ext;
    if (!checkExt.empty() && checkExt[0] != '.') {
        checkExt = "." + checkExt;
    }
    std::transform(checkExt.begin(), checkExt.end(), checkExt.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return pathExt == checkExt;
}

std::vector<std::string> FileUtils::listStems(const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw FileNotFoundException(directory.string());
    }

    std::vector<std::string> stems;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statusEc;
        if (it->is_regular_file(statusEc)) {
            stems.push_back(it->path().stem().string());
        }
    }
    if (ec) {
        throw ReadException("Cannot list directory " + directory.string() + ": " + ec.message());
    }
    return stems;
}

void FileUtils::ensureParentExists(const fs::path& path) {
    auto parent = path.parent_path();
    std::error_code ec;
    if (!parent.empty() && !fs::exists(parent, ec)) {
        if (!fs::create_directories(parent, ec) && ec) {
            throw WriteException("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
}

} // namespace arn
