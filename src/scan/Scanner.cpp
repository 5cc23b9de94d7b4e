#include "scan/Scanner.h"
#include "utils/Logger.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

nlohmann::json ScanResult::toJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& v : violations) {
        items.push_back({{"file", v.file}, {"line", v.line}, {"pattern", v.pattern}});
    }
    nlohmann::json result;
    result["failed"] = failed();
    result["count"] = static_cast<int>(violations.size());
    result["violations"] = items;
    return result;
}

Scanner::Scanner(std::vector<std::string> bannedPatterns, std::string suppressionMarker)
    : bannedPatterns(std::move(bannedPatterns)), suppressionMarker(std::move(suppressionMarker)) {}

std::vector<fs::path> Scanner::listFiles(const fs::path& directory) const {
    if (!fs::exists(directory) || !fs::is_directory(directory)) {
        throw std::runtime_error("Scan directory does not exist or is not a directory: " + directory.u8string());
    }
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        files.push_back(entry.path());
    }
    return files;
}

std::vector<Violation> Scanner::scanFile(const fs::path& file) const {
    // 目录、管道等非普通文件条目同样视为致命错误，而不是跳过
    if (!fs::is_regular_file(file)) {
        throw std::runtime_error("Not a regular file: " + file.u8string());
    }
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open file: " + file.u8string());
    }

    std::vector<Violation> found;
    std::string name = file.u8string();
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find(suppressionMarker) != std::string::npos) continue;

        for (const auto& pattern : bannedPatterns) {
            if (line.find(pattern) == std::string::npos) continue;
            found.push_back({name, lineNo, pattern});
            Logger::getInstance().error(name + ":" + std::to_string(lineNo) + ": banned pattern '" + pattern + "' found");
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error in file: " + name);
    }
    return found;
}

ScanResult Scanner::run(const fs::path& directory) const {
    auto files = listFiles(directory);

    std::ostringstream listing;
    listing << "Checking " << files.size() << " file(s): [";
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) listing << ", ";
        listing << files[i].u8string();
    }
    listing << "]";
    Logger::getInstance().info(listing.str());

    ScanResult result;
    for (const auto& f : files) {
        auto found = scanFile(f);
        result.violations.insert(result.violations.end(), found.begin(), found.end());
        ++result.filesChecked;
    }

    if (result.failed()) {
        size_t dirty = 0;
        std::string lastFile;
        for (const auto& v : result.violations) {
            if (v.file != lastFile) ++dirty;
            lastFile = v.file;
        }
        Logger::getInstance().error(std::to_string(result.violations.size()) + " violation(s) in " +
                                    std::to_string(dirty) + " file(s)");
    } else {
        Logger::getInstance().success("No banned patterns found in " + std::to_string(result.filesChecked) + " file(s)");
    }
    if (Logger::getInstance().isDebug()) {
        Logger::getInstance().debug(result.toJson().dump(2));
    }
    return result;
}
