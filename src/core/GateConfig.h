#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * 内置门禁规则。规则随二进制一起编译，不从环境变量或配置文件读取。
 * 修改规则 = 修改此处并重新构建。
 */
static const char* const BUILTIN_GATE_RULES = R"json({
    "scan_directory": "src",
    "banned_patterns": ["unwrap(", "panic!("],
    "suppression_marker": "//#[allow_ci]"
})json";

struct GateConfig {
    std::string scanDirectory;
    std::vector<std::string> bannedPatterns;
    std::string suppressionMarker;

    static GateConfig parse(const std::string& content) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::string("JSON Parse Error in gate rules: ") + e.what());
        }

        GateConfig cfg;
        try {
            cfg.scanDirectory = j.at("scan_directory").get<std::string>();
            cfg.bannedPatterns = j.at("banned_patterns").get<std::vector<std::string>>();
            cfg.suppressionMarker = j.at("suppression_marker").get<std::string>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid gate rules: ") + e.what());
        }

        if (cfg.scanDirectory.empty()) {
            throw std::runtime_error("Invalid gate rules: scan_directory must be non-empty");
        }
        // 空串是任何行的子串，会让每一行都违规
        for (const auto& p : cfg.bannedPatterns) {
            if (p.empty()) {
                throw std::runtime_error("Invalid gate rules: banned pattern must be non-empty");
            }
        }
        if (cfg.suppressionMarker.empty()) {
            throw std::runtime_error("Invalid gate rules: suppression_marker must be non-empty");
        }
        return cfg;
    }

    static GateConfig builtin() {
        return parse(BUILTIN_GATE_RULES);
    }
};
