#include "core/Gate.h"
#include "core/ExitStatus.h"
#include "scan/Scanner.h"
#include "utils/Logger.h"
#include <exception>
#include <string>

static int reportFault(const std::exception& e) {
    Logger::getInstance().error("FATAL ERROR: " + std::string(e.what()));
    return static_cast<int>(ExitStatus::Fault);
}

int runGate(const GateConfig& cfg) {
    // 任何异常都发生在 ScanResult 生成之前
    try {
        Scanner scanner(cfg.bannedPatterns, cfg.suppressionMarker);
        ScanResult result = scanner.run(fs::u8path(cfg.scanDirectory));
        return exitCodeFor(result);
    } catch (const std::exception& e) {
        return reportFault(e);
    }
}

int runGate() {
    GateConfig cfg;
    try {
        cfg = GateConfig::builtin();
    } catch (const std::exception& e) {
        return reportFault(e);
    }
    return runGate(cfg);
}
