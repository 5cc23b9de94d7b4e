#pragma once
#include "scan/Scanner.h"

// 进程退出码。I/O 或规则配置故障与“发现违规”区分开
enum class ExitStatus : int {
    Clean = 0,
    Violations = 1,
    Fault = 2
};

inline ExitStatus exitStatusFor(const ScanResult& result) {
    return result.failed() ? ExitStatus::Violations : ExitStatus::Clean;
}

inline int exitCodeFor(const ScanResult& result) {
    return static_cast<int>(exitStatusFor(result));
}
