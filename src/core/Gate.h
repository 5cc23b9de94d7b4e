#pragma once
#include "core/GateConfig.h"

/**
 * @brief 执行一次完整的门禁检查并返回进程退出码
 *
 * scanDirectory 为相对路径时相对于当前工作目录解析。
 * 任何 I/O 或规则配置异常都在此捕获并记录，返回 ExitStatus::Fault。
 */
int runGate(const GateConfig& cfg);

// 使用内置规则
int runGate();
