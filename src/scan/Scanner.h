#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct Violation {
    std::string file;
    int line = 0;
    std::string pattern;
};

/**
 * @brief 一次扫描的完整结果
 *
 * violations 按发现顺序排列（文件枚举顺序 -> 行号 -> 规则顺序），不去重、不排序。
 */
struct ScanResult {
    std::vector<Violation> violations;
    size_t filesChecked = 0;

    bool failed() const { return !violations.empty(); }

    // {"failed", "count", "violations": [{"file", "line", "pattern"}]}
    nlohmann::json toJson() const;
};

/**
 * @brief 禁用模式扫描器
 *
 * 只做字面子串包含判断，不做分词或词边界匹配。
 * 任意 I/O 失败都抛出 std::runtime_error 并终止扫描；命中规则永远不会抛出。
 */
class Scanner {
public:
    Scanner(std::vector<std::string> bannedPatterns, std::string suppressionMarker);

    /**
     * @brief 列出目录下的条目（不递归）
     * @return 文件系统迭代顺序，不保证有序
     * @throws std::runtime_error 目录不存在或不是目录
     */
    std::vector<fs::path> listFiles(const fs::path& directory) const;

    /**
     * @brief 逐行扫描单个文件
     *
     * 含抑制标记的行整行跳过；否则每个命中的规则各产生一条 Violation，
     * 同一规则在一行中出现多次只计一次。每条违规在发现时立即输出。
     * @throws std::runtime_error 条目不是普通文件、无法打开或读取失败
     */
    std::vector<Violation> scanFile(const fs::path& file) const;

    // 先输出待检查文件列表，再按枚举顺序扫描全部文件
    ScanResult run(const fs::path& directory) const;

private:
    std::vector<std::string> bannedPatterns;
    std::string suppressionMarker;
};
