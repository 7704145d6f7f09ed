#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace judgebox {

/**
 * @brief 一次评测请求独占的工作目录
 * 记录所有写入的源代码和编译产物，离开作用域时删除它们，
 * 包括编译失败抛出异常的情况。DEBUG 模式下保留所有文件。
 */
class work_dir {
public:
    /**
     * @param root 工作目录，不存在时会被创建，之后所有路径都是绝对路径
     * @throw std::filesystem::filesystem_error 若无法创建工作目录
     */
    explicit work_dir(const std::filesystem::path &root);
    ~work_dir();

    work_dir(const work_dir &) = delete;
    work_dir &operator=(const work_dir &) = delete;

    const std::filesystem::path &root() const;

    /**
     * @brief 将 contents 写入工作目录下名为 name 的文件
     * @return 写入的文件路径
     * @throw std::system_error 若文件无法写入
     */
    std::filesystem::path write(const std::string &name, const std::string &contents);

    /**
     * @brief 登记一个将由外部命令产生的文件或目录
     * @return 产物在工作目录下的路径
     */
    std::filesystem::path artifact(const std::string &name);

    const std::vector<std::filesystem::path> &artifacts() const;

private:
    std::filesystem::path root_dir;
    std::vector<std::filesystem::path> created;
};

}  // namespace judgebox
