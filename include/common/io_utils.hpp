#pragma once

#include <filesystem>
#include <string>

namespace execjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，若文件已存在则覆盖
 * @throw std::system_error 当文件无法写入时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 文件名来自语言配置或外部协作者，这里确保计算目录时不会出现目录遍历。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 独占的临时目录
 * 构造时在 root 下创建一个新的、名字唯一的目录（mkdtemp），
 * 析构时递归删除该目录以及其中所有文件，无论评测正常结束、超时还是抛出异常。
 * 
 * 目录结构：
 * 
 * root
 * └── box-XXXXXX // 本次执行独占的目录
 *     ├── box // 选手程序的工作目录，包含源代码和编译产物
 *     └── io // 标准输入、标准输出、标准错误、runguard 的 meta 文件和日志
 */
struct scratch_directory {
    /**
     * @param root 存放所有临时目录的根目录，不存在时自动创建
     * @param keep 若为真，析构时不删除目录（DEBUG 模式下用于检查评测产生的文件）
     * @throw internal_execution_failure 当目录无法创建时
     */
    explicit scratch_directory(const std::filesystem::path &root, bool keep = false);
    scratch_directory(scratch_directory &&other);
    scratch_directory(const scratch_directory &) = delete;
    ~scratch_directory();

    scratch_directory &operator=(const scratch_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 选手程序的工作目录
     */
    std::filesystem::path box() const;

    /**
     * @brief 存放输入输出文件的目录，选手程序不会以此为工作目录
     */
    std::filesystem::path io() const;

    /**
     * @brief 立刻删除目录，之后 path() 为空
     */
    void release();

private:
    std::filesystem::path dir;
    bool keep;
};

}  // namespace execjudge
