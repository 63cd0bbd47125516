#pragma once
#include <filesystem>
#include <string>

/**
 * @brief 作用域临时文件
 *
 * 构造时只生成唯一路径 (不创建文件), 析构时删除。
 * 任何退出路径 (包括异常) 都会释放。
 */
class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::string& prefix, const std::string& extension = ".txt");
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& path() const { return filePath; }
    std::string string() const { return filePath.u8string(); }

    bool exists() const;

    // 读取全部内容, 去掉 UTF-8 BOM 与首尾空白
    std::string readTrimmed() const;

private:
    std::filesystem::path filePath;
};
