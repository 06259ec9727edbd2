#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <stdexcept>

/**
 * @brief 资源访问失败 (未知 URI scheme、资源不存在)
 */
class ResourceError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        AccessDenied
    };

    ResourceError(Kind kind, const std::string& uri, const std::string& what)
        : std::runtime_error(what), kind(kind), uri(uri) {}

    Kind getKind() const { return kind; }
    const std::string& getUri() const { return uri; }

private:
    Kind kind;
    std::string uri;
};

/**
 * @brief 进程内资源存储
 *
 * 只支持 memory://<key>。所有操作都在同一把锁下完成,
 * 多个工具线程可以同时持有同一个 ResourceManager。
 */
class ResourceManager {
public:
    static constexpr const char* MEMORY_SCHEME = "memory://";

    ResourceManager() = default;

    /**
     * @throws ResourceError 资源不存在或 scheme 不支持
     */
    std::string read(const std::string& uri) const;

    void write(const std::string& uri, const std::string& content);
    void append(const std::string& uri, const std::string& content);

    /**
     * @return 资源原本是否存在
     */
    bool remove(const std::string& uri);

    bool exists(const std::string& uri) const;

    /**
     * @brief 列出全部资源 URI (按字典序)
     */
    std::vector<std::string> list() const;

private:
    std::map<std::string, std::string> buffers;
    mutable std::mutex mtx;

    static std::string keyOf(const std::string& uri);
};
