#pragma once
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol/Message.h"
#include "utils/Logger.h"

/**
 * @brief JSON-RPC 方法分发器
 *
 * 方法名 -> 处理函数的可变注册表。处理函数是引用计数的不可变闭包:
 * process() 在读锁下拷贝出 shared_ptr, 释放锁之后再调用,
 * 因此处理函数内部可以再注册或注销方法而不会死锁。
 */
class MethodDispatcher {
public:
    using Handler = std::function<Response(const Request&)>;

    explicit MethodDispatcher(std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief 注册方法, 同名则替换
     */
    void registerMethod(const std::string& name, Handler handler);

    /**
     * @return 方法原本是否存在
     */
    bool deregisterMethod(const std::string& name);

    bool hasMethod(const std::string& name) const;

    std::vector<std::string> listMethods() const;

    /**
     * @brief 校验 -> 查找 -> 同步调用
     *
     * 校验失败或方法不存在时返回错误响应, id 取请求的 id (没有则为 null)。
     * 处理函数抛出的 std::exception 转成 InternalError。
     */
    Response process(const Request& request) const;

    /**
     * @brief 文本入口: 解析、处理、序列化, 总是返回一个序列化后的响应
     */
    std::string processJson(const std::string& text) const;

private:
    std::unordered_map<std::string, std::shared_ptr<const Handler>> methods;
    mutable std::shared_mutex mtx;
    std::shared_ptr<Logger> logger;
};
