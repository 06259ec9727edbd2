#include "resources/ResourceManager.h"

std::string ResourceManager::keyOf(const std::string& uri) {
    const std::string scheme = MEMORY_SCHEME;
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        throw ResourceError(ResourceError::Kind::AccessDenied, uri, "Unsupported resource scheme: " + uri);
    }
    std::string key = uri.substr(scheme.size());
    if (key.empty()) {
        throw ResourceError(ResourceError::Kind::NotFound, uri, "Empty resource key: " + uri);
    }
    return key;
}

std::string ResourceManager::read(const std::string& uri) const {
    std::string key = keyOf(uri);
    std::lock_guard<std::mutex> lock(mtx);
    auto it = buffers.find(key);
    if (it == buffers.end()) {
        throw ResourceError(ResourceError::Kind::NotFound, uri, "Resource not found: " + uri);
    }
    return it->second;
}

void ResourceManager::write(const std::string& uri, const std::string& content) {
    std::string key = keyOf(uri);
    std::lock_guard<std::mutex> lock(mtx);
    buffers[key] = content;
}

void ResourceManager::append(const std::string& uri, const std::string& content) {
    std::string key = keyOf(uri);
    std::lock_guard<std::mutex> lock(mtx);
    buffers[key] += content;
}

bool ResourceManager::remove(const std::string& uri) {
    std::string key = keyOf(uri);
    std::lock_guard<std::mutex> lock(mtx);
    return buffers.erase(key) > 0;
}

bool ResourceManager::exists(const std::string& uri) const {
    std::string key = keyOf(uri);
    std::lock_guard<std::mutex> lock(mtx);
    return buffers.count(key) > 0;
}

std::vector<std::string> ResourceManager::list() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> uris;
    uris.reserve(buffers.size());
    for (const auto& [key, _] : buffers) {
        uris.push_back(MEMORY_SCHEME + key);
    }
    return uris;
}
