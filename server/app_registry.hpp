// app_registry.hpp
#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "directory.hpp"

// appId -> Directory. Partitions are created on first bind and live as long
// as the registry.
class AppRegistry {
public:
    std::shared_ptr<Directory> get_app(const std::string& app_id);
    std::size_t app_count() const;

private:
    mutable std::mutex apps_mutex_;
    std::map<std::string, std::shared_ptr<Directory>> apps_;
};
