// app_registry.cpp
#include "app_registry.hpp"
#include "logger.hpp"

std::shared_ptr<Directory> AppRegistry::get_app(const std::string& app_id) {
    std::lock_guard<std::mutex> lk(apps_mutex_);
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        it = apps_.emplace(app_id, std::make_shared<Directory>(app_id)).first;
        Logger::instance().info("App directory created", { {"app", app_id}, {"apps", static_cast<uint64_t>(apps_.size())} });
    }
    return it->second;
}

std::size_t AppRegistry::app_count() const {
    std::lock_guard<std::mutex> lk(apps_mutex_);
    return apps_.size();
}
