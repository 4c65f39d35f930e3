#include "repository/repository_executor.hpp"
#include "core/utils.hpp"

namespace paydb {

const char* route_to_string(Route route) {
    switch (route) {
        case Route::MASTER:  return "master";
        case Route::REPLICA: return "replica";
        default:             return "unknown";
    }
}

QueryHandle RepositoryExecutor::pool(Route route) const {
    return route == Route::MASTER ? db_.master() : db_.replica();
}

std::optional<DbRow> RepositoryExecutor::fetch_one(
    const Statement& stmt, Route route, std::string_view op) const {
    utils::log::debug(std::format("[{}] {} on {}", db_.id(), op, route_to_string(route)));
    return pool(route).fetch_one(stmt, op);
}

std::vector<DbRow> RepositoryExecutor::fetch_all(
    const Statement& stmt, Route route, std::string_view op) const {
    utils::log::debug(std::format("[{}] {} on {}", db_.id(), op, route_to_string(route)));
    return pool(route).fetch_all(stmt, op);
}

} // namespace paydb
