#include "db/replica_selector.hpp"
#include "core/utils.hpp"

#include <format>
#include <random>
#include <stdexcept>

namespace paydb {

const char* replica_selection_mode_to_string(ReplicaSelectionMode mode) {
    switch (mode) {
        case ReplicaSelectionMode::RANDOM: return "random";
        case ReplicaSelectionMode::PINNED: return "pinned";
        default:                           return "unknown";
    }
}

ReplicaSelector::ReplicaSelector(ReplicaSelectionMode mode, size_t pinned_index)
    : mode_(mode), pinned_index_(pinned_index) {}

ReplicaSelector ReplicaSelector::from_config(const ReplicaSelectionConfig& config) {
    return ReplicaSelector(config.mode, config.pinned_index);
}

std::optional<std::string> ReplicaSelector::select(const std::vector<std::string>& candidates) const {
    if (candidates.empty()) {
        utils::log::info("No alternative maindb replica configured, handles keep their own replica");
        return std::nullopt;
    }

    size_t index = 0;
    if (mode_ == ReplicaSelectionMode::PINNED) {
        if (pinned_index_ >= candidates.size()) {
            throw std::out_of_range(std::format(
                "pinned replica index {} out of range ({} candidates)",
                pinned_index_, candidates.size()));
        }
        index = pinned_index_;
    } else {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
        index = dist(gen);
    }

    utils::log::info(std::format("Selected alternative maindb replica {}/{} ({})",
        index + 1, candidates.size(), replica_selection_mode_to_string(mode_)));
    return candidates[index];
}

} // namespace paydb
