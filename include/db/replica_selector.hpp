#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace paydb {

/**
 * @brief Picks the process-wide alternative replica for the maindb handles
 *
 * Called once while the context is built; the result is shared by every
 * handle created "with alternative replica", so all of them read from the
 * same endpoint for the lifetime of the process.
 *
 * RANDOM: uniform choice among the candidates.
 * PINNED: candidates[pinned_index], std::out_of_range if the index is past the end.
 */
class ReplicaSelector {
public:
    explicit ReplicaSelector(ReplicaSelectionMode mode = ReplicaSelectionMode::RANDOM,
                             size_t pinned_index = 0);

    [[nodiscard]] static ReplicaSelector from_config(const ReplicaSelectionConfig& config);

    /**
     * @return chosen endpoint, or std::nullopt ("no override") for an empty candidate list
     */
    [[nodiscard]] std::optional<std::string> select(const std::vector<std::string>& candidates) const;

    [[nodiscard]] ReplicaSelectionMode mode() const { return mode_; }

private:
    ReplicaSelectionMode mode_;
    size_t pinned_index_;
};

[[nodiscard]] const char* replica_selection_mode_to_string(ReplicaSelectionMode mode);

} // namespace paydb
