#pragma once

#include "core/utils.hpp"
#include "model/transfer.hpp"
#include "repository/repository_executor.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace paydb {

class DatabaseHandle;

/**
 * @brief Payout transfers (payout_maindb)
 */
class ITransferRepository {
public:
    virtual ~ITransferRepository() = default;

    /**
     * @brief Insert a transfer, stamping created_at with the current UTC time
     */
    [[nodiscard]] virtual Transfer create_transfer(const TransferCreate& data) = 0;

    /**
     * @brief Replica lookup; may lag a just-committed write
     */
    [[nodiscard]] virtual std::optional<Transfer> get_transfer_by_id(int64_t transfer_id) = 0;

    /**
     * @brief Master lookup of several transfers; empty input -> empty result, no round trip
     */
    [[nodiscard]] virtual std::vector<Transfer> get_transfers_by_ids(
        const std::vector<int64_t>& transfer_ids) = 0;

    /**
     * @brief Ids of transfers submitted at or after start_time with the given method, ascending
     */
    [[nodiscard]] virtual std::vector<int64_t> get_transfers_by_submitted_at_and_method(
        utils::Timestamp start_time, std::string_view method = transfer_methods::kStripe) = 0;

    [[nodiscard]] virtual std::optional<Transfer> update_transfer_by_id(
        int64_t transfer_id, const TransferUpdate& data) = 0;
};

class TransferRepository final : public ITransferRepository {
public:
    explicit TransferRepository(const DatabaseHandle& main_db);

    [[nodiscard]] Transfer create_transfer(const TransferCreate& data) override;
    [[nodiscard]] std::optional<Transfer> get_transfer_by_id(int64_t transfer_id) override;
    [[nodiscard]] std::vector<Transfer> get_transfers_by_ids(
        const std::vector<int64_t>& transfer_ids) override;
    [[nodiscard]] std::vector<int64_t> get_transfers_by_submitted_at_and_method(
        utils::Timestamp start_time, std::string_view method = transfer_methods::kStripe) override;
    [[nodiscard]] std::optional<Transfer> update_transfer_by_id(
        int64_t transfer_id, const TransferUpdate& data) override;

private:
    RepositoryExecutor main_db_;
};

} // namespace paydb
