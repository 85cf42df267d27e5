#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace logfanout {

/**
 * @brief Field-wise sum of per-replica index statistics
 *
 * Associative and commutative; an empty input yields zero stats.
 */
[[nodiscard]] IndexStats merge_stats(const std::vector<IndexStats>& responses);

/**
 * @brief Top-K merge of per-replica volume responses
 *
 * Entries with the same series name are summed across replicas, then ranked
 * by volume descending (name ascending among equal volumes) and truncated to
 * limit. A non-positive limit yields no entries.
 */
[[nodiscard]] VolumeResponse merge_volumes(const std::vector<VolumeResponse>& responses,
                                           int32_t limit);

/**
 * @brief Per-label union of detected label values
 *
 * Values of each label come back sorted ascending and duplicate-free. Null
 * responses are skipped. Merging the result again with any of its inputs
 * gives the same result.
 */
[[nodiscard]] LabelToValuesResponse merge_detected_labels(
    const std::vector<std::shared_ptr<LabelToValuesResponse>>& responses);

} // namespace logfanout
