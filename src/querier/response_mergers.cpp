#include "querier/response_mergers.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace logfanout {

IndexStats merge_stats(const std::vector<IndexStats>& responses) {
    IndexStats merged;
    for (const auto& s : responses) {
        merged.streams += s.streams;
        merged.chunks += s.chunks;
        merged.bytes += s.bytes;
        merged.entries += s.entries;
    }
    return merged;
}

VolumeResponse merge_volumes(const std::vector<VolumeResponse>& responses, int32_t limit) {
    std::unordered_map<std::string, uint64_t> by_name;
    for (const auto& response : responses) {
        for (const auto& v : response.volumes) {
            by_name[v.name] += v.volume;
        }
    }

    std::vector<Volume> volumes;
    volumes.reserve(by_name.size());
    for (auto& [name, volume] : by_name) {
        volumes.push_back(Volume{name, volume});
    }

    std::sort(volumes.begin(), volumes.end(), [](const Volume& a, const Volume& b) {
        if (a.volume == b.volume) return a.name < b.name;
        return a.volume > b.volume;
    });

    const size_t keep = limit > 0 ? static_cast<size_t>(limit) : 0;
    if (volumes.size() > keep) {
        volumes.resize(keep);
    }

    VolumeResponse merged;
    merged.volumes = std::move(volumes);
    merged.limit = limit;
    return merged;
}

LabelToValuesResponse merge_detected_labels(
    const std::vector<std::shared_ptr<LabelToValuesResponse>>& responses) {

    LabelToValuesResponse merged;
    for (const auto& response : responses) {
        if (!response) continue;

        for (const auto& [label, values] : response->labels) {
            auto& combined = merged.labels[label];
            combined.insert(combined.end(), values.begin(), values.end());
        }
    }

    // Dedupe across ingesters
    for (auto& [_, values] : merged.labels) {
        std::sort(values.begin(), values.end());
        values.erase(std::unique(values.begin(), values.end()), values.end());
    }
    return merged;
}

} // namespace logfanout
