#include "querier/query_iterators.hpp"

#include <algorithm>

namespace logfanout {

// ============================================================================
// QueryClientIterator
// ============================================================================

QueryClientIterator::QueryClientIterator(std::shared_ptr<IQueryStream> stream, Direction direction)
    : stream_(std::move(stream)), direction_(direction) {}

QueryClientIterator::~QueryClientIterator() {
    close();
}

bool QueryClientIterator::load_batch() {
    while (!closed_ && !has_error()) {
        auto received = stream_->recv();
        if (received.is_error()) {
            error_ = received.to_error();
            return false;
        }
        if (!received.value()) {
            close();
            return false;
        }

        batch_ = std::move(*received.value());
        items_.clear();
        pos_ = 0;
        for (const auto& s : batch_.streams) {
            for (const auto& e : s.entries) {
                items_.push_back(Item{&s, &e});
            }
        }
        if (items_.empty()) continue;  // Empty batch, keep pulling

        if (direction_ == Direction::FORWARD) {
            std::stable_sort(items_.begin(), items_.end(), [](const Item& a, const Item& b) {
                return a.entry->timestamp < b.entry->timestamp;
            });
        } else {
            std::stable_sort(items_.begin(), items_.end(), [](const Item& a, const Item& b) {
                return a.entry->timestamp > b.entry->timestamp;
            });
        }
        return true;
    }
    return false;
}

bool QueryClientIterator::next() {
    if (started_ && pos_ + 1 < items_.size()) {
        ++pos_;
        return true;
    }
    started_ = true;
    if (!load_batch()) {
        items_.clear();
        return false;
    }
    return true;
}

const LogEntry& QueryClientIterator::at() const {
    return *items_[pos_].entry;
}

const std::string& QueryClientIterator::labels() const {
    return items_[pos_].stream->labels;
}

uint64_t QueryClientIterator::stream_hash() const {
    return items_[pos_].stream->hash;
}

void QueryClientIterator::close() {
    if (closed_) return;
    closed_ = true;
    if (stream_) stream_->close_send();
}

// ============================================================================
// SampleQueryClientIterator
// ============================================================================

SampleQueryClientIterator::SampleQueryClientIterator(std::shared_ptr<ISampleStream> stream)
    : stream_(std::move(stream)) {}

SampleQueryClientIterator::~SampleQueryClientIterator() {
    close();
}

bool SampleQueryClientIterator::load_batch() {
    while (!closed_ && !has_error()) {
        auto received = stream_->recv();
        if (received.is_error()) {
            error_ = received.to_error();
            return false;
        }
        if (!received.value()) {
            close();
            return false;
        }

        batch_ = std::move(*received.value());
        items_.clear();
        pos_ = 0;
        for (const auto& s : batch_.series) {
            for (const auto& sample : s.samples) {
                items_.push_back(Item{&s, &sample});
            }
        }
        if (items_.empty()) continue;

        std::stable_sort(items_.begin(), items_.end(), [](const Item& a, const Item& b) {
            return a.sample->timestamp < b.sample->timestamp;
        });
        return true;
    }
    return false;
}

bool SampleQueryClientIterator::next() {
    if (started_ && pos_ + 1 < items_.size()) {
        ++pos_;
        return true;
    }
    started_ = true;
    if (!load_batch()) {
        items_.clear();
        return false;
    }
    return true;
}

const Sample& SampleQueryClientIterator::at() const {
    return *items_[pos_].sample;
}

const std::string& SampleQueryClientIterator::labels() const {
    return items_[pos_].series->labels;
}

uint64_t SampleQueryClientIterator::stream_hash() const {
    return items_[pos_].series->stream_hash;
}

void SampleQueryClientIterator::close() {
    if (closed_) return;
    closed_ = true;
    if (stream_) stream_->close_send();
}

} // namespace logfanout
