#pragma once

#include "client/ireplica_client.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace logfanout {

/**
 * @brief Pull-based sequence of log entries
 *
 * next() must return true before at()/labels() are valid. Once next()
 * returns false the iterator is exhausted; has_error() tells a failed stream
 * from a finished one.
 */
class EntryIterator {
public:
    virtual ~EntryIterator() = default;

    virtual bool next() = 0;
    [[nodiscard]] virtual const LogEntry& at() const = 0;
    [[nodiscard]] virtual const std::string& labels() const = 0;
    [[nodiscard]] virtual uint64_t stream_hash() const = 0;

    [[nodiscard]] virtual bool has_error() const = 0;
    [[nodiscard]] virtual const Error& error() const = 0;
    virtual void close() = 0;
};

class SampleIterator {
public:
    virtual ~SampleIterator() = default;

    virtual bool next() = 0;
    [[nodiscard]] virtual const Sample& at() const = 0;
    [[nodiscard]] virtual const std::string& labels() const = 0;
    [[nodiscard]] virtual uint64_t stream_hash() const = 0;

    [[nodiscard]] virtual bool has_error() const = 0;
    [[nodiscard]] virtual const Error& error() const = 0;
    virtual void close() = 0;
};

/**
 * @brief Lazily drains one ingester's query stream
 *
 * A batch is received only when the previous one is consumed. Entries of a
 * batch are yielded in timestamp order for the requested direction; ordering
 * across batches and replicas is left to the caller's merge.
 */
class QueryClientIterator : public EntryIterator {
public:
    QueryClientIterator(std::shared_ptr<IQueryStream> stream, Direction direction);
    ~QueryClientIterator() override;

    bool next() override;
    [[nodiscard]] const LogEntry& at() const override;
    [[nodiscard]] const std::string& labels() const override;
    [[nodiscard]] uint64_t stream_hash() const override;

    [[nodiscard]] bool has_error() const override { return error_.category != ErrorCategory::NONE; }
    [[nodiscard]] const Error& error() const override { return error_; }
    void close() override;

private:
    struct Item {
        const LogStream* stream;
        const LogEntry* entry;
    };

    bool load_batch();

    std::shared_ptr<IQueryStream> stream_;
    Direction direction_;
    QueryResponse batch_;
    std::vector<Item> items_;
    size_t pos_ = 0;
    bool started_ = false;
    bool closed_ = false;
    Error error_;
};

/**
 * @brief Lazily drains one ingester's sample stream, samples in ascending time
 */
class SampleQueryClientIterator : public SampleIterator {
public:
    explicit SampleQueryClientIterator(std::shared_ptr<ISampleStream> stream);
    ~SampleQueryClientIterator() override;

    bool next() override;
    [[nodiscard]] const Sample& at() const override;
    [[nodiscard]] const std::string& labels() const override;
    [[nodiscard]] uint64_t stream_hash() const override;

    [[nodiscard]] bool has_error() const override { return error_.category != ErrorCategory::NONE; }
    [[nodiscard]] const Error& error() const override { return error_; }
    void close() override;

private:
    struct Item {
        const SampleSeries* series;
        const Sample* sample;
    };

    bool load_batch();

    std::shared_ptr<ISampleStream> stream_;
    SampleQueryResponse batch_;
    std::vector<Item> items_;
    size_t pos_ = 0;
    bool started_ = false;
    bool closed_ = false;
    Error error_;
};

} // namespace logfanout
