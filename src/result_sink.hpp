/**
 * @file result_sink.hpp
 * @brief Destinations for matching font paths.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace FontGrep {

/**
 * @brief Receives matching paths; implementations are thread-safe.
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void emit(const std::string& path) = 0;
    virtual void flush() {}
};

/**
 * @brief Writes one path per line to a stream.
 *
 * The stream is flushed every flushEvery results and when the sink is
 * destroyed.
 */
class StreamSink : public ResultSink {
public:
    explicit StreamSink(std::ostream& out, size_t flushEvery = 64);
    ~StreamSink() override;

    StreamSink(const StreamSink&) = delete;
    StreamSink& operator=(const StreamSink&) = delete;

    void emit(const std::string& path) override;
    void flush() override;

private:
    std::ostream& m_out;
    size_t m_flushEvery;
    size_t m_pending = 0;
    std::mutex m_mutex;
};

/**
 * @brief Keeps results in memory, in emission order.
 */
class CollectingSink : public ResultSink {
public:
    void emit(const std::string& path) override;

    std::vector<std::string> results() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_results;
};

} // namespace FontGrep
