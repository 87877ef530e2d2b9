#include "result_sink.hpp"

namespace FontGrep {

StreamSink::StreamSink(std::ostream& out, size_t flushEvery)
    : m_out(out), m_flushEvery(flushEvery == 0 ? 1 : flushEvery) {}

StreamSink::~StreamSink() {
    flush();
}

void StreamSink::emit(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << path << '\n';
    if (++m_pending >= m_flushEvery) {
        m_out.flush();
        m_pending = 0;
    }
}

void StreamSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out.flush();
    m_pending = 0;
}

void CollectingSink::emit(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_results.push_back(path);
}

std::vector<std::string> CollectingSink::results() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_results;
}

} // namespace FontGrep
