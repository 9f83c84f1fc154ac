#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void session_started();
    void session_finished();
    void increment_frames_forwarded();
    void add_frames_played(std::size_t frames);
    void increment_ai_error();
    void increment_chat_processed();
    void increment_chat_duplicate();
    void observe_backend_query(double seconds);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    uint64_t sessions_started_ = 0;
    int64_t sessions_active_ = 0;
    uint64_t frames_forwarded_ = 0;
    uint64_t frames_played_ = 0;
    uint64_t ai_errors_ = 0;
    uint64_t chat_processed_ = 0;
    uint64_t chat_duplicates_ = 0;
    HistogramSeries backend_query_;
    std::vector<double> histogram_bounds_;
};

}
