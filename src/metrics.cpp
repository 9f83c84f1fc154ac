#include "voice_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_bridge {

namespace {

void write_counter(std::ostringstream& out, const char* name, const char* help,
                   uint64_t value) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 2.5, 5.0,
                         7.5, 10.0, 30.0, 60.0};
    backend_query_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::session_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_started_;
    ++sessions_active_;
}

void Metrics::session_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_active_ > 0) {
        --sessions_active_;
    }
}

void Metrics::increment_frames_forwarded() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++frames_forwarded_;
}

void Metrics::add_frames_played(std::size_t frames) {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_played_ += frames;
}

void Metrics::increment_ai_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++ai_errors_;
}

void Metrics::increment_chat_processed() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++chat_processed_;
}

void Metrics::increment_chat_duplicate() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++chat_duplicates_;
}

void Metrics::observe_backend_query(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_query_.count += 1;
    backend_query_.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            backend_query_.buckets[i] += 1;
        }
    }
    backend_query_.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    write_counter(out, "media_sessions_started_total",
                  "Total number of media relay sessions started", sessions_started_);

    out << "# HELP media_sessions_active Media relay sessions currently running\n";
    out << "# TYPE media_sessions_active gauge\n";
    out << "media_sessions_active " << sessions_active_ << "\n";

    write_counter(out, "media_frames_forwarded_total",
                  "Audio frames forwarded to the AI endpoint", frames_forwarded_);
    write_counter(out, "media_frames_played_total",
                  "Audio frames played back to telephony", frames_played_);
    write_counter(out, "ai_error_events_total",
                  "Error events received from the AI endpoint", ai_errors_);
    write_counter(out, "chat_messages_processed_total",
                  "Chat messages answered through the backend", chat_processed_);
    write_counter(out, "chat_messages_duplicate_total",
                  "Chat messages dropped as duplicates", chat_duplicates_);

    out << "# HELP backend_query_seconds Backend query latency in seconds\n";
    out << "# TYPE backend_query_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "backend_query_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << backend_query_.buckets[i] << "\n";
    }
    out << "backend_query_seconds_bucket{le=\"+Inf\"} " << backend_query_.buckets.back()
        << "\n";
    out << "backend_query_seconds_count " << backend_query_.count << "\n";
    out << "backend_query_seconds_sum " << backend_query_.sum << "\n";

    return out.str();
}

}
