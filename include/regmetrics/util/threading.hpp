/**
 * Cancellation and progress helpers shared by the conversion and history runs.
 */

#pragma once

#include <atomic>
#include <cstddef>

namespace regmetrics {

/**
 * Cooperative cancellation flag. Workers poll it between units of work;
 * a unit already in progress always runs to completion.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_;
};

/**
 * Counts finished units and reports whether a progress line is due
 * (every `report_every` completions and on the last one).
 */
class ProgressTracker {
public:
    explicit ProgressTracker(size_t total_tasks, size_t report_every = 50)
        : total_(total_tasks), report_every_(report_every == 0 ? 1 : report_every), completed_(0) {}

    // Returns the new completed count
    size_t increment() {
        return completed_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    bool should_report(size_t completed) const {
        return completed == total_ || completed % report_every_ == 0;
    }

    size_t total() const { return total_; }

private:
    size_t total_;
    size_t report_every_;
    std::atomic<size_t> completed_;
};

} // namespace regmetrics
