#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "syncpoint/common/channel.h"
#include "syncpoint/common/logger.h"

namespace syncpoint {

/// Unbounded FIFO between a producer that must not fall behind (the OS
/// notification thread) and a slow consumer (stat and hash calls).
///
/// Elements are buffered in a chain of fixed-capacity segments. The filler
/// thread seals the current segment once it is half full and continues in a
/// segment twice as large; when a large segment is mostly idle it continues
/// in one half as large. The drainer thread empties sealed segments strictly
/// in the order they were created, so ordering is kept end to end.
///
/// Closing Input() seals the chain; Output() is closed after the last
/// buffered element has been delivered.
template <typename T>
class EventPipe {
public:
    explicit EventPipe(size_t capacity)
        : capacity_(std::max<size_t>(capacity, 1)),
          input_(capacity_),
          output_(capacity_) {
        filler_ = std::thread([this]() { Fill(); });
        drainer_ = std::thread([this]() { Drain(); });
    }

    /// Abandons whatever the consumer did not read.
    ~EventPipe() {
        input_.Close();
        if (filler_.joinable()) {
            filler_.join();
        }
        output_.Close();
        if (drainer_.joinable()) {
            drainer_.join();
        }
    }

    EventPipe(const EventPipe&) = delete;
    EventPipe& operator=(const EventPipe&) = delete;
    EventPipe(EventPipe&&) = delete;
    EventPipe& operator=(EventPipe&&) = delete;

    Channel<T>& Input() { return input_; }
    Channel<T>& Output() { return output_; }

    size_t InitialCapacity() const { return capacity_; }

    // Segments allocated so far
    size_t SegmentCount() const { return segment_count_.load(); }

    // Capacity of the segment currently being filled
    size_t CurrentSegmentCapacity() const { return current_capacity_.load(); }

    // Largest segment allocated so far
    size_t PeakSegmentCapacity() const { return peak_capacity_.load(); }

    // Times the filler continued in a smaller segment
    size_t ShrinkCount() const { return shrink_count_.load(); }

private:
    using Segment = Channel<T>;

    std::shared_ptr<Segment> NewSegment(size_t capacity) {
        auto segment = std::make_shared<Segment>(std::max<size_t>(capacity, 1));
        segment_count_.fetch_add(1);
        current_capacity_.store(segment->Capacity());
        if (segment->Capacity() > peak_capacity_.load()) {
            peak_capacity_.store(segment->Capacity());
        }
        segments_.Send(segment);
        return segment;
    }

    void Fill() {
        auto current = NewSegment(capacity_);

        while (auto element = input_.Receive()) {
            const size_t length = current->Size();
            const size_t capacity = current->Capacity();

            if (length >= capacity / 2) {
                // Half full: continue in a segment twice as large
                current->Close();
                LOG_DEBUG("[EventPipe] Growing segment to " + std::to_string(capacity * 2));
                current = NewSegment(capacity * 2);
            } else if (length >= capacity_ && length <= capacity / 4) {
                // Large segment, low utilization: continue in one half as large
                current->Close();
                LOG_DEBUG("[EventPipe] Shrinking segment to " + std::to_string(capacity / 2));
                shrink_count_.fetch_add(1);
                current = NewSegment(capacity / 2);
            }

            // Fill never exceeds half the capacity, this never blocks.
            current->Send(std::move(*element));
        }

        current->Close();
        segments_.Close();
    }

    void Drain() {
        while (auto segment = segments_.Receive()) {
            while (auto element = (*segment)->Receive()) {
                if (!output_.Send(std::move(*element))) {
                    return;
                }
            }
        }
        output_.Close();
    }

    const size_t capacity_;
    Channel<T> input_;
    Channel<T> output_;

    // Sealed and current segments in creation order
    Channel<std::shared_ptr<Segment>> segments_;

    std::atomic<size_t> segment_count_{0};
    std::atomic<size_t> current_capacity_{0};
    std::atomic<size_t> peak_capacity_{0};
    std::atomic<size_t> shrink_count_{0};

    std::thread filler_;
    std::thread drainer_;
};

}  // namespace syncpoint
