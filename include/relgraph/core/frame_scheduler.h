#ifndef RELGRAPH_CORE_FRAME_SCHEDULER_H
#define RELGRAPH_CORE_FRAME_SCHEDULER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace relgraph {
namespace core {

/**
 * @brief Per-frame callback registry driven by the host loop.
 *
 * The GUI host calls RunFrame once per rendered frame; tests call it by hand
 * to advance time. Callbacks may unsubscribe themselves or others while a
 * frame runs. A callback removed mid-frame is not invoked later in that
 * frame, and one added mid-frame first runs on the next frame.
 */
class FrameScheduler {
public:
    using SubscriptionId = std::uint64_t;
    using FrameCallback = std::function<void(double now_seconds)>;

    static constexpr SubscriptionId kInvalidSubscription = 0;

    FrameScheduler() = default;
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    SubscriptionId Subscribe(FrameCallback callback);

    // Returns false when the id is unknown or already removed.
    bool Unsubscribe(SubscriptionId id);

    bool IsSubscribed(SubscriptionId id) const { return callbacks_.count(id) != 0; }

    void RunFrame(double now_seconds);

    std::size_t active_count() const { return callbacks_.size(); }
    std::uint64_t frame_count() const { return frame_count_; }

private:
    std::map<SubscriptionId, FrameCallback> callbacks_;
    SubscriptionId next_id_ = 1;
    std::uint64_t frame_count_ = 0;
};

} // namespace core
} // namespace relgraph

#endif // RELGRAPH_CORE_FRAME_SCHEDULER_H
