#include <relgraph/core/frame_scheduler.h>
#include <utility>
#include <vector>

namespace relgraph {
namespace core {

FrameScheduler::SubscriptionId FrameScheduler::Subscribe(FrameCallback callback) {
    if (!callback) return kInvalidSubscription;
    SubscriptionId id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

bool FrameScheduler::Unsubscribe(SubscriptionId id) {
    return callbacks_.erase(id) != 0;
}

void FrameScheduler::RunFrame(double now_seconds) {
    ++frame_count_;

    std::vector<SubscriptionId> ids;
    ids.reserve(callbacks_.size());
    for (const auto& entry : callbacks_) {
        ids.push_back(entry.first);
    }

    for (SubscriptionId id : ids) {
        auto it = callbacks_.find(id);
        if (it == callbacks_.end()) continue;
        // Run a copy: the callback may erase its own entry.
        FrameCallback callback = it->second;
        callback(now_seconds);
    }
}

} // namespace core
} // namespace relgraph
