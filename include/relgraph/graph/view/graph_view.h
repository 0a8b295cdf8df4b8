#ifndef RELGRAPH_GRAPH_VIEW_GRAPH_VIEW_H
#define RELGRAPH_GRAPH_VIEW_GRAPH_VIEW_H

#include <relgraph/core/frame_scheduler.h>
#include <relgraph/graph/layout/force_simulation.h>
#include <relgraph/graph/model/graph_model.h>
#include <relgraph/graph/view/graph_source.h>
#include <relgraph/graph/view/interaction_controller.h>
#include <relgraph/graph/view/view_transform.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace relgraph {
namespace graph {

struct GraphViewOptions {
    LinkPolicy link_policy = LinkPolicy::kDrop;
    SimulationParams simulation;
    ViewSettings view;
    bool synchronous_fetch = false; // Fetch on the calling thread (tests, headless hosts)
};

/**
 * @brief Owns one graph view's lifecycle: fetch, rebuild, simulate, tear down.
 *
 * Every public method must be called from the frame thread. Fetches run on a
 * worker; their result is installed by Poll(), which the host calls once per
 * frame before FrameScheduler::RunFrame(). Only the newest fetch can install.
 */
class GraphView {
public:
    static constexpr const char* kLoadFailedMessage = "Failed to load relationship graph data. Please try again.";
    static constexpr const char* kUnauthorizedMessage = "Your session has expired. Please sign in again.";

    GraphView(std::shared_ptr<GraphSource> source, core::FrameScheduler& scheduler,
              const GraphViewOptions& options = GraphViewOptions());
    ~GraphView();

    GraphView(const GraphView&) = delete;
    GraphView& operator=(const GraphView&) = delete;

    // Mount, or switch to a different scope. Resets the view transform.
    void SetScope(const GraphScope& scope);

    // Re-fetch the current scope, keeping the view transform.
    void Refresh();

    // Install a finished fetch, if any. Call once per frame before ticks run.
    void Poll();

    // Stop the simulation and abandon any fetch. The view can be mounted again.
    void Unmount();

    bool is_mounted() const { return scope_.has_value(); }
    const std::optional<GraphScope>& scope() const { return scope_; }
    bool IsLoading() const { return loading_; }
    const std::string& error() const { return error_; }
    void DismissError() { error_.clear(); }

    // "Showing N entities with M relationships" or "No graph data available".
    std::string StatusLine() const;

    ForceSimulation* simulation() { return simulation_.get(); }
    const ForceSimulation* simulation() const { return simulation_.get(); }
    InteractionController& interaction() { return interaction_; }
    const InteractionController& interaction() const { return interaction_; }
    ViewTransform& transform() { return transform_; }
    const ViewTransform& transform() const { return transform_; }

    std::uint64_t generation() const { return generation_; }

private:
    struct FetchResult {
        std::optional<GraphData> data;
        std::string message;     // User-facing, set on failure
        std::string detail;      // Logged on failure
    };

    // Shared between the frame thread and one worker.
    struct FetchTask {
        std::uint64_t generation = 0;
        bool reset_view = false;
        std::mutex mutex;
        std::optional<FetchResult> result;
        std::atomic<bool> done{false};
    };

    struct Worker {
        std::shared_ptr<FetchTask> task;
        std::jthread thread;
    };

    static FetchResult RunFetch(GraphSource& source, const GraphScope& scope, std::stop_token stop);

    void StartFetch(bool reset_view);
    void CancelFetch();
    void ReapWorkers();
    void Install(FetchTask& task, FetchResult result);
    void ReplaceSimulation(GraphModel model);

    std::shared_ptr<GraphSource> source_;
    core::FrameScheduler& scheduler_;
    GraphViewOptions options_;

    ViewTransform transform_;
    InteractionController interaction_;
    std::unique_ptr<ForceSimulation> simulation_;

    std::optional<GraphScope> scope_;
    bool loading_ = false;
    std::string error_;
    std::uint64_t generation_ = 0;

    std::shared_ptr<FetchTask> current_task_;
    std::vector<Worker> workers_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_VIEW_GRAPH_VIEW_H
