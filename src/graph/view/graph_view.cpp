#include <relgraph/graph/view/graph_view.h>
#include <relgraph/net/fetch_error.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace relgraph {
namespace graph {

GraphView::GraphView(std::shared_ptr<GraphSource> source, core::FrameScheduler& scheduler,
                     const GraphViewOptions& options)
    : source_(std::move(source)),
      scheduler_(scheduler),
      options_(options),
      transform_(options.view),
      interaction_(transform_) {
    if (!source_) {
        throw std::invalid_argument("GraphView requires a graph source");
    }
}

GraphView::~GraphView() {
    Unmount();
}

void GraphView::SetScope(const GraphScope& scope) {
    bool changed = !scope_ || *scope_ != scope;
    scope_ = scope;
    StartFetch(changed);
}

void GraphView::Refresh() {
    if (!scope_) return;
    StartFetch(false);
}

GraphView::FetchResult GraphView::RunFetch(GraphSource& source, const GraphScope& scope, std::stop_token stop) {
    FetchResult result;
    try {
        result.data = source.FetchGraph(scope, stop);
    } catch (const net::FetchError& e) {
        result.message = e.is_unauthorized() ? kUnauthorizedMessage : kLoadFailedMessage;
        result.detail = e.what();
    } catch (const std::exception& e) {
        result.message = kLoadFailedMessage;
        result.detail = e.what();
    }
    return result;
}

void GraphView::StartFetch(bool reset_view) {
    CancelFetch();
    ReapWorkers();

    ++generation_;
    loading_ = true;
    error_.clear();

    auto task = std::make_shared<FetchTask>();
    task->generation = generation_;
    task->reset_view = reset_view;
    current_task_ = task;

    if (options_.synchronous_fetch) {
        FetchResult result = RunFetch(*source_, *scope_, std::stop_token());
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            task->result = std::move(result);
        }
        task->done = true;
        return;
    }

    std::shared_ptr<GraphSource> source = source_;
    GraphScope scope = *scope_;
    Worker worker;
    worker.task = task;
    worker.thread = std::jthread([source, scope, task](std::stop_token stop) {
        FetchResult result = RunFetch(*source, scope, stop);
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            task->result = std::move(result);
        }
        task->done = true;
    });
    workers_.push_back(std::move(worker));
}

void GraphView::CancelFetch() {
    if (!current_task_) return;
    for (auto& worker : workers_) {
        if (worker.task == current_task_) {
            worker.thread.request_stop();
        }
    }
    current_task_.reset();
}

void GraphView::ReapWorkers() {
    // A finished worker joins immediately; unfinished ones stay until they notice the stop request.
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
                                  [](const Worker& worker) { return worker.task->done.load(); }),
                   workers_.end());
}

void GraphView::Poll() {
    ReapWorkers();
    if (!current_task_ || !current_task_->done.load()) return;

    std::shared_ptr<FetchTask> task = std::move(current_task_);
    FetchResult result;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (!task->result) return;
        result = std::move(*task->result);
        task->result.reset();
    }
    Install(*task, std::move(result));
}

void GraphView::Install(FetchTask& task, FetchResult result) {
    if (task.generation != generation_) return;
    loading_ = false;

    if (!result.data) {
        std::cerr << "Error: failed to load graph data: " << result.detail << std::endl;
        error_ = result.message;
        return;
    }

    GraphModel model;
    try {
        model = BuildModel(*result.data, options_.link_policy);
    } catch (const InvalidReferenceError& e) {
        std::cerr << "Error: rejected graph data: " << e.what() << std::endl;
        error_ = kLoadFailedMessage;
        return;
    }

    ReplaceSimulation(std::move(model));
    if (task.reset_view) {
        transform_.Reset();
    }
    error_.clear();
}

void GraphView::ReplaceSimulation(GraphModel model) {
    interaction_.Attach(nullptr);
    if (simulation_) {
        simulation_->Stop();
        simulation_.reset();
    }
    simulation_ = std::make_unique<ForceSimulation>(std::move(model), scheduler_, options_.simulation);
    interaction_.Attach(simulation_.get());
}

void GraphView::Unmount() {
    CancelFetch();
    for (auto& worker : workers_) {
        worker.thread.request_stop();
    }
    ++generation_;

    interaction_.Attach(nullptr);
    if (simulation_) {
        simulation_->Stop();
        simulation_.reset();
    }
    scope_.reset();
    loading_ = false;
    error_.clear();
}

std::string GraphView::StatusLine() const {
    if (!simulation_) {
        return "No graph data available";
    }
    const GraphModel& model = simulation_->model();
    return "Showing " + std::to_string(model.node_count()) + " entities with " +
           std::to_string(model.link_count()) + " relationships";
}

} // namespace graph
} // namespace relgraph
