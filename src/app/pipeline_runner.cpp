#include <archgraph/app/pipeline_runner.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace archgraph::app {

std::expected<core::SceneResult, core::ConversionError>
run_pipeline(core::Pipeline& pipeline,
             const core::FloorplanInput& floorplan,
             StageTimingCallback* timing_cb) {
  return pipeline.run(floorplan, timing_cb);
}

void run_pipeline_batch(core::Pipeline& pipeline,
                        const std::vector<core::FloorplanInput>& floorplans,
                        SceneResultCallback callback,
                        ConversionErrorCallback on_error) {
  for (std::size_t i = 0; i < floorplans.size(); ++i) {
    auto result = pipeline.run(floorplans[i]);
    if (result) {
      if (callback) callback(i, *result);
    } else if (on_error) {
      on_error(i, result.error());
    }
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_pipeline_batch_parallel(
    core::Pipeline& pipeline,
    const std::vector<core::FloorplanInput>& floorplans,
    SceneResultCallback callback,
    std::size_t num_workers,
    ConversionErrorCallback on_error) {
  const std::size_t n = floorplans.size();
  if (n == 0 || (!callback && !on_error)) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_pipeline_batch(pipeline, floorplans, std::move(callback), std::move(on_error));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::atomic<bool> producer_done{false};

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::unique_lock lock(queue_mutex);
        queue_cv.wait(lock, [&]() {
          return producer_done.load() || !index_queue.empty();
        });
        if (producer_done.load() && index_queue.empty()) break;
        if (index_queue.empty()) continue;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = pipeline.run(floorplans[idx]);
      if (result) {
        if (callback) callback(idx, *result);
      } else if (on_error) {
        on_error(idx, result.error());
      }
    }
  };

  producer_done = true;
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  queue_cv.notify_all();

  for (auto& t : threads) {
    t.join();
  }
}

std::vector<std::string> batch_output_names(
    const std::vector<core::FloorplanInput>& floorplans) {
  std::map<std::string, std::size_t> count;
  for (const auto& plan : floorplans) ++count[plan.name];

  std::set<std::string> used;
  for (const auto& plan : floorplans) {
    if (count[plan.name] == 1) used.insert(plan.name);
  }

  std::vector<std::string> names;
  names.reserve(floorplans.size());
  for (std::size_t i = 0; i < floorplans.size(); ++i) {
    std::string name = floorplans[i].name;
    if (count[name] > 1) {
      do {
        name += "_" + std::to_string(i);
      } while (!used.insert(name).second);
    }
    names.push_back(std::move(name));
  }
  return names;
}

}  // namespace archgraph::app
