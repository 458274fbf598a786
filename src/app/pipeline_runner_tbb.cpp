#include <archgraph/app/pipeline_runner_tbb.hpp>

#ifdef ARCHGRAPH_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace archgraph::app {

void run_pipeline_batch_tbb(core::Pipeline& pipeline,
                            const std::vector<core::FloorplanInput>& floorplans,
                            SceneResultCallback callback,
                            ConversionErrorCallback on_error) {
  if (floorplans.empty() || (!callback && !on_error)) return;

  const std::size_t n = floorplans.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&pipeline, &floorplans, &callback, &on_error](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = pipeline.run(floorplans[i]);
          if (result) {
            if (callback) callback(i, *result);
          } else if (on_error) {
            on_error(i, result.error());
          }
        }
      });
}

}  // namespace archgraph::app

#endif  // ARCHGRAPH_HAS_TBB
