// === Cache Metrics Recorder ==================================================
//
// Seam towards the application's performance monitor. The engine reports one
// event per classified request; partial hits count as hits because cached
// data was served.

#pragma once

#include <memory>

namespace region_dedup {

class CacheMetricsRecorder {
  public:
    virtual ~CacheMetricsRecorder() = default;

    virtual void record_cache_hit() = 0;
    virtual void record_cache_miss() = 0;
};

using CacheMetricsRecorderPtr = std::shared_ptr<CacheMetricsRecorder>;

}  // namespace region_dedup
