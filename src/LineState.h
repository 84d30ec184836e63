#ifndef LINE_STATE_H
#define LINE_STATE_H

#include "BoundedBuffer.h"
#include "Config.h"
#include "RunState.h"
#include "StatsCollector.h"

/**
 * Everything the workers of one run share. Each part has its own lock and
 * no worker ever holds two of them at once.
*/
struct LineState {
    explicit LineState(const LineConfig& cfg)
        : config(cfg),
          buffer(cfg.bufferCapacity),
          run(cfg.totalTimesteps),
          stats(cfg.snapshotInterval()) {}

    const LineConfig config;
    BoundedBuffer buffer;
    RunState run;
    StatsCollector stats;
};

#endif
