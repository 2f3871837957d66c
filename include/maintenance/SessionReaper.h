#pragma once
#include "ingest/ingest_pipeline.hpp"
#include "maintenance/PeriodicWorker.h"

namespace chunkvault {

/** Periodically expires stalled upload sessions. */
class SessionReaper : public PeriodicWorker {
public:
    SessionReaper(IngestPipeline& pipeline,
                  std::chrono::seconds tick = std::chrono::seconds(60))
        : PeriodicWorker("SessionReaper", tick), pipeline_(pipeline) {}
    ~SessionReaper() override { stop(); }

protected:
    void runPass() override { pipeline_.reapExpired(SystemClock::now()); }

private:
    IngestPipeline& pipeline_;
};

} // namespace chunkvault
