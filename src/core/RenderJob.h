#pragma once

#include "core/MixdownPlan.h"

#include <functional>
#include <string>

namespace deckmix {

enum class RenderStatus { queued, running, succeeded, failed };

const char* renderStatusName(RenderStatus status);

struct RenderJobState {
    RenderStatus status = RenderStatus::queued;
    double progress = 0.0;      // 0..1
    std::string outputUri;      // set once succeeded
    std::string message;        // failure detail from the service
};

/// External mixdown renderer. Implementations talk to whatever actually renders.
class RenderService {
public:
    virtual ~RenderService() = default;

    virtual bool submit(const MixdownPlan& plan, std::string& jobId, std::string& error) = 0;
    virtual bool poll(const std::string& jobId, RenderJobState& state, std::string& error) = 0;
};

struct RenderPollPolicy {
    int maxPolls = 20;
    int intervalMs = 500;
};

/// Submits a plan and polls it to a terminal state. No retries: any submit or
/// poll error, a failed job, or running out of polls ends the run.
class RenderJobRunner {
public:
    using ProgressCallback = std::function<void(double progress)>;
    using SleepFunction = std::function<void(int ms)>;

    explicit RenderJobRunner(RenderService& service, const RenderPollPolicy& policy = {});

    void onProgress(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    /// Replaces juce::Thread::sleep between polls (tests pass a no-op).
    void setSleepFunction(SleepFunction sleep) { sleep_ = std::move(sleep); }

    /// Blocks until the job finishes. Returns true with `outputUri` on success.
    bool run(const MixdownPlan& plan, std::string& outputUri, std::string& error);

    int getPollCount() const { return polls_; }

private:
    RenderService& service_;
    RenderPollPolicy policy_;
    ProgressCallback progressCallback_;
    SleepFunction sleep_;
    int polls_ = 0;
};

} // namespace deckmix
