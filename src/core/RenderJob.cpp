#include "core/RenderJob.h"
#include "core/Logger.h"

#include <juce_core/juce_core.h>

namespace deckmix {

const char* renderStatusName(RenderStatus status)
{
    switch (status) {
        case RenderStatus::queued:    return "queued";
        case RenderStatus::running:   return "running";
        case RenderStatus::succeeded: return "succeeded";
        case RenderStatus::failed:    return "failed";
    }
    return "unknown";
}

RenderJobRunner::RenderJobRunner(RenderService& service, const RenderPollPolicy& policy)
    : service_(service),
      policy_(policy),
      sleep_([](int ms) { juce::Thread::sleep(ms); })
{
}

bool RenderJobRunner::run(const MixdownPlan& plan, std::string& outputUri, std::string& error)
{
    polls_ = 0;

    if (!isValidOutExt(plan.outExt))
    {
        error = "unsupported output format: " + plan.outExt;
        DM_WARN("RenderJobRunner: %s", error.c_str());
        return false;
    }

    std::string jobId;
    if (!service_.submit(plan, jobId, error))
    {
        DM_WARN("RenderJobRunner: submit failed: %s", error.c_str());
        return false;
    }
    DM_INFO("RenderJobRunner: submitted job %s (%d segments, %s)",
            jobId.c_str(), static_cast<int>(plan.segments.size()), plan.outExt.c_str());

    while (polls_ < policy_.maxPolls)
    {
        if (sleep_)
            sleep_(policy_.intervalMs);

        RenderJobState state;
        ++polls_;
        if (!service_.poll(jobId, state, error))
        {
            DM_WARN("RenderJobRunner: poll %d of job %s failed: %s",
                    polls_, jobId.c_str(), error.c_str());
            return false;
        }

        DM_DEBUG("RenderJobRunner: job %s %s %.0f%%", jobId.c_str(),
                 renderStatusName(state.status), state.progress * 100.0);
        if (progressCallback_)
            progressCallback_(juce::jlimit(0.0, 1.0, state.progress));

        if (state.status == RenderStatus::succeeded)
        {
            if (state.outputUri.empty())
            {
                error = "render job " + jobId + " succeeded without an output";
                DM_WARN("RenderJobRunner: %s", error.c_str());
                return false;
            }
            outputUri = state.outputUri;
            DM_INFO("RenderJobRunner: job %s done -> %s", jobId.c_str(), outputUri.c_str());
            return true;
        }
        if (state.status == RenderStatus::failed)
        {
            error = "render job " + jobId + " failed"
                  + (state.message.empty() ? std::string() : ": " + state.message);
            DM_WARN("RenderJobRunner: %s", error.c_str());
            return false;
        }
    }

    error = "render job " + jobId + " timed out after " + std::to_string(polls_) + " polls";
    DM_WARN("RenderJobRunner: %s", error.c_str());
    return false;
}

} // namespace deckmix
