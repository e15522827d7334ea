#include "core/MainChannel.h"
#include "core/Logger.h"

namespace deckmix {

MainChannel::~MainChannel()
{
    close();
}

void MainChannel::attach(std::unique_ptr<PlaybackHandle> handle, float initialVolume)
{
    close();
    handle_ = std::move(handle);
    appliedVolume_ = initialVolume;
    durationMs_ = 0.0;
    if (!handle_)
        return;

    auto st = handle_->getStatus();
    durationMs_ = st.isLoaded && st.durationMs > 0.0 ? st.durationMs : 0.0;
    DM_DEBUG("MainChannel::attach: duration=%.0f ms", durationMs_);
}

void MainChannel::close()
{
    if (!handle_)
        return;
    if (!handle_->stop())
        DM_DEBUG("MainChannel::close: stop failed");
    handle_->unload();
    handle_.reset();
    durationMs_ = 0.0;
    DM_DEBUG("MainChannel::close: unloaded");
}

bool MainChannel::playFrom(double ms)
{
    if (!handle_) return false;
    if (!handle_->seek(ms) || !handle_->play())
    {
        DM_WARN("MainChannel::playFrom: playback failed at %.0f ms", ms);
        return false;
    }
    return true;
}

void MainChannel::pause()
{
    if (handle_ && !handle_->pause())
        DM_WARN("MainChannel::pause: pause failed");
}

void MainChannel::rewind()
{
    if (!handle_) return;
    bool stopped = handle_->stop();
    bool seeked = handle_->seek(0.0);
    if (!stopped || !seeked)
        DM_DEBUG("MainChannel::rewind: stop=%d seek=%d", stopped, seeked);
}

void MainChannel::seek(double ms)
{
    if (handle_ && !handle_->seek(ms))
        DM_DEBUG("MainChannel::seek: seek to %.0f ms failed", ms);
}

bool MainChannel::getReportedPosition(double& ms) const
{
    if (!handle_) return false;
    auto st = handle_->getStatus();
    if (!st.isLoaded)
        return false;
    ms = st.positionMs;
    return true;
}

void MainChannel::setVolume(float volume)
{
    if (!handle_) return;
    if (!handle_->setVolume(volume))
    {
        DM_DEBUG("MainChannel::setVolume: %.3f failed", volume);
        return;
    }
    appliedVolume_ = volume;
}

} // namespace deckmix
