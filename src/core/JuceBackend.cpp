#include "core/JuceBackend.h"
#include "core/Logger.h"

#include <algorithm>

namespace deckmix {

// ═══════════════════════════════════════════════════════════════════
// Handle
// ═══════════════════════════════════════════════════════════════════

class JuceBackend::Handle : public PlaybackHandle {
public:
    Handle(JuceBackend& owner, juce::AudioFormatReader* reader, const std::string& uri)
        : owner_(owner), uri_(uri),
          sourceRate_(reader->sampleRate),
          channels_(static_cast<int>(std::max(1u, std::min(2u, reader->numChannels))))
    {
        readerSource_ = std::make_unique<juce::AudioFormatReaderSource>(reader, true);
        transport_.setSource(readerSource_.get(), 0, nullptr, sourceRate_, channels_);
        owner_.attach(&transport_);
    }

    ~Handle() override
    {
        unload();
    }

    bool play() override
    {
        if (!readerSource_) return false;
        transport_.start();
        return true;
    }

    bool pause() override
    {
        if (!readerSource_) return false;
        halt();
        return true;
    }

    bool stop() override
    {
        if (!readerSource_) return false;
        halt();
        transport_.setPosition(0.0);
        return true;
    }

    bool seek(double ms) override
    {
        if (!readerSource_) return false;
        transport_.setPosition(std::max(0.0, ms) / 1000.0);
        return true;
    }

    bool setVolume(float volume) override
    {
        if (!readerSource_) return false;
        transport_.setGain(volume);
        return true;
    }

    PlaybackStatus getStatus() const override
    {
        PlaybackStatus st;
        if (!readerSource_)
            return st;
        st.isLoaded = true;
        st.isPlaying = transport_.isPlaying();
        st.positionMs = transport_.getCurrentPosition() * 1000.0;
        st.durationMs = transport_.getLengthInSeconds() * 1000.0;
        return st;
    }

    void unload() override
    {
        if (!readerSource_)
            return;
        // Detach first: stopping a playing transport waits for the audio
        // thread to render its fade-out block.
        owner_.detach(&transport_);
        transport_.setSource(nullptr);
        readerSource_.reset();
        DM_TRACE("JuceBackend: unloaded %s", uri_.c_str());
    }

private:
    // AudioTransportSource::stop() spins until the audio thread renders the
    // fade-out block. With no device running nothing will, so reselect the
    // source instead: that clears the playing flag and keeps the read position.
    void halt()
    {
        if (owner_.isRunning())
            transport_.stop();
        else if (transport_.isPlaying())
            transport_.setSource(readerSource_.get(), 0, nullptr, sourceRate_, channels_);
    }

    JuceBackend& owner_;
    std::string uri_;
    double sourceRate_;
    int channels_;
    std::unique_ptr<juce::AudioFormatReaderSource> readerSource_;
    juce::AudioTransportSource transport_;
};

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

JuceBackend::JuceBackend()
{
    formatManager_.registerBasicFormats();
    // Transports report positions and lengths only once prepared; the device
    // re-prepares the mixer at its real rate when it starts.
    mixer_.prepareToPlay(kNominalBlockSize, kNominalSampleRate);
    DM_INFO("JuceBackend: initialized with %d audio formats",
            formatManager_.getNumKnownFormats());
}

JuceBackend::~JuceBackend()
{
    stop();
    if (openHandles_.load() > 0)
        DM_WARN("JuceBackend: destroyed with %d handles still open", openHandles_.load());
    mixer_.removeAllInputs();
    DM_INFO("JuceBackend: destroyed");
}

juce::File JuceBackend::resolveUri(const std::string& uri)
{
    juce::String text(uri);
    if (text.startsWithIgnoreCase("file:"))
        return juce::URL(text).getLocalFile();
    return juce::File::getCurrentWorkingDirectory().getChildFile(text);
}

// ═══════════════════════════════════════════════════════════════════
// PlaybackBackend
// ═══════════════════════════════════════════════════════════════════

std::unique_ptr<PlaybackHandle> JuceBackend::open(const std::string& uri,
                                                  const PlaybackOptions& options,
                                                  std::string& error)
{
    juce::File file = resolveUri(uri);
    if (!file.existsAsFile())
    {
        error = "File not found: " + uri;
        DM_WARN("JuceBackend::open: %s", error.c_str());
        return nullptr;
    }

    juce::AudioFormatReader* reader = formatManager_.createReaderFor(file);
    if (!reader)
    {
        error = "Unsupported or corrupted audio file: " + uri;
        DM_WARN("JuceBackend::open: %s", error.c_str());
        return nullptr;
    }

    DM_DEBUG("JuceBackend::open: %s ch=%d len=%lld sr=%.1f",
             uri.c_str(), static_cast<int>(reader->numChannels),
             static_cast<long long>(reader->lengthInSamples), reader->sampleRate);

    auto handle = std::make_unique<Handle>(*this, reader, uri);
    handle->setVolume(options.initialVolume);
    if (options.autoplay)
        handle->play();
    return handle;
}

int JuceBackend::getOpenHandleCount() const
{
    return openHandles_.load();
}

void JuceBackend::attach(juce::AudioSource* source)
{
    mixer_.addInputSource(source, false);
    openHandles_.fetch_add(1);
}

void JuceBackend::detach(juce::AudioSource* source)
{
    mixer_.removeInputSource(source);
    openHandles_.fetch_sub(1);
}

// ═══════════════════════════════════════════════════════════════════
// Device (control thread)
// ═══════════════════════════════════════════════════════════════════

bool JuceBackend::start(double sampleRate, int blockSize, std::string& error)
{
    DM_INFO("JuceBackend::start: requested sr=%.0f bs=%d", sampleRate, blockSize);

    if (running_.load())
    {
        DM_INFO("JuceBackend::start: already running, stopping first");
        stop();
    }

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    setup.sampleRate = sampleRate;
    setup.bufferSize = blockSize;

    auto err = deviceManager_.initialise(0, 2, nullptr, true, {}, &setup);
    if (err.isNotEmpty())
    {
        error = err.toStdString();
        DM_WARN("JuceBackend::start: initialise failed: %s", error.c_str());
        return false;
    }

    firstCallback_.store(true);
    deviceManager_.addAudioCallback(this);

    DM_INFO("JuceBackend::start: device opened, actual sr=%.0f bs=%d",
            sampleRate_, blockSize_);
    return true;
}

void JuceBackend::stop()
{
    if (!running_.load())
        return;

    DM_INFO("JuceBackend::stop");
    deviceManager_.removeAudioCallback(this);
    deviceManager_.closeAudioDevice();
    running_.store(false);
    sampleRate_ = 0.0;
    blockSize_ = 0;
}

bool JuceBackend::isRunning() const
{
    return running_.load();
}

double JuceBackend::getSampleRate() const
{
    return sampleRate_;
}

int JuceBackend::getBlockSize() const
{
    return blockSize_;
}

// ═══════════════════════════════════════════════════════════════════
// Testing
// ═══════════════════════════════════════════════════════════════════

void JuceBackend::prepareForTesting(double sampleRate, int blockSize)
{
    sampleRate_ = sampleRate;
    blockSize_ = blockSize;
    mixer_.prepareToPlay(blockSize, sampleRate);
    testBuffer_.setSize(2, blockSize);
    DM_DEBUG("JuceBackend::prepareForTesting: sr=%.0f bs=%d", sampleRate, blockSize);
}

float JuceBackend::render(int numSamples)
{
    if (numSamples <= 0 || sampleRate_ <= 0.0)
        return 0.0f;

    testBuffer_.setSize(2, numSamples, false, false, true);
    juce::AudioSourceChannelInfo info(&testBuffer_, 0, numSamples);
    mixer_.getNextAudioBlock(info);
    Logger::drain();
    return testBuffer_.getMagnitude(0, numSamples);
}

// ═══════════════════════════════════════════════════════════════════
// JUCE AudioIODeviceCallback
// ═══════════════════════════════════════════════════════════════════

void JuceBackend::audioDeviceIOCallbackWithContext(
    const float* const* /*inputChannelData*/, int /*numInputChannels*/,
    float* const* outputChannelData, int numOutputChannels,
    int numSamples,
    const juce::AudioIODeviceCallbackContext& /*context*/)
{
    if (firstCallback_.exchange(false))
        DM_DEBUG_RT("JuceBackend: first callback ch=%d n=%d", numOutputChannels, numSamples);

    if (numOutputChannels <= 0)
        return;

    juce::AudioBuffer<float> out(outputChannelData, numOutputChannels, numSamples);
    juce::AudioSourceChannelInfo info(&out, 0, numSamples);
    mixer_.getNextAudioBlock(info);
}

void JuceBackend::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    double sr = device->getCurrentSampleRate();
    int bs = device->getCurrentBufferSizeSamples();

    DM_INFO("JuceBackend::audioDeviceAboutToStart: sr=%.0f bs=%d", sr, bs);

    mixer_.prepareToPlay(bs, sr);
    sampleRate_ = sr;
    blockSize_ = bs;
    running_.store(true);
}

void JuceBackend::audioDeviceStopped()
{
    DM_INFO("JuceBackend::audioDeviceStopped");
    mixer_.releaseResources();
    mixer_.prepareToPlay(kNominalBlockSize, kNominalSampleRate);
    running_.store(false);
}

} // namespace deckmix
