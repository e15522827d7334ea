#pragma once

#include "core/Playback.h"

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <atomic>
#include <memory>
#include <string>

namespace deckmix {

/// PlaybackBackend on JUCE: every handle is an AudioTransportSource over a
/// file reader, summed by one MixerAudioSource that feeds the output device.
class JuceBackend : public PlaybackBackend, private juce::AudioIODeviceCallback {
public:
    JuceBackend();
    ~JuceBackend() override;

    JuceBackend(const JuceBackend&) = delete;
    JuceBackend& operator=(const JuceBackend&) = delete;

    // --- Device (control thread) ---
    bool start(double sampleRate, int blockSize, std::string& error);
    void stop();
    bool isRunning() const;
    double getSampleRate() const;
    int getBlockSize() const;

    // --- PlaybackBackend ---
    std::unique_ptr<PlaybackHandle> open(const std::string& uri,
                                         const PlaybackOptions& options,
                                         std::string& error) override;

    int getOpenHandleCount() const;

    // --- Testing (no device) ---
    void prepareForTesting(double sampleRate, int blockSize);

    /// Pull one block through the mixer. Returns the peak magnitude rendered.
    float render(int numSamples);

    /// "file://..." URLs and plain (absolute or cwd-relative) paths.
    static juce::File resolveUri(const std::string& uri);

private:
    class Handle;

    static constexpr double kNominalSampleRate = 48000.0;
    static constexpr int kNominalBlockSize = 512;

    juce::AudioFormatManager formatManager_;
    juce::AudioDeviceManager deviceManager_;
    juce::MixerAudioSource mixer_;
    juce::AudioBuffer<float> testBuffer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> firstCallback_{true};
    std::atomic<int> openHandles_{0};
    double sampleRate_ = 0.0;
    int blockSize_ = 0;

    void attach(juce::AudioSource* source);
    void detach(juce::AudioSource* source);

    // --- juce::AudioIODeviceCallback (audio thread) ---
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData, int numInputChannels,
        float* const* outputChannelData, int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
};

} // namespace deckmix
