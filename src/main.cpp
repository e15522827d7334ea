#include "core/Engine.h"
#include "core/JuceBackend.h"
#include "core/Logger.h"
#include "core/SessionJson.h"

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <cstdio>

// deckmix_preview <session.json> [--log-level=debug] [--from=ms]
// Plays a session file through the default output device until it ends.

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI init;
    juce::ArgumentList args(argc, argv);

    deckmix::Logger::applyEnvironmentLevel();
    if (args.containsOption("--log-level"))
    {
        deckmix::LogLevel level;
        auto text = args.getValueForOption("--log-level");
        if (!deckmix::parseLogLevel(text.toRawUTF8(), level))
        {
            std::fprintf(stderr, "unknown log level: %s\n", text.toRawUTF8());
            return 2;
        }
        deckmix::Logger::setLevel(level);
    }

    if (args.size() < 1 || args[0].isOption())
    {
        std::fprintf(stderr, "usage: %s <session.json> [--log-level=LEVEL] [--from=MS]\n",
                     args.executableName.toRawUTF8());
        return 2;
    }

    juce::File sessionFile = args[0].resolveAsFile();
    if (!sessionFile.existsAsFile())
    {
        std::fprintf(stderr, "no such file: %s\n", sessionFile.getFullPathName().toRawUTF8());
        return 1;
    }

    // Relative asset paths resolve against the session file's directory
    sessionFile.getParentDirectory().setAsCurrentWorkingDirectory();

    std::string error;
    deckmix::EngineConfig config;
    if (!deckmix::parseEngineConfig(sessionFile.loadFileAsString().toStdString(), config, error))
    {
        std::fprintf(stderr, "%s: %s\n", sessionFile.getFileName().toRawUTF8(), error.c_str());
        return 1;
    }

    juce::Logger::writeToLog("deckmix preview - JUCE " + juce::String(JUCE_MAJOR_VERSION)
                             + "." + juce::String(JUCE_MINOR_VERSION)
                             + "." + juce::String(JUCE_BUILDNUMBER));

    deckmix::JuceBackend backend;
    if (!backend.start(48000.0, 512, error))
    {
        std::fprintf(stderr, "audio device: %s\n", error.c_str());
        return 1;
    }

    int status = 0;
    {
        deckmix::Engine engine(backend);
        auto result = engine.load(config, error);
        if (result != deckmix::EngineError::ok)
        {
            std::fprintf(stderr, "load failed (%s): %s\n",
                         deckmix::engineErrorName(result), error.c_str());
            status = 1;
        }
        else
        {
            juce::WaitableEvent ended;
            engine.onProgress([](double ms) {
                std::printf("\r%8.1f s", ms / 1000.0);
                std::fflush(stdout);
            });
            engine.onEnded([&ended] { ended.signal(); });

            double from = args.getValueForOption("--from").getDoubleValue();
            if (from > 0.0 && engine.seek(from) != deckmix::EngineError::ok)
                std::fprintf(stderr, "seek to %.0f ms ignored\n", from);

            result = engine.play();
            if (result != deckmix::EngineError::ok)
            {
                std::fprintf(stderr, "play failed (%s)\n", deckmix::engineErrorName(result));
                status = 1;
            }
            else
            {
                std::printf("playing %s (%.1f s, %d triggers)\n",
                            config.mainUri.c_str(), engine.getDurationMs() / 1000.0,
                            static_cast<int>(config.triggers.size()));

                // Unknown duration: play until interrupted
                double duration = engine.getDurationMs();
                int timeoutMs = duration > 0.0 ? static_cast<int>(juce::jmax(0.0, duration - from)) + 5000 : -1;
                if (!ended.wait(timeoutMs))
                    std::fprintf(stderr, "\nend of track not reported in time\n");
                std::printf("\n");
            }
        }
        engine.dispose();
    }

    backend.stop();
    deckmix::Logger::drain();
    return status;
}
