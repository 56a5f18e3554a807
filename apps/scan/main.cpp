/**
 * @file main.cpp
 * @brief spk_scan: detects and labels ocular events in a recording or a
 *        live SpikerBox stream.
 *
 * Events are printed to stdout as "<start time>\t<label>" as they are
 * found. Ctrl-C stops a live scan after the current window.
 */

#include "CliCommon.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/classify/ModelArchive.hpp"
#include "spk/eog/io/Recording.hpp"
#include "spk/eog/pipeline/EventPipeline.hpp"
#include "spk/eog/signal/Annotations.hpp"
#include "spk/eog/source/ArrayReplaySource.hpp"
#include "spk/eog/source/SpikerSerialSource.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

using namespace spk;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTool = "spk_scan";

std::atomic<bool> gInterrupted{false};

void onSignal(int)
{
    gInterrupted = true;
}

enum LongOnly : int {
    kOptLogLevel = 1000,
    kOptSampleRate,
    kOptChannel,
    kOptReplayChunk
};

void printUsage()
{
    std::puts(
        "usage: spk_scan [options] <recording.wav|recording.npy>\n"
        "       spk_scan [options] --serial PORT\n"
        "  -p, --serial PORT           scan the live SpikerBox stream on PORT\n"
        "  -w, --window N              window length in samples (default: one second)\n"
        "  -i, --increment N           stride after a non-event (default: window / 10)\n"
        "  -t, --threshold N           zero crossings below which a window is an event\n"
        "                              (default: 200 per 500 samples, scaled to the window)\n"
        "  -m, --mode MODE             direction|model (default: direction)\n"
        "  -M, --model FILE            trained model archive (selects model mode)\n"
        "  -a, --annotations FILE      event file whose 'ignore' tag masks the start\n"
        "      --sample-rate HZ        rate of .npy input and of the serial link (default: 10000)\n"
        "      --channel N             WAV channel or .npy row (default: 0)\n"
        "      --replay-chunk N        stream the recording through the live loop N samples at a time\n"
        "      --log-level LEVEL       debug|info|warn|error|fatal (default: info)\n"
        "  -h, --help");
}

void printEvent(const eog::pipeline::DetectedEvent &event)
{
    std::printf("%.3f\t%s\n", event.startTime, event.label.c_str());
    std::fflush(stdout);
}

} // anonymous namespace

int main(int argc, char **argv)
{
    std::string serialPort;
    fs::path modelPath;
    fs::path annotationsPath;
    std::optional<float> sampleRate;
    std::size_t channel = 0;
    std::size_t replayChunk = 0;
    std::optional<std::size_t> windowSize;
    std::optional<std::size_t> increment;
    std::optional<std::size_t> threshold;
    std::optional<eog::pipeline::ClassificationMode> mode;

    static const option kOptions[] = {
        {"serial",       required_argument, nullptr, 'p'},
        {"window",       required_argument, nullptr, 'w'},
        {"increment",    required_argument, nullptr, 'i'},
        {"threshold",    required_argument, nullptr, 't'},
        {"mode",         required_argument, nullptr, 'm'},
        {"model",        required_argument, nullptr, 'M'},
        {"annotations",  required_argument, nullptr, 'a'},
        {"sample-rate",  required_argument, nullptr, kOptSampleRate},
        {"channel",      required_argument, nullptr, kOptChannel},
        {"replay-chunk", required_argument, nullptr, kOptReplayChunk},
        {"log-level",    required_argument, nullptr, kOptLogLevel},
        {"help",         no_argument,       nullptr, 'h'},
        {nullptr,        0,                 nullptr, 0}
    };

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "p:w:i:t:m:M:a:h", kOptions, nullptr)) != -1) {
        switch (opt) {
            case 'p': serialPort = optarg; break;
            case 'M': modelPath = optarg; break;
            case 'a': annotationsPath = optarg; break;
            case 'w':
                windowSize.emplace();
                if (!cli::parseCount(optarg, *windowSize))
                    return cli::usageError(kTool, std::format("invalid window size '{}'", optarg));
                break;
            case 'i':
                increment.emplace();
                if (!cli::parseCount(optarg, *increment))
                    return cli::usageError(kTool, std::format("invalid increment '{}'", optarg));
                break;
            case 't':
                threshold.emplace();
                if (!cli::parseCount(optarg, *threshold))
                    return cli::usageError(kTool, std::format("invalid threshold '{}'", optarg));
                break;
            case 'm': {
                const std::string_view text(optarg);
                if (text == "direction")
                    mode = eog::pipeline::ClassificationMode::kDirection;
                else if (text == "model")
                    mode = eog::pipeline::ClassificationMode::kModel;
                else
                    return cli::usageError(kTool, std::format("unknown mode '{}'", text));
                break;
            }
            case kOptSampleRate: {
                float hz = 0.0f;
                if (!cli::parseNumber(optarg, hz) || !(hz > 0.0f))
                    return cli::usageError(kTool, std::format("invalid sample rate '{}'", optarg));
                sampleRate = hz;
                break;
            }
            case kOptChannel:
                if (!cli::parseCount(optarg, channel))
                    return cli::usageError(kTool, std::format("invalid channel '{}'", optarg));
                break;
            case kOptReplayChunk:
                if (!cli::parseCount(optarg, replayChunk) || replayChunk == 0)
                    return cli::usageError(kTool, std::format("invalid replay chunk '{}'", optarg));
                break;
            case kOptLogLevel:
                if (!cli::applyLogLevel(optarg))
                    return cli::usageError(kTool, std::format("unknown log level '{}'", optarg));
                break;
            case 'h':
                printUsage();
                return 0;
            default:
                return cli::usageError(kTool, "unknown option");
        }
    }

    const bool live = !serialPort.empty();
    if (live != (optind == argc) || argc - optind > 1)
        return cli::usageError(kTool, "give either one recording or --serial PORT");

    if (!mode)
        mode = modelPath.empty() ? eog::pipeline::ClassificationMode::kDirection
                                 : eog::pipeline::ClassificationMode::kModel;

    std::unique_ptr<eog::classify::IEventClassifier> model;
    if (*mode == eog::pipeline::ClassificationMode::kModel) {
        if (modelPath.empty())
            return cli::usageError(kTool, "model mode needs --model FILE");
        auto loaded = eog::classify::loadModel(modelPath);
        if (!loaded)
            return cli::fail(kTool, loaded.error());
        model = std::move(*loaded);
    }

    std::optional<double> ignoreUntil;
    if (!annotationsPath.empty()) {
        auto annotations = eog::signal::loadAnnotations(annotationsPath);
        if (!annotations)
            return cli::fail(kTool, annotations.error());
        ignoreUntil = annotations->ignoreUntil();
    }

    std::optional<eog::signal::SignalBuffer> recording;
    if (!live) {
        eog::io::RecordingOptions options;
        options.channel = channel;
        if (sampleRate)
            options.npySampleRate = *sampleRate;
        auto loaded = eog::io::loadRecording(argv[optind], options);
        if (!loaded)
            return cli::fail(kTool, loaded.error());
        recording = std::move(*loaded);
    }

    const float rate = live ? sampleRate.value_or(eog::kSpikerSampleRate) : recording->sampleRate();

    eog::pipeline::ScanConfig::Builder builder;
    builder.sampleRate(rate)
        .mode(*mode)
        .ignoreUntil(ignoreUntil.value_or(-1.0));
    if (windowSize)
        builder.windowSize(*windowSize);
    if (increment)
        builder.increment(*increment);
    if (threshold)
        builder.thresholdCrossings(*threshold);

    auto config = builder.build();
    if (!config)
        return cli::fail(kTool, config.error());

    auto pipeline = eog::pipeline::EventPipeline::create(std::move(*config), std::move(model));
    if (!pipeline)
        return cli::fail(kTool, pipeline.error());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::stop_source stopSource;
    std::jthread watcher([&stopSource](std::stop_token st) {
        while (!st.stop_requested()) {
            if (gInterrupted) {
                stopSource.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    eog::Expected<eog::pipeline::ScanReport> report = std::unexpected(
        eog::Error::make(eog::ErrorCode::kUnknown, "no scan was run"));

    if (live) {
        eog::source::SpikerSerialConfig serialConfig;
        serialConfig.port = serialPort;
        serialConfig.sampleRate = rate;
        eog::source::SpikerSerialSource source(serialConfig);
        report = pipeline->runLive(source, stopSource.get_token(), printEvent);
    } else if (replayChunk > 0) {
        const auto samples = recording->samples();
        eog::source::ArrayReplaySource source(
            std::vector<float>(samples.begin(), samples.end()), rate, {.chunkSize = replayChunk, .loop = false});
        report = pipeline->runLive(source, stopSource.get_token(), printEvent);
    } else {
        report = pipeline->run(*recording, stopSource.get_token(), printEvent);
    }

    watcher.request_stop();

    if (!report)
        return cli::fail(kTool, report.error());

    core::Log::info(kTool, std::format("{} events, {} failed windows, {} ignored{}",
        report->events.size(), report->failures.size(), report->ignored,
        report->cancelled ? ", interrupted" : ""));
    return 0;
}
