/**
 * @file main.cpp
 * @brief spk_record: saves a stretch of the live SpikerBox stream as a
 *        1-D .npy recording for spk_snipper and spk_scan.
 *
 * Ctrl-C ends the capture early; what was recorded so far is still saved.
 */

#include "CliCommon.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/io/Recording.hpp"
#include "spk/eog/pipeline/Recorder.hpp"
#include "spk/eog/source/SpikerSerialSource.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <stop_token>
#include <thread>

using namespace spk;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTool = "spk_record";
constexpr double kDefaultDuration = 30.0;

std::atomic<bool> gInterrupted{false};

void onSignal(int)
{
    gInterrupted = true;
}

enum LongOnly : int {
    kOptLogLevel = 1000,
    kOptSampleRate
};

void printUsage()
{
    std::puts(
        "usage: spk_record [options] -o FILE.npy\n"
        "  -p, --serial PORT           SpikerBox serial port (default: /dev/ttyACM0)\n"
        "  -d, --duration SEC          recording length in seconds (default: 30)\n"
        "  -o, --output FILE           destination .npy file\n"
        "      --sample-rate HZ        rate of the serial link (default: 10000)\n"
        "      --log-level LEVEL       debug|info|warn|error|fatal (default: info)\n"
        "  -h, --help");
}

} // anonymous namespace

int main(int argc, char **argv)
{
    eog::source::SpikerSerialConfig serialConfig;
    double duration = kDefaultDuration;
    fs::path output;

    static const option kOptions[] = {
        {"serial",      required_argument, nullptr, 'p'},
        {"duration",    required_argument, nullptr, 'd'},
        {"output",      required_argument, nullptr, 'o'},
        {"sample-rate", required_argument, nullptr, kOptSampleRate},
        {"log-level",   required_argument, nullptr, kOptLogLevel},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr,       0,                 nullptr, 0}
    };

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "p:d:o:h", kOptions, nullptr)) != -1) {
        switch (opt) {
            case 'p': serialConfig.port = optarg; break;
            case 'o': output = optarg; break;
            case 'd':
                if (!cli::parseNumber(optarg, duration) || !(duration > 0.0))
                    return cli::usageError(kTool, std::format("invalid duration '{}'", optarg));
                break;
            case kOptSampleRate:
                if (!cli::parseNumber(optarg, serialConfig.sampleRate) || !(serialConfig.sampleRate > 0.0f))
                    return cli::usageError(kTool, std::format("invalid sample rate '{}'", optarg));
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

    if (optind != argc)
        return cli::usageError(kTool, "unexpected positional argument");
    if (output.empty())
        return cli::usageError(kTool, "missing -o FILE.npy");

    auto sampleCount = eog::pipeline::samplesForDuration(duration, serialConfig.sampleRate);
    if (!sampleCount)
        return cli::fail(kTool, sampleCount.error());

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

    eog::source::SpikerSerialSource source(serialConfig);
    auto report = eog::pipeline::recordSource(source, *sampleCount, stopSource.get_token());
    watcher.request_stop();

    if (!report)
        return cli::fail(kTool, report.error());

    if (auto saved = eog::io::saveRecording(output, report->signal); !saved)
        return cli::fail(kTool, saved.error());

    core::Log::info(kTool, std::format("saved {:.3f} s ({} samples) to {}{}",
        report->signal.duration(), report->signal.size(), output.string(),
        report->cancelled ? ", interrupted" : ""));
    return 0;
}
