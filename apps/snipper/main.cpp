/**
 * @file main.cpp
 * @brief spk_snipper: cuts labelled snippets out of annotated recordings.
 *
 * Every <name>.wav in the input directory that has a <name>.txt
 * SpikerRecorder event file next to it is cut into
 * <output>/<name>_<tag>_<n>.npy snippets; with --noise the gaps between
 * events go to <output>/Noise/.
 */

#include "CliCommon.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/io/WavFile.hpp"
#include "spk/eog/signal/Annotations.hpp"
#include "spk/eog/snippet/Snipper.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <vector>

using namespace spk;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTool = "spk_snipper";

enum LongOnly : int {
    kOptLogLevel = 1000
};

void printUsage()
{
    std::puts(
        "usage: spk_snipper [options] <input-dir>\n"
        "  -o, --output DIR            snippet directory (default: Snippets)\n"
        "  -s, --snippet-size SEC      snippet length in seconds (default: 1.0)\n"
        "  -r, --right-proportion R    share of the snippet after the event (default: 0.9)\n"
        "  -c, --config FILE           JSON per-tag overrides {tag: {snippet_size, right_proportion}}\n"
        "  -n, --noise                 also cut noise snippets from the gaps between events\n"
        "  -v, --verbose               list processed and skipped recordings\n"
        "      --log-level LEVEL       debug|info|warn|error|fatal (default: info)\n"
        "  -h, --help");
}

eog::ExpectedVoid saveAll(const fs::path &directory, const std::vector<eog::snippet::Snippet> &snippets)
{
    for (const auto &snippet : snippets) {
        if (auto saved = eog::snippet::SnippetStore::save(directory, snippet); !saved)
            return std::unexpected(saved.error());
    }
    return {};
}

} // anonymous namespace

int main(int argc, char **argv)
{
    fs::path output = "Snippets";
    fs::path configPath;
    bool verbose = false;
    eog::snippet::SnipperConfig config;

    static const option kOptions[] = {
        {"output",           required_argument, nullptr, 'o'},
        {"snippet-size",     required_argument, nullptr, 's'},
        {"right-proportion", required_argument, nullptr, 'r'},
        {"config",           required_argument, nullptr, 'c'},
        {"noise",            no_argument,       nullptr, 'n'},
        {"verbose",          no_argument,       nullptr, 'v'},
        {"log-level",        required_argument, nullptr, kOptLogLevel},
        {"help",             no_argument,       nullptr, 'h'},
        {nullptr,            0,                 nullptr, 0}
    };

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "o:s:r:c:nvh", kOptions, nullptr)) != -1) {
        switch (opt) {
            case 'o': output = optarg; break;
            case 'c': configPath = optarg; break;
            case 'n': config.includeNoise = true; break;
            case 'v': verbose = true; break;
            case 's':
                if (!cli::parseNumber(optarg, config.defaults.snippetSeconds))
                    return cli::usageError(kTool, std::format("invalid snippet size '{}'", optarg));
                break;
            case 'r':
                if (!cli::parseNumber(optarg, config.defaults.rightProportion))
                    return cli::usageError(kTool, std::format("invalid right proportion '{}'", optarg));
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

    if (optind + 1 != argc)
        return cli::usageError(kTool, "expected exactly one input directory");
    const fs::path input = argv[optind];

    std::error_code ec;
    if (!fs::is_directory(input, ec))
        return cli::fail(kTool, eog::Error::make(eog::ErrorCode::kFileNotFound, "input directory " + input.string()));

    if (!configPath.empty()) {
        auto overrides = eog::snippet::loadTagOptions(configPath, config.defaults);
        if (!overrides)
            return cli::fail(kTool, overrides.error());
        config.overrides = std::move(*overrides);
    }

    auto snipper = eog::snippet::Snipper::create(std::move(config));
    if (!snipper)
        return cli::fail(kTool, snipper.error());

    std::vector<fs::path> recordings;
    for (const auto &entry : fs::directory_iterator(input, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".wav")
            recordings.push_back(entry.path());
    }
    std::sort(recordings.begin(), recordings.end());

    std::vector<std::string> done;
    std::vector<std::string> withoutEvents;
    std::size_t total = 0;

    for (const auto &wav : recordings) {
        const std::string name = wav.stem().string();
        auto eventsFile = wav;
        eventsFile.replace_extension(".txt");
        if (!fs::is_regular_file(eventsFile, ec)) {
            withoutEvents.push_back(name);
            continue;
        }

        auto annotations = eog::signal::loadAnnotations(eventsFile);
        if (!annotations)
            return cli::fail(kTool, annotations.error());

        auto signal = eog::io::readWav(wav);
        if (!signal)
            return cli::fail(kTool, signal.error());

        auto result = snipper->snip(*signal, *annotations, name);
        if (!result)
            return cli::fail(kTool, result.error());

        if (auto saved = saveAll(output, result->events); !saved)
            return cli::fail(kTool, saved.error());
        if (auto saved = saveAll(output / "Noise", result->noise); !saved)
            return cli::fail(kTool, saved.error());

        total += result->events.size() + result->noise.size();
        done.push_back(name);
    }

    if (verbose) {
        std::puts("Created snippets for:");
        for (const auto &name : done)
            std::printf("  %s\n", name.c_str());
        std::puts("No event file for:");
        for (const auto &name : withoutEvents)
            std::printf("  %s\n", name.c_str());
    }

    core::Log::info(kTool, std::format("{} snippets from {} recordings written to {}",
        total, done.size(), output.string()));
    return 0;
}
