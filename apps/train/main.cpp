/**
 * @file main.cpp
 * @brief spk_train: trains event classifiers from a snippet corpus.
 *
 * Loads the .npy snippets of the corpus directory (and of its Noise/
 * subdirectory when present), keeps the selected labels, fits the chosen
 * model on a stratified split and writes <models>/<kind>.spkm.
 */

#include "CliCommon.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/classify/ClassifierKind.hpp"
#include "spk/eog/classify/ModelArchive.hpp"
#include "spk/eog/classify/Trainer.hpp"
#include "spk/eog/snippet/SnippetStore.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <iterator>
#include <vector>

using namespace spk;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTool = "spk_train";

enum LongOnly : int {
    kOptLogLevel = 1000
};

void printUsage()
{
    std::puts(
        "usage: spk_train [options] <knn|rfc|svm|all>\n"
        "  -s, --snippets DIR          snippet corpus (default: Snippets)\n"
        "  -o, --models DIR            model output directory (default: models)\n"
        "  -l, --labels A,B,...        labels to train on (default: left,right)\n"
        "  -t, --test-fraction F       share of each label held out, in (0, 1) (default: 0.9)\n"
        "      --seed N                split and forest seed (default: 42)\n"
        "  -v, --verbose               list misclassified and skipped snippets\n"
        "      --log-level LEVEL       debug|info|warn|error|fatal (default: info)\n"
        "  -h, --help");
}

void printReport(eog::classify::ClassifierKind kind, const eog::classify::TrainingReport &report, bool verbose)
{
    std::printf("%-4s accuracy %.4f (%zu/%zu), trained on %zu, %zu skipped\n",
        std::string(eog::classify::classifierKindName(kind)).c_str(),
        report.accuracy, report.correct, report.testCount, report.trainCount, report.skipped.size());
    if (!verbose)
        return;
    for (const auto &id : report.misclassified)
        std::printf("  misclassified %s\n", id.c_str());
    for (const auto &skipped : report.skipped)
        std::printf("  skipped %s: %s\n", skipped.id.c_str(), skipped.error.message.c_str());
}

} // anonymous namespace

int main(int argc, char **argv)
{
    fs::path snippetsDir = "Snippets";
    fs::path modelsDir = "models";
    bool verbose = false;
    eog::classify::TrainerConfig config;

    static const option kOptions[] = {
        {"snippets",      required_argument, nullptr, 's'},
        {"models",        required_argument, nullptr, 'o'},
        {"labels",        required_argument, nullptr, 'l'},
        {"test-fraction", required_argument, nullptr, 't'},
        {"seed",          required_argument, nullptr, 'S'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"log-level",     required_argument, nullptr, kOptLogLevel},
        {"help",          no_argument,       nullptr, 'h'},
        {nullptr,         0,                 nullptr, 0}
    };

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "s:o:l:t:vh", kOptions, nullptr)) != -1) {
        switch (opt) {
            case 's': snippetsDir = optarg; break;
            case 'o': modelsDir = optarg; break;
            case 'v': verbose = true; break;
            case 'l':
                config.labels = cli::splitList(optarg);
                if (config.labels.empty())
                    return cli::usageError(kTool, "empty label list");
                break;
            case 't':
                if (!cli::parseNumber(optarg, config.testFraction))
                    return cli::usageError(kTool, std::format("invalid test fraction '{}'", optarg));
                break;
            case 'S':
                if (!cli::parseNumber(optarg, config.seed))
                    return cli::usageError(kTool, std::format("invalid seed '{}'", optarg));
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
        return cli::usageError(kTool, "expected exactly one model kind");

    std::vector<eog::classify::ClassifierKind> kinds;
    if (std::string_view(argv[optind]) == "all") {
        kinds = {eog::classify::ClassifierKind::kKnn,
                 eog::classify::ClassifierKind::kRandomForest,
                 eog::classify::ClassifierKind::kSvm};
    } else {
        auto kind = eog::classify::parseClassifierKind(argv[optind]);
        if (!kind)
            return cli::fail(kTool, kind.error());
        kinds.push_back(*kind);
    }

    if (auto ok = config.validate(); !ok)
        return cli::fail(kTool, ok.error());

    auto snippets = eog::snippet::SnippetStore::loadDirectory(snippetsDir, config.labels);
    if (!snippets)
        return cli::fail(kTool, snippets.error());

    std::error_code ec;
    if (fs::is_directory(snippetsDir / "Noise", ec)) {
        auto noise = eog::snippet::SnippetStore::loadDirectory(snippetsDir / "Noise", config.labels);
        if (!noise)
            return cli::fail(kTool, noise.error());
        snippets->insert(snippets->end(),
            std::make_move_iterator(noise->begin()), std::make_move_iterator(noise->end()));
    }

    for (const auto kind : kinds) {
        config.kind = kind;
        auto trainer = eog::classify::Trainer::create(config);
        if (!trainer)
            return cli::fail(kTool, trainer.error());

        auto result = trainer->run(*snippets);
        if (!result)
            return cli::fail(kTool, result.error());

        printReport(kind, result->report, verbose);

        const auto path = modelsDir / (std::string(eog::classify::classifierKindName(kind)) + ".spkm");
        if (fs::create_directories(modelsDir, ec); ec) {
            return cli::fail(kTool, eog::Error::make(eog::ErrorCode::kIoError,
                std::format("cannot create {}: {}", modelsDir.string(), ec.message())));
        }
        if (auto saved = eog::classify::saveModel(*result->model, path); !saved)
            return cli::fail(kTool, saved.error());
        core::Log::info(kTool, "model written to " + path.string());
    }
    return 0;
}
