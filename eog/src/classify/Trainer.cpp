/**
 * @file Trainer.cpp
 * @brief Implementation of corpus splitting, fitting and scoring.
 */

#include "spk/eog/classify/Trainer.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/classify/ClassifierFactory.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <numeric>
#include <random>

namespace spk::eog::classify {

ExpectedVoid TrainerConfig::validate() const
{
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration,
                std::format("test fraction must lie in (0, 1), got {}", testFraction)));
    }
    return {};
}

Trainer::Trainer(TrainerConfig config) : _config(std::move(config)) {}

Expected<Trainer> Trainer::create(TrainerConfig config)
{
    if (auto ok = config.validate(); !ok)
        return std::unexpected(ok.error());
    return Trainer(std::move(config));
}

std::vector<Trainer::Sample> Trainer::extractAll(std::span<const snippet::Snippet> snippets,
                                                 std::vector<SkippedSnippet> &skipped) const
{
    std::vector<Sample> samples;
    for (const auto &snippet : snippets) {
        if (!_config.labels.empty() && !_config.labels.contains(snippet.label()))
            continue;

        auto features = _extractor.extract(snippet.signal());
        if (!features) {
            core::Log::warn("train", std::format("skipping {}: {}", snippet.id(), features.error().message));
            skipped.push_back({snippet.id(), features.error()});
            continue;
        }
        samples.push_back({snippet.id(), snippet.label(), std::move(*features)});
    }
    return samples;
}

void Trainer::score(const IEventClassifier &model, std::span<const Sample> test, TrainingReport &report) const
{
    for (const auto &sample : test) {
        auto predicted = model.predictOne(sample.features);
        if (predicted && *predicted == sample.label) {
            ++report.correct;
            continue;
        }
        if (!predicted)
            core::Log::warn("train", std::format("{}: {}", sample.id, predicted.error().message));
        report.misclassified.push_back(sample.id);
    }
    report.testCount = test.size();
    report.accuracy = test.empty() ? 0.0
                                   : static_cast<double>(report.correct) / static_cast<double>(test.size());
}

Expected<TrainingResult> Trainer::run(std::span<const snippet::Snippet> snippets) const
{
    TrainingReport report;
    std::vector<Sample> samples = extractAll(snippets, report.skipped);
    if (samples.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput, "no usable snippet carries a selected label"));
    }

    std::map<Label, std::vector<std::size_t>> byLabel;
    for (std::size_t i = 0; i < samples.size(); ++i)
        byLabel[samples[i].label].push_back(i);

    // Per-label split; a label keeps at least one training sample.
    std::mt19937_64 rng(_config.seed);
    std::vector<std::size_t> trainIdx;
    std::vector<std::size_t> testIdx;
    for (auto &[label, indices] : byLabel) {
        std::shuffle(indices.begin(), indices.end(), rng);
        const auto wanted = static_cast<std::size_t>(
            std::llround(_config.testFraction * static_cast<double>(indices.size())));
        const std::size_t nTest = std::min(wanted, indices.size() - 1);
        testIdx.insert(testIdx.end(), indices.begin(), indices.begin() + static_cast<std::ptrdiff_t>(nTest));
        trainIdx.insert(trainIdx.end(), indices.begin() + static_cast<std::ptrdiff_t>(nTest), indices.end());
    }
    std::sort(trainIdx.begin(), trainIdx.end());
    std::sort(testIdx.begin(), testIdx.end());

    std::vector<FeatureVector> X;
    std::vector<Label> y;
    X.reserve(trainIdx.size());
    y.reserve(trainIdx.size());
    for (const auto i : trainIdx) {
        X.push_back(samples[i].features);
        y.push_back(samples[i].label);
    }

    auto model = ClassifierFactory::create(_config.kind, _config.seed);
    if (auto fitted = model->train(X, y); !fitted)
        return std::unexpected(fitted.error());

    std::vector<Sample> test;
    test.reserve(testIdx.size());
    for (const auto i : testIdx)
        test.push_back(samples[i]);

    report.trainCount = trainIdx.size();
    score(*model, test, report);
    if (report.testCount == 0)
        core::Log::warn("train", "no sample held out, accuracy is not meaningful");

    core::Log::info("train", std::format("{}: trained on {}, accuracy {:.3f} ({}/{}), {} skipped",
        classifierKindName(_config.kind), report.trainCount, report.accuracy,
        report.correct, report.testCount, report.skipped.size()));

    return TrainingResult{std::move(model), std::move(report)};
}

Expected<TrainingReport> Trainer::evaluate(const IEventClassifier &model,
                                           std::span<const snippet::Snippet> snippets) const
{
    if (!model.isTrained()) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "cannot evaluate an untrained model"));
    }

    TrainingReport report;
    const std::vector<Sample> samples = extractAll(snippets, report.skipped);
    if (samples.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput, "no usable snippet carries a selected label"));
    }
    score(model, samples, report);
    return report;
}

} // namespace spk::eog::classify
