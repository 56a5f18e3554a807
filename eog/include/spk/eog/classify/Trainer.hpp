/**
 * @file Trainer.hpp
 * @brief Builds a training set from snippets, fits and evaluates a classifier.
 *
 * Snippets are filtered by label, turned into feature vectors (failures
 * are skipped and reported), split per label into train and test sets
 * with a seeded shuffle, then the model is fitted on the train part and
 * scored on the test part. The same snippets and seed always give the
 * same split, model and accuracy.
 */

#pragma once

#include "spk/eog/classify/ClassifierKind.hpp"
#include "spk/eog/classify/IEventClassifier.hpp"
#include "spk/eog/core/Constants.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/feature/FeatureExtractor.hpp"
#include "spk/eog/snippet/SnippetStore.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace spk::eog::classify {

struct TrainerConfig {
    /// Labels kept from the corpus; empty keeps every label.
    std::set<Label> labels{Label(label::kLeft), Label(label::kRight)};
    /// Share of each label held out for evaluation, in (0, 1).
    double testFraction = kDefaultTestFraction;
    std::uint64_t seed = kDefaultSeed;
    ClassifierKind kind = ClassifierKind::kKnn;

    [[nodiscard]] ExpectedVoid validate() const;
};

struct SkippedSnippet {
    std::string id;
    Error error;
};

struct TrainingReport {
    std::size_t trainCount = 0;
    std::size_t testCount = 0;
    std::size_t correct = 0;
    /// correct / testCount, 0 when nothing was held out.
    double accuracy = 0.0;
    std::vector<std::string> misclassified;
    std::vector<SkippedSnippet> skipped;
};

struct TrainingResult {
    std::unique_ptr<IEventClassifier> model;
    TrainingReport report;
};

class Trainer {
public:
    explicit Trainer(TrainerConfig config);

    [[nodiscard]] static Expected<Trainer> create(TrainerConfig config);

    /**
     * @brief Trains and evaluates a fresh model on @p snippets.
     *
     * @return The fitted model with its report, or kEmptyInput when no
     *         usable snippet carries a selected label
     */
    [[nodiscard]] Expected<TrainingResult> run(std::span<const snippet::Snippet> snippets) const;

    /**
     * @brief Scores an already trained model on @p snippets.
     *
     * Every usable snippet counts as test data.
     */
    [[nodiscard]] Expected<TrainingReport> evaluate(const IEventClassifier &model,
                                                    std::span<const snippet::Snippet> snippets) const;

    [[nodiscard]] const TrainerConfig &config() const noexcept { return _config; }

private:
    struct Sample {
        std::string id;
        Label label;
        FeatureVector features;
    };

    [[nodiscard]] std::vector<Sample> extractAll(std::span<const snippet::Snippet> snippets,
                                                 std::vector<SkippedSnippet> &skipped) const;

    void score(const IEventClassifier &model, std::span<const Sample> test, TrainingReport &report) const;

    TrainerConfig _config;
    feature::FeatureExtractor _extractor;
};

} // namespace spk::eog::classify
