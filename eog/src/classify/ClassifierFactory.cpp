/**
 * @file ClassifierFactory.cpp
 * @brief Implementation of the classifier factory.
 */

#include "spk/eog/classify/ClassifierFactory.hpp"

#include "spk/eog/classify/KnnClassifier.hpp"
#include "spk/eog/classify/RandomForestClassifier.hpp"
#include "spk/eog/classify/SvmClassifier.hpp"

namespace spk::eog::classify {

std::unique_ptr<IEventClassifier> ClassifierFactory::create(ClassifierKind kind, std::uint64_t seed)
{
    switch (kind) {
        case ClassifierKind::kKnn:
            return std::make_unique<KnnClassifier>(kDefaultKnnNeighbours);
        case ClassifierKind::kRandomForest:
            return std::make_unique<RandomForestClassifier>(kDefaultForestTrees, seed);
        case ClassifierKind::kSvm:
            return std::make_unique<SvmClassifier>(kDefaultSvmC);
    }
    return std::make_unique<KnnClassifier>(kDefaultKnnNeighbours);
}

} // namespace spk::eog::classify
