/**
 * @file EventPipeline.hpp
 * @brief Scan → classify loop turning a signal into a labelled event stream.
 *
 * The WindowScanner walks the signal; every window the zero-crossing
 * detector flags is labelled either by the DirectionClassifier or by a
 * trained IEventClassifier on its catch22 features. A window that fails
 * to classify is logged and recorded in the report, and scanning goes on.
 *
 * Single-threaded: only the thread calling run()/runLive() touches the
 * scanner cursor. Cancellation is checked between windows.
 *
 * @see ScanConfig, WindowScanner
 */

#pragma once

#include "spk/eog/classify/IEventClassifier.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/detect/DirectionClassifier.hpp"
#include "spk/eog/detect/ZeroCrossingDetector.hpp"
#include "spk/eog/feature/FeatureExtractor.hpp"
#include "spk/eog/pipeline/ScanConfig.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"
#include "spk/eog/source/ISource.hpp"

#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

namespace spk::eog::pipeline {

/**
 * @brief A classified window.
 */
struct DetectedEvent {
    std::size_t startIndex = 0;
    std::size_t length = 0;
    double startTime = 0.0;
    Label label;
};

/**
 * @brief A detected window that could not be labelled.
 */
struct WindowFailure {
    std::size_t startIndex = 0;
    Error error;
};

struct ScanReport {
    std::vector<DetectedEvent> events;
    std::vector<WindowFailure> failures;
    /// Windows evaluated by the detector.
    std::size_t steps = 0;
    /// Detected windows dropped because they start in the ignore region.
    std::size_t ignored = 0;
    bool cancelled = false;
};

using EventCallback = std::function<void(const DetectedEvent &)>;

class EventPipeline {
public:
    /**
     * @brief Builds a pipeline.
     *
     * @param model Trained classifier, required in ClassificationMode::kModel
     * @return The pipeline, kInvalidConfiguration for an invalid config or a
     *         missing/incompatible model, kNotInitialized for an untrained one
     */
    [[nodiscard]] static Expected<EventPipeline> create(
        ScanConfig config, std::unique_ptr<classify::IEventClassifier> model = nullptr);

    EventPipeline(EventPipeline &&) noexcept = default;
    EventPipeline &operator=(EventPipeline &&) noexcept = default;

    /**
     * @brief Scans a complete recording.
     *
     * @param onEvent Optional hook invoked for every event as it is found
     */
    [[nodiscard]] Expected<ScanReport> run(const signal::SignalBuffer &buffer,
                                           std::stop_token stopToken = {},
                                           const EventCallback &onEvent = {}) const;

    /**
     * @brief Starts @p source and scans its samples as they arrive.
     *
     * Returns once the source is exhausted or a stop is requested. The
     * source is stopped before returning.
     *
     * @return The report, or the source's start/read error
     */
    [[nodiscard]] Expected<ScanReport> runLive(source::ISource &source,
                                               std::stop_token stopToken,
                                               const EventCallback &onEvent = {}) const;

    /**
     * @brief Labels one window in the configured mode.
     */
    [[nodiscard]] Expected<Label> classifyWindow(const signal::Window &window) const;

    [[nodiscard]] const ScanConfig &config() const noexcept { return _config; }

private:
    EventPipeline(ScanConfig config, std::unique_ptr<classify::IEventClassifier> model);

    void handleStep(const detect::ScanStep &step, ScanReport &report, const EventCallback &onEvent) const;

    ScanConfig _config;
    detect::ZeroCrossingDetector _detector;
    detect::DirectionClassifier _direction;
    feature::FeatureExtractor _extractor;
    std::unique_ptr<classify::IEventClassifier> _model;
};

} // namespace spk::eog::pipeline
