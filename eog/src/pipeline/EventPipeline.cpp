/**
 * @file EventPipeline.cpp
 * @brief Implementation of the offline and live scan loops.
 */

#include "spk/eog/pipeline/EventPipeline.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/detect/WindowScanner.hpp"

#include <chrono>
#include <cmath>
#include <format>
#include <thread>

namespace spk::eog::pipeline {

namespace {

constexpr std::size_t kLiveReadChunk = 4096;
constexpr auto kLiveIdleSleep = std::chrono::milliseconds(5);

} // anonymous namespace

EventPipeline::EventPipeline(ScanConfig config, std::unique_ptr<classify::IEventClassifier> model)
    : _config(std::move(config))
    , _detector(_config.thresholdCrossings())
    , _model(std::move(model))
{
}

Expected<EventPipeline> EventPipeline::create(ScanConfig config, std::unique_ptr<classify::IEventClassifier> model)
{
    if (auto ok = config.validate(); !ok)
        return std::unexpected(ok.error());

    if (config.mode() == ClassificationMode::kModel) {
        if (!model) {
            return std::unexpected(
                Error::make(ErrorCode::kInvalidConfiguration, "model mode needs a classifier"));
        }
        if (!model->isTrained()) {
            return std::unexpected(
                Error::make(ErrorCode::kNotInitialized, "classifier is not trained"));
        }
        if (model->dimension() != feature::FeatureExtractor::dimension()) {
            return std::unexpected(
                Error::make(ErrorCode::kInvalidConfiguration,
                    std::format("classifier expects {} features, the extractor yields {}",
                        model->dimension(), feature::FeatureExtractor::dimension())));
        }
    }

    core::Log::info("scan", std::format("window {} / increment {} / threshold {} / {} mode",
        config.windowSize(), config.increment(), config.thresholdCrossings(),
        classificationModeName(config.mode())));
    return EventPipeline(std::move(config), std::move(model));
}

Expected<Label> EventPipeline::classifyWindow(const signal::Window &window) const
{
    if (_config.mode() == ClassificationMode::kDirection) {
        auto direction = _direction.classify(window);
        if (!direction)
            return std::unexpected(direction.error());
        return Label(directionName(*direction));
    }

    auto features = _extractor.extract(std::span<const float>(window.samples));
    if (!features)
        return std::unexpected(features.error());
    return _model->predictOne(*features);
}

void EventPipeline::handleStep(const detect::ScanStep &step, ScanReport &report, const EventCallback &onEvent) const
{
    ++report.steps;
    if (!step.detected)
        return;

    const double startTime = step.window.startTime();
    if (_config.ignoreUntil() >= 0.0 && startTime <= _config.ignoreUntil()) {
        ++report.ignored;
        return;
    }

    auto label = classifyWindow(step.window);
    if (!label) {
        core::Log::warn("scan", std::format("window at {:.3f} s: {}", startTime, label.error().format()));
        report.failures.push_back({step.window.startIndex, label.error()});
        return;
    }

    DetectedEvent event{step.window.startIndex, step.window.length(), startTime, std::move(*label)};
    core::Log::debug("scan", std::format("{} at {:.3f} s", event.label, event.startTime));
    if (onEvent)
        onEvent(event);
    report.events.push_back(std::move(event));
}

Expected<ScanReport> EventPipeline::run(const signal::SignalBuffer &buffer,
                                        std::stop_token stopToken,
                                        const EventCallback &onEvent) const
{
    if (std::abs(buffer.sampleRate() - _config.sampleRate()) > 1e-3f) {
        core::Log::warn("scan", std::format("signal is sampled at {} Hz, configuration assumes {} Hz",
            buffer.sampleRate(), _config.sampleRate()));
    }

    auto scanner = detect::WindowScanner::create(buffer, _detector, _config.windowSize(), _config.increment());
    if (!scanner)
        return std::unexpected(scanner.error());

    ScanReport report;
    while (true) {
        if (stopToken.stop_requested()) {
            report.cancelled = true;
            break;
        }
        auto step = scanner->next();
        if (!step)
            break;
        handleStep(*step, report, onEvent);
    }

    core::Log::info("scan", std::format("{} windows, {} events, {} failures{}",
        report.steps, report.events.size(), report.failures.size(), report.cancelled ? " (cancelled)" : ""));
    return report;
}

Expected<ScanReport> EventPipeline::runLive(source::ISource &source,
                                            std::stop_token stopToken,
                                            const EventCallback &onEvent) const
{
    const auto info = source.info();
    auto buffer = signal::SignalBuffer::create({}, info.sampleRate);
    if (!buffer)
        return std::unexpected(buffer.error());

    auto scanner = detect::WindowScanner::create(*buffer, _detector, _config.windowSize(), _config.increment());
    if (!scanner)
        return std::unexpected(scanner.error());

    if (auto started = source.start(); !started)
        return std::unexpected(started.error());
    core::Log::info("scan", std::format("live scan of {} at {} Hz", info.name, info.sampleRate));

    ScanReport report;
    std::vector<float> chunk(kLiveReadChunk);
    while (true) {
        if (stopToken.stop_requested()) {
            report.cancelled = true;
            break;
        }

        auto count = source.read(chunk);
        if (!count) {
            source.stop();
            return std::unexpected(count.error());
        }
        if (*count > 0)
            buffer->append(std::span<const float>(chunk.data(), *count));

        bool progressed = false;
        while (!stopToken.stop_requested()) {
            auto step = scanner->next();
            if (!step)
                break;
            handleStep(*step, report, onEvent);
            progressed = true;
        }

        if (*count == 0 && !progressed) {
            if (source.exhausted())
                break;
            std::this_thread::sleep_for(kLiveIdleSleep);
        }
    }

    source.stop();
    core::Log::info("scan", std::format("live scan over: {} samples, {} events, {} failures",
        buffer->size(), report.events.size(), report.failures.size()));
    return report;
}

} // namespace spk::eog::pipeline
