#include "lumen/output/OutputLoop.hpp"

#include <algorithm>
#include <utility>

#include "lumen/log/Log.hpp"
#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/PacketEncoder.hpp"

namespace lumen::output {

namespace {
constexpr std::uint8_t SEQUENCE_SPAN = 255;
}

OutputLoop::OutputLoop(FrameSource source, std::shared_ptr<PacketSink> packetSink)
: frameSource(std::move(source))
, sink(std::move(packetSink))
, frameRate(config::OUTPUT_FRAME_RATE_DEFAULT) {}

OutputLoop::~OutputLoop() {
    stop();
}

void OutputLoop::setRequestColorsCallback(const RequestColorsCallback& callback) {
    requestColorsCallback = callback;
}

void OutputLoop::setFrameRate(double framesPerSecond) {
    frameRate.store(std::clamp(framesPerSecond, config::OUTPUT_FRAME_RATE_MIN, config::OUTPUT_FRAME_RATE_MAX),
                    std::memory_order_relaxed);
}

double OutputLoop::getFrameRate() const {
    return frameRate.load(std::memory_order_relaxed);
}

bool OutputLoop::tick() {
    if (!frameSource || !sink) {
        return false;
    }
    const auto frame = frameSource();
    if (!frame) {
        return false;
    }

    const std::uint64_t frameIndex = frames.load(std::memory_order_relaxed);

    colors.assign(frame->pointCount, 0u);
    if (requestColorsCallback) {
        FrameRequest request;
        request.frameIndex = frameIndex;
        request.pointCount = frame->pointCount;
        request.frameTime = std::chrono::steady_clock::now();
        requestColorsCallback(request, colors);
        if (colors.size() != frame->pointCount) {
            logWarning("[OutputLoop] colour callback resized the buffer to ", colors.size(),
                       ", expected ", frame->pointCount, "\n");
            colors.resize(frame->pointCount, 0u);
        }
    }

    EncodeOptions options;
    options.sequence = static_cast<std::uint8_t>(1 + frameIndex % SEQUENCE_SPAN);
    const ColorBufferView view(colors);

    for (const auto& entry : frame->entries) {
        if (!entry.spec || entry.spec->isReleased()) {
            continue;
        }
        const OutputPacketSpec& spec = *entry.spec;

        // Disabled, muted or not-soloed fixtures are sent dark rather than left frozen.
        options.brightness = entry.enabled ? entry.brightness : 0.0f;

        auto packet = spec.encoder().encode(spec, view, options);
        if (!packet) {
            failures.fetch_add(1, std::memory_order_relaxed);
            logError("[OutputLoop] packet '", spec.label(), "' (", toString(spec.protocol()),
                     ") skipped: ", packet.error().message(), "\n");
            continue;
        }
        sink->send(packet->data, packet->size, spec.destination());
        packets.fetch_add(1, std::memory_order_relaxed);
    }

    frames.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void OutputLoop::start() {
    if (running) return; // Already running.
    running = true;
    worker = std::thread([this] {
        this->run();
    });
}

void OutputLoop::stop() {
    running = false;
    if (worker.joinable()) {
        worker.join();
        logInfo("[OutputLoop] stopped after ", framesSent(), " frame(s)\n");
    }
}

void OutputLoop::run() {
    using clock = std::chrono::steady_clock;
    auto next = clock::now();

    while (running.load(std::memory_order_relaxed)) {
        tick();

        const auto interval = std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(1.0 / getFrameRate()));
        next += interval;

        const auto now = clock::now();
        if (next < now) {
            // Fell behind; drop the missed frames instead of bursting to catch up.
            next = now + config::OUTPUT_MIN_SLEEP;
        }
        std::this_thread::sleep_until(next);
    }
}

} // namespace lumen::output
