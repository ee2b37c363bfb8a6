#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "lumen/output/OutputPacketSpec.hpp"

namespace lumen::output {

/**
 * @brief Information provided when the loop asks for the next frame of colours.
 */
struct FrameRequest {
    /// Running frame counter, starting at 0.
    std::uint64_t frameIndex = 0;

    /// Size of the colour buffer: one ARGB word per point of the structure.
    std::size_t pointCount = 0;

    /// When the frame is being produced (advisory, for animation timing).
    std::chrono::steady_clock::time_point frameTime{};
};

/**
 * @brief Callback contract for colour generation.
 *
 * @p colors arrives sized to `request.pointCount` and cleared to black. The
 * callback writes one 0xAARRGGBB value per point index. It must not resize the
 * buffer; a buffer left at the wrong size is corrected (and logged) before
 * encoding.
 */
using RequestColorsCallback =
    std::function<void(const FrameRequest& request, std::vector<std::uint32_t>& colors)>;

/// Returns the currently published output frame (e.g. Structure::outputFrame()).
using FrameSource = std::function<std::shared_ptr<const OutputFrame>()>;

/**
 * @brief Output worker: pulls colours, encodes every published packet, sends it.
 *
 * Threading model:
 * - start() launches a worker thread that calls tick() at the configured
 *   frame rate until stop(). tick() may also be called manually (tests,
 *   applications with their own render loop); do not mix both.
 * - `running` is an atomic flag checked by the loop.
 * - The frame source and the packet specs it returns are read-only here;
 *   released specs are skipped.
 *
 * A packet that fails to encode is logged and skipped; the rest of the frame
 * still goes out.
 */
class OutputLoop {
public:
    OutputLoop(FrameSource frameSource, std::shared_ptr<PacketSink> sink);
    ~OutputLoop();

    OutputLoop(const OutputLoop&) = delete;
    OutputLoop& operator=(const OutputLoop&) = delete;

    void setRequestColorsCallback(const RequestColorsCallback& callback);

    /// Produces and sends one frame. Returns false when there is nothing to send.
    bool tick();

    /// Start the worker thread.
    void start();

    /// Request the thread to stop and wait for it to finish.
    void stop();

    bool isRunning() const { return running.load(std::memory_order_relaxed); }

    /// Frames per second, clamped to [OUTPUT_FRAME_RATE_MIN, OUTPUT_FRAME_RATE_MAX].
    void setFrameRate(double framesPerSecond);
    double getFrameRate() const;

    std::uint64_t framesSent() const { return frames.load(std::memory_order_relaxed); }
    std::uint64_t packetsSent() const { return packets.load(std::memory_order_relaxed); }
    std::uint64_t encodeFailures() const { return failures.load(std::memory_order_relaxed); }

private:
    void run();

    FrameSource frameSource;
    std::shared_ptr<PacketSink> sink;
    RequestColorsCallback requestColorsCallback{};

    /// Reused colour buffer; only touched by whichever thread runs tick().
    std::vector<std::uint32_t> colors;

    std::atomic<double> frameRate;
    std::atomic<std::uint64_t> frames{0};
    std::atomic<std::uint64_t> packets{0};
    std::atomic<std::uint64_t> failures{0};

    std::thread worker;
    std::atomic<bool> running{false};
};

} // namespace lumen::output
