#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "capture.h"
#include "color.h"
#include "effects.h"
#include "protocol.h"
#include "sampler.h"
#include "transport.h"

// Everything the render loop needs for one tick. Built at the configuration
// boundary (config.h) and treated as immutable once handed to the engine.
struct EngineConfig {
    Mode       mode       = Mode::Ambilight;
    double     brightness = 0.8;   // 0..1
    double     smoothing  = 0.25;  // 0..1, 0 = instant
    int        target_fps = 90;
    double     edge_depth = 0.06;  // fraction of the shorter sampled side
    bool       mirror     = false;
    LedColor   color      = {255, 0, 80};
    double     speed      = 1.0;   // effect speed multiplier
    CropRegion crop;
};

enum class EngineState : uint8_t {
    Idle,
    Connecting,
    Running,
    Stopping,
};

const char* engine_state_name(EngineState s);

// How long stop() waits for the worker before giving up on it.
static constexpr std::chrono::milliseconds STOP_TIMEOUT{2000};

// Number of ticks averaged for the observed frame rate.
static constexpr size_t FPS_WINDOW = 30;

// -----------------------------------------------------------------------
// FpsCounter
//
// Rolling mean of the last FPS_WINDOW tick durations.
// -----------------------------------------------------------------------
class FpsCounter {
public:
    void record(double seconds);
    double fps() const;
    void reset() { _samples.clear(); _sum = 0.0; }

private:
    std::deque<double> _samples;
    double _sum = 0.0;
};

// -----------------------------------------------------------------------
// FrameRenderer
//
// One tick of the pipeline on a single device session: produce the target
// colors (capture or effect), smooth, encode, send. Holds the per-session
// state: frame counter, smoothed output, last good capture.
// Not thread-safe; owned by the render worker.
// -----------------------------------------------------------------------
class FrameRenderer {
public:
    // `source` may be null; capture modes then hold their last target.
    FrameRenderer(HidTransport& transport, FrameSource* source);

    // Run one tick with `cfg` at `elapsed` seconds since the loop started.
    // Throws std::runtime_error if the transport fails; the counter only
    // advances on a fully sent frame.
    const LedFrame& tick(const EngineConfig& cfg, double elapsed);

    // Send `leds` as-is (no smoothing) with the current counter.
    void send_frame(const LedFrame& leds, bool mirror);

    // Compute this tick's pre-smoothing colors.
    LedFrame compute_target(const EngineConfig& cfg, double elapsed);

    uint8_t counter() const { return _counter; }
    const LedFrame& current() const { return _current; }

    // False if the most recent capture attempt failed.
    bool last_capture_ok() const { return _capture_ok; }

private:
    HidTransport& _transport;
    FrameSource*  _source;

    uint8_t  _counter = 0;
    LedFrame _current{};     // smoothed output, also the smoothing state
    LedFrame _last_target{}; // last pre-smoothing frame (held on capture failure)
    RawFrame _frame;         // reused capture buffer
    bool     _capture_ok = true;
};

// -----------------------------------------------------------------------
// LedEngine
//
// Owns the render worker and its state machine:
//
//   Idle -> Connecting -> Running -> Stopping -> Idle
//
// start() opens the transport and launches the worker; the worker ticks
// until stop() or a transport failure, then sends a black frame
// (best-effort) and closes the transport. Config is swapped in as a whole
// snapshot and read once per tick.
// -----------------------------------------------------------------------
class LedEngine {
public:
    LedEngine(std::shared_ptr<HidTransport> transport,
              std::shared_ptr<FrameSource> source);
    ~LedEngine();

    // Non-copyable
    LedEngine(const LedEngine&) = delete;
    LedEngine& operator=(const LedEngine&) = delete;

    // Connect and start streaming. Returns false (engine stays Idle) if the
    // device cannot be opened or a previous worker has not exited yet.
    bool start();

    // Request the worker to stop and wait up to STOP_TIMEOUT for it. A
    // worker that misses the timeout is detached; calling stop() again
    // returns at once.
    void stop();

    void set_config(const EngineConfig& cfg);
    EngineConfig config() const;

    EngineState state() const;
    bool is_running() const { return state() == EngineState::Running; }

    // Observed frame rate of the current session (0 when idle).
    double observed_fps() const;

    // Last smoothed output, for previews.
    LedFrame current_leds() const;

private:
    // State shared with the worker. Reference counted so a worker that
    // missed the stop timeout never outlives what it touches.
    struct Shared {
        mutable std::mutex                  config_mutex;
        std::shared_ptr<const EngineConfig> config;

        mutable std::mutex leds_mutex;
        LedFrame           leds{};

        std::atomic<double>      fps{0.0};
        std::atomic<EngineState> state{EngineState::Idle};
    };

    // One worker run.
    struct RunControl {
        std::mutex              mutex;
        std::condition_variable cv;
        bool                    stop_requested = false;
        bool                    finished       = false;
    };

    std::shared_ptr<HidTransport> _transport;
    std::shared_ptr<FrameSource>  _source;
    std::shared_ptr<Shared>       _shared;
    std::shared_ptr<RunControl>   _run;
    std::shared_ptr<RunControl>   _abandoned;  // detached after a stop timeout
    std::thread                   _worker;

    static void _loop(std::shared_ptr<Shared> shared,
                      std::shared_ptr<RunControl> run,
                      std::shared_ptr<HidTransport> transport,
                      std::shared_ptr<FrameSource> source);
};
