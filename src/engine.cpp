#include "engine.h"

#include <algorithm>
#include <iostream>

#include "smoother.h"

const char* engine_state_name(EngineState s) {
    switch (s) {
        case EngineState::Idle:       return "idle";
        case EngineState::Connecting: return "connecting";
        case EngineState::Running:    return "running";
        case EngineState::Stopping:   return "stopping";
    }
    return "unknown";
}

// -----------------------------------------------------------------------
// FpsCounter
// -----------------------------------------------------------------------

void FpsCounter::record(double seconds) {
    _samples.push_back(seconds);
    _sum += seconds;
    if (_samples.size() > FPS_WINDOW) {
        _sum -= _samples.front();
        _samples.pop_front();
    }
}

double FpsCounter::fps() const {
    if (_samples.empty()) return 0.0;
    double mean = _sum / static_cast<double>(_samples.size());
    return 1.0 / std::max(0.001, mean);
}

// -----------------------------------------------------------------------
// FrameRenderer
// -----------------------------------------------------------------------

FrameRenderer::FrameRenderer(HidTransport& transport, FrameSource* source)
    : _transport(transport), _source(source) {}

LedFrame FrameRenderer::compute_target(const EngineConfig& cfg, double elapsed) {
    if (is_capture_mode(cfg.mode)) {
        // On a failed grab keep showing the previous colors instead of
        // flashing black.
        _capture_ok = _source && _source->capture(_frame);
        if (_capture_ok)
            _last_target = sample_zones(_frame, cfg.crop, cfg.edge_depth, cfg.brightness);
        return _last_target;
    }

    EffectParams p;
    p.elapsed    = elapsed;
    p.speed      = cfg.speed;
    p.brightness = cfg.brightness;
    p.base       = cfg.color;
    _last_target = render_effect(cfg.mode, p);
    _capture_ok  = true;
    return _last_target;
}

const LedFrame& FrameRenderer::tick(const EngineConfig& cfg, double elapsed) {
    LedFrame target = compute_target(cfg, elapsed);
    LedFrame next   = smooth_frame(_current, target, cfg.smoothing);
    send_frame(next, cfg.mirror);
    _current = next;
    return _current;
}

void FrameRenderer::send_frame(const LedFrame& leds, bool mirror) {
    ReportSet reports = build_reports(leds, _counter, mirror);
    for (const Report& r : reports)
        _transport.send(r);
    ++_counter;  // wraps at 256
}

// -----------------------------------------------------------------------
// LedEngine
// -----------------------------------------------------------------------

LedEngine::LedEngine(std::shared_ptr<HidTransport> transport,
                     std::shared_ptr<FrameSource> source)
    : _transport(std::move(transport)),
      _source(std::move(source)),
      _shared(std::make_shared<Shared>()) {
    _shared->config = std::make_shared<const EngineConfig>();
}

LedEngine::~LedEngine() {
    stop();
}

bool LedEngine::start() {
    if (_abandoned) {
        std::lock_guard<std::mutex> lk(_abandoned->mutex);
        if (!_abandoned->finished) {
            std::cerr << "Error: abandoned render loop has not exited yet, cannot start\n";
            return false;
        }
    }
    _abandoned.reset();

    bool run_active = false;
    bool run_stopping = false;
    if (_run) {
        std::lock_guard<std::mutex> lk(_run->mutex);
        run_active   = !_run->finished;
        run_stopping = _run->stop_requested;
    }

    EngineState s = _shared->state.load();
    if (s == EngineState::Running && run_active && !run_stopping)
        return true;

    if (s != EngineState::Idle || run_active) {
        std::cerr << "Error: previous render loop is still " << engine_state_name(s)
                  << ", cannot start\n";
        return false;
    }
    if (_worker.joinable())
        _worker.join();

    _shared->state = EngineState::Connecting;
    try {
        _transport->open(DXLIGHT_VID, DXLIGHT_PID);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        _shared->state = EngineState::Idle;
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(_shared->leds_mutex);
        _shared->leds = LedFrame{};
    }
    _shared->fps   = 0.0;
    _shared->state = EngineState::Running;

    _run    = std::make_shared<RunControl>();
    _worker = std::thread(&LedEngine::_loop, _shared, _run, _transport, _source);
    return true;
}

void LedEngine::stop() {
    if (!_run) return;

    bool done;
    {
        std::unique_lock<std::mutex> lk(_run->mutex);
        _run->stop_requested = true;
        _run->cv.notify_all();
        done = _run->cv.wait_for(lk, STOP_TIMEOUT, [this] { return _run->finished; });
    }

    if (done) {
        if (_worker.joinable()) _worker.join();
        _run.reset();
        return;
    }

    // The worker is stuck in a capture or send. Let it finish on its own;
    // start() refuses until it has.
    std::cerr << "Warning: render loop did not stop within "
              << STOP_TIMEOUT.count() << " ms, abandoning it\n";
    if (_worker.joinable()) _worker.detach();
    _abandoned = std::move(_run);
}

void LedEngine::set_config(const EngineConfig& cfg) {
    auto snapshot = std::make_shared<const EngineConfig>(cfg);
    std::lock_guard<std::mutex> lk(_shared->config_mutex);
    _shared->config = std::move(snapshot);
}

EngineConfig LedEngine::config() const {
    std::lock_guard<std::mutex> lk(_shared->config_mutex);
    return *_shared->config;
}

EngineState LedEngine::state() const {
    return _shared->state.load();
}

double LedEngine::observed_fps() const {
    return _shared->fps.load();
}

LedFrame LedEngine::current_leds() const {
    std::lock_guard<std::mutex> lk(_shared->leds_mutex);
    return _shared->leds;
}

// --- worker ---

void LedEngine::_loop(std::shared_ptr<Shared> shared,
                      std::shared_ptr<RunControl> run,
                      std::shared_ptr<HidTransport> transport,
                      std::shared_ptr<FrameSource> source) {
    using clock = std::chrono::steady_clock;

    FrameRenderer renderer(*transport, source.get());
    FpsCounter    fps;
    bool          capture_ok = true;

    const clock::time_point loop_start = clock::now();
    clock::time_point       prev_start;
    bool                    first = true;

    for (;;) {
        {
            std::lock_guard<std::mutex> lk(run->mutex);
            if (run->stop_requested) break;
        }

        const clock::time_point t0 = clock::now();
        if (!first) {
            fps.record(std::chrono::duration<double>(t0 - prev_start).count());
            shared->fps = fps.fps();
        }
        first      = false;
        prev_start = t0;

        std::shared_ptr<const EngineConfig> cfg;
        {
            std::lock_guard<std::mutex> lk(shared->config_mutex);
            cfg = shared->config;
        }

        const double elapsed = std::chrono::duration<double>(t0 - loop_start).count();
        try {
            renderer.tick(*cfg, elapsed);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << " - device disconnected, stopping\n";
            break;
        }

        if (renderer.last_capture_ok() != capture_ok) {
            capture_ok = renderer.last_capture_ok();
            if (!capture_ok)
                std::cerr << "Warning: screen capture failed, holding last frame\n";
            else
                std::cout << "Screen capture recovered.\n";
        }

        {
            std::lock_guard<std::mutex> lk(shared->leds_mutex);
            shared->leds = renderer.current();
        }

        // Pace to the target rate; a slow tick runs the next one at once.
        const auto budget = std::chrono::duration<double>(1.0 / std::max(1, cfg->target_fps));
        const auto wait   = budget - (clock::now() - t0);
        if (wait.count() > 0.0) {
            std::unique_lock<std::mutex> lk(run->mutex);
            run->cv.wait_for(lk, wait, [&run] { return run->stop_requested; });
        }
    }

    shared->state = EngineState::Stopping;

    // Blank the strip; the device may already be gone.
    try {
        renderer.send_frame(LedFrame{}, false);
    } catch (const std::exception& e) {
        std::cerr << "Warning: could not blank the strip: " << e.what() << "\n";
    }
    transport->close();

    {
        std::lock_guard<std::mutex> lk(shared->leds_mutex);
        shared->leds = LedFrame{};
    }
    shared->fps = 0.0;

    {
        std::lock_guard<std::mutex> lk(run->mutex);
        run->finished = true;
        run->cv.notify_all();
    }
    // Idle last: once it is visible, start() may launch a new worker.
    shared->state = EngineState::Idle;
}
