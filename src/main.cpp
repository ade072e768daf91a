#include <chrono>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "capture_x11.h"
#include "config.h"
#include "data.h"
#include "engine.h"
#include "protocol.h"
#include "usb.h"

static volatile std::sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS]

Screen-reactive backlight driver for the DX-Light USB LED strip (1a86:fe07).

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit

  -c, --config FILE        Load settings from an INI config file
                           (command-line options override it)

  -m, --mode MODE          ambilight, gaming, film, static, rainbow,
                           breathing, cycle (default: ambilight)
  -b, --brightness PCT     Brightness 0-100 (default: 80)
  -s, --smoothing PCT      Temporal smoothing 0-90 (default: 25)
  -f, --fps N              Target frame rate 15-144 (default: 90)
  -e, --edge PCT           Sampled edge depth 2-20 (default: 6)
  --speed PCT              Effect speed 5-100 (default: 50)
  --mirror                 Swap left and right (strip mounted the other way)
  --color COLOR            Base color for static/breathing: a name,
                           #rrggbb or r,g,b (default: 255,0,80)

  --aspect RATIO           Ignore letterbox bars of content in RATIO
                           (full, 16:9, 21:9, 2.39:1, ... or any W:H)
  --crop L,T,R,B           Crop fractions per side, e.g. 0,0.12,0,0.12
  --display NAME           X display to capture (default: $DISPLAY)
  --region WxH+X+Y         Capture only this area (e.g. one monitor)

  --duration SEC           Stop after SEC seconds (default: run until Ctrl+C)
  --off                    Turn the strip off and exit
  --dump                   Print the three reports of the static color
                           (no device needed)
  --probe                  Show USB interfaces and endpoints for the device
  --list-presets           Print modes, color names and aspect ratios

Examples:
  dxlight-ctl
  dxlight-ctl --mode film --aspect 21:9
  dxlight-ctl --mode gaming --region 2560x1440+1920+0
  dxlight-ctl --mode static --color warm --brightness 60
  dxlight-ctl --mode rainbow --speed 80 --duration 30
  dxlight-ctl --config dxlight.ini

Note: Run as root or install a udev rule for non-root access, e.g.
  SUBSYSTEM=="usb", ATTR{idVendor}=="1a86", ATTR{idProduct}=="fe07", MODE="0666"
)";
}

// -----------------------------------------------------------------------
// --dump
// -----------------------------------------------------------------------
static void dump_reports(const Config& cfg) {
    EffectParams p;
    p.brightness = cfg.engine.brightness / 100.0;
    p.base       = cfg.engine.color;
    LedFrame leds = effect_static(p);

    std::cout << "=== Static color " << static_cast<int>(leds[0].r) << ","
              << static_cast<int>(leds[0].g) << "," << static_cast<int>(leds[0].b)
              << (cfg.engine.mirror ? " (mirrored)" : "") << " ===\n";

    ReportSet reports = build_reports(leds, 0, cfg.engine.mirror);
    for (size_t i = 0; i < reports.size(); ++i)
        hexdump_report(reports[i], "report " + std::to_string(i + 1) + "/" +
                                   std::to_string(reports.size()));
}

// -----------------------------------------------------------------------
// Streaming
// -----------------------------------------------------------------------
static int run_engine(const Config& cfg, double duration) {
    auto strip = std::make_shared<UsbLightStrip>();

    std::shared_ptr<X11FrameSource> source;
    int screen_w = 0, screen_h = 0;
    if (is_capture_mode(cfg.engine.mode)) {
        source   = std::make_shared<X11FrameSource>(cfg.capture.display, cfg.capture.region);
        screen_w = source->width();
        screen_h = source->height();
        std::cout << "Capturing " << screen_w << "x" << screen_h << "\n";
    }

    EngineConfig ecfg = to_engine_config(cfg, screen_w, screen_h);

    LedEngine engine(strip, source);
    engine.set_config(ecfg);

    std::cout << "Opening DX-Light (" << std::hex << std::setfill('0')
              << std::setw(4) << DXLIGHT_VID << ":" << std::setw(4) << DXLIGHT_PID
              << std::dec << ")...\n";
    if (!engine.start())
        return 1;

    std::cout << "Running in " << mode_name(ecfg.mode) << " mode at up to "
              << ecfg.target_fps << " fps. Ctrl+C to stop.\n";

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    using clock = std::chrono::steady_clock;
    const auto started     = clock::now();
    auto       last_report = started;
    int        exit_code   = 0;

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (engine.state() == EngineState::Idle) {
            std::cerr << "Error: render loop stopped unexpectedly\n";
            exit_code = 1;
            break;
        }

        const auto now = clock::now();
        if (now - last_report >= std::chrono::seconds(1)) {
            last_report = now;
            std::cout << "\r" << std::fixed << std::setprecision(1)
                      << engine.observed_fps() << " fps   " << std::flush;
        }

        if (duration > 0.0 &&
            std::chrono::duration<double>(now - started).count() >= duration)
            break;
    }

    std::cout << "\nStopping...\n";
    engine.stop();
    return exit_code;
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",         no_argument,       nullptr, 'h'},
        {"version",      no_argument,       nullptr, 'V'},
        {"config",       required_argument, nullptr, 'c'},
        {"mode",         required_argument, nullptr, 'm'},
        {"brightness",   required_argument, nullptr, 'b'},
        {"smoothing",    required_argument, nullptr, 's'},
        {"fps",          required_argument, nullptr, 'f'},
        {"edge",         required_argument, nullptr, 'e'},
        {"speed",        required_argument, nullptr, 1001},
        {"mirror",       no_argument,       nullptr, 1002},
        {"color",        required_argument, nullptr, 1003},
        {"aspect",       required_argument, nullptr, 1004},
        {"crop",         required_argument, nullptr, 1005},
        {"display",      required_argument, nullptr, 1006},
        {"region",       required_argument, nullptr, 1007},
        {"duration",     required_argument, nullptr, 1008},
        {"off",          no_argument,       nullptr, 1009},
        {"dump",         no_argument,       nullptr, 1010},
        {"probe",        no_argument,       nullptr, 1011},
        {"list-presets", no_argument,       nullptr, 1012},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    bool        do_off   = false;
    bool        do_dump  = false;
    bool        do_probe = false;
    double      duration = 0.0;
    std::string config_file;
    std::string mode_arg;
    std::string crop_arg;

    struct SettingArg { std::string section; std::string key; std::string value; };
    std::vector<SettingArg> setting_args;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVc:m:b:s:f:e:", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "dxlight-ctl " << VERSION << "\n";
            return 0;

        case 'c':
            config_file = optarg;
            break;

        case 'm':
            mode_arg = optarg;
            break;

        case 'b': setting_args.push_back({"engine", "brightness", optarg}); break;
        case 's': setting_args.push_back({"engine", "smoothing",  optarg}); break;
        case 'f': setting_args.push_back({"engine", "fps",        optarg}); break;
        case 'e': setting_args.push_back({"engine", "edge",       optarg}); break;
        case 1001: setting_args.push_back({"engine", "speed",     optarg}); break;
        case 1002: setting_args.push_back({"engine", "mirror",    "1"});    break;
        case 1003: setting_args.push_back({"engine", "color",     optarg}); break;
        case 1004: setting_args.push_back({"crop",   "aspect",    optarg}); break;
        case 1006: setting_args.push_back({"capture", "display",  optarg}); break;
        case 1007: setting_args.push_back({"capture", "region",   optarg}); break;

        case 1005:  // --crop L,T,R,B
            crop_arg = optarg;
            break;

        case 1008:  // --duration SEC
            try {
                duration = std::stod(optarg);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --duration argument\n";
                return 1;
            }
            if (duration < 0.0) {
                std::cerr << "Error: --duration must not be negative\n";
                return 1;
            }
            break;

        case 1009:
            do_off = true;
            break;

        case 1010:
            do_dump = true;
            break;

        case 1011:
            do_probe = true;
            break;

        case 1012:  // --list-presets
            list_presets();
            return 0;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
        return 1;
    }

    // ---- build the configuration: file, then mode preset, then explicit values ----
    Config cfg;
    try {
        if (!config_file.empty()) {
            std::cout << "Loading config: " << config_file << "\n";
            cfg = parse_config_file(config_file);
        }
        if (!mode_arg.empty())
            setting_args.insert(setting_args.begin(), SettingArg{"engine", "mode", mode_arg});
        for (auto& s : setting_args) {
            if (!apply_setting(cfg, s.section, s.key, s.value))
                throw std::runtime_error("Unsupported option " + s.section + "." + s.key);
        }
        if (!crop_arg.empty()) {
            CropRegion crop;
            if (!parse_crop(crop_arg, crop))
                throw std::runtime_error("--crop expects L,T,R,B fractions (e.g. 0,0.12,0,0.12)");
            cfg.crop.region     = crop;
            cfg.crop.use_aspect = false;
        }
        validate_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // ---- --dump (no device) ----
    if (do_dump) {
        dump_reports(cfg);
        return 0;
    }

    try {
        // ---- --probe / --off ----
        if (do_probe || do_off) {
            UsbLightStrip strip;
            strip.open();
            if (do_probe) {
                std::cout << "=== USB endpoint probe ===\n";
                strip.probe();
            }
            if (do_off) {
                FrameRenderer renderer(strip, nullptr);
                renderer.send_frame(LedFrame{}, false);
                std::cout << "Strip turned off.\n";
            }
            strip.close();
            return 0;
        }

        return run_engine(cfg, duration);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
