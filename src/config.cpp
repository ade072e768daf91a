#include "config.h"
#include "data.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Whole-string integer; throws std::runtime_error naming `what`.
static int parse_int(const std::string& value, const std::string& what) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size()) return v;
    } catch (const std::exception&) {
    }
    throw std::runtime_error("Invalid " + what + " '" + value + "'");
}

static double parse_double(const std::string& value, const std::string& what) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used == value.size()) return v;
    } catch (const std::exception&) {
    }
    throw std::runtime_error("Invalid " + what + " '" + value + "'");
}

static bool parse_bool(const std::string& value, bool& out) {
    std::string v = to_lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

static int clamp_int(int v, int lo, int hi) {
    return std::max(lo, std::min(hi, v));
}

// Crop fraction in [0,1).
static double parse_fraction(const std::string& value, const std::string& what) {
    double v = parse_double(value, what);
    if (v < 0.0 || v >= 1.0)
        throw std::runtime_error(what + " must be in [0, 1) (got " + value + ")");
    return v;
}

// -----------------------------------------------------------------------
// Settings
// -----------------------------------------------------------------------

static bool apply_engine_setting(Config::EngineSection& e,
                                 const std::string& key, const std::string& value) {
    if (key == "mode") {
        Mode m;
        if (!parse_mode(value, m))
            throw std::runtime_error("Unknown mode '" + value + "'");
        e.mode = m;
        ModePreset p;
        if (mode_preset(m, p)) {
            e.smoothing = p.smoothing;
            e.fps       = p.fps;
            e.edge      = p.edge;
        }
    } else if (key == "brightness") {
        e.brightness = clamp_int(parse_int(value, "brightness"), BRIGHTNESS_MIN, BRIGHTNESS_MAX);
    } else if (key == "smoothing") {
        e.smoothing = clamp_int(parse_int(value, "smoothing"), SMOOTHING_MIN, SMOOTHING_MAX);
    } else if (key == "fps") {
        int f = parse_int(value, "fps");
        if (f <= 0)
            throw std::runtime_error("fps must be positive (got " + value + ")");
        e.fps = clamp_int(f, FPS_MIN, FPS_MAX);
    } else if (key == "edge") {
        e.edge = clamp_int(parse_int(value, "edge"), EDGE_MIN, EDGE_MAX);
    } else if (key == "speed") {
        e.speed = clamp_int(parse_int(value, "speed"), SPEED_MIN, SPEED_MAX);
    } else if (key == "mirror") {
        if (!parse_bool(value, e.mirror))
            throw std::runtime_error("Invalid mirror flag '" + value + "'");
    } else if (key == "color") {
        if (!parse_color(value, e.color))
            throw std::runtime_error("Invalid color '" + value + "'");
    } else {
        return false;
    }
    return true;
}

static bool apply_crop_setting(Config::CropSection& c,
                               const std::string& key, const std::string& value) {
    if (key == "aspect") {
        if (!parse_aspect(value, c.aspect))
            throw std::runtime_error("Unknown aspect ratio '" + value + "'");
        c.use_aspect = true;
    } else if (key == "left") {
        c.region.left = parse_fraction(value, "crop left");
        c.use_aspect  = false;
    } else if (key == "top") {
        c.region.top = parse_fraction(value, "crop top");
        c.use_aspect = false;
    } else if (key == "right") {
        c.region.right = parse_fraction(value, "crop right");
        c.use_aspect   = false;
    } else if (key == "bottom") {
        c.region.bottom = parse_fraction(value, "crop bottom");
        c.use_aspect    = false;
    } else {
        return false;
    }
    return true;
}

static bool apply_capture_setting(Config::CaptureSection& c,
                                  const std::string& key, const std::string& value) {
    if (key == "display") {
        c.display = value;
    } else if (key == "region") {
        if (!parse_region(value, c.region))
            throw std::runtime_error("Invalid region '" + value + "' (expected WxH+X+Y)");
    } else {
        return false;
    }
    return true;
}

bool apply_setting(Config& cfg, const std::string& section,
                   const std::string& key, const std::string& value) {
    if (section == "engine")  return apply_engine_setting(cfg.engine, key, value);
    if (section == "crop")    return apply_crop_setting(cfg.crop, key, value);
    if (section == "capture") return apply_capture_setting(cfg.capture, key, value);
    return false;
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config(std::istream& in) {
    Config cfg;
    std::string section;
    int lineno = 0;

    // Regex patterns
    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        // Section header
        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        // Key=value pair
        if (std::regex_match(line, m, re_kv)) {
            std::string key   = to_lower(trim(m[1].str()));
            std::string value = trim(m[2].str());

            // Strip a trailing "; comment"
            auto semi = value.find(';');
            if (semi != std::string::npos) value = trim(value.substr(0, semi));

            bool known;
            try {
                known = apply_setting(cfg, section, key, value);
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(std::string(e.what()) + " at line " +
                                         std::to_string(lineno));
            }
            if (!known)
                std::cerr << "Warning: ignoring unknown key '" << key << "' in ["
                          << section << "] at line " << lineno << "\n";
            continue;
        }

        throw std::runtime_error("Syntax error at line " + std::to_string(lineno) +
                                 ": " + line);
    }

    return cfg;
}

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path);
    return parse_config(f);
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_config(const Config& cfg) {
    if (cfg.crop.use_aspect) return;  // preset crops are always valid

    const CropRegion& c = cfg.crop.region;
    for (double v : {c.left, c.top, c.right, c.bottom}) {
        if (v < 0.0 || v >= 1.0)
            throw std::runtime_error("Crop fractions must be in [0, 1)");
    }
    if (c.left + c.right >= 1.0)
        throw std::runtime_error("Crop left + right must be below 1 (nothing left to sample)");
    if (c.top + c.bottom >= 1.0)
        throw std::runtime_error("Crop top + bottom must be below 1 (nothing left to sample)");
}

// -----------------------------------------------------------------------
// Region / crop strings
// -----------------------------------------------------------------------

bool parse_region(const std::string& s, CaptureRegion& out) {
    static const std::regex re(R"(^(\d+)x(\d+)(?:\+(-?\d+)\+(-?\d+))?$)");
    std::smatch m;
    std::string str = to_lower(trim(s));
    if (!std::regex_match(str, m, re)) return false;

    try {
        CaptureRegion r;
        r.width  = std::stoi(m[1].str());
        r.height = std::stoi(m[2].str());
        r.x      = m[3].matched ? std::stoi(m[3].str()) : 0;
        r.y      = m[4].matched ? std::stoi(m[4].str()) : 0;
        if (r.width <= 0 || r.height <= 0) return false;
        out = r;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_crop(const std::string& s, CropRegion& out) {
    std::istringstream iss(s);
    std::string part;
    double vals[4];
    int n = 0;
    while (std::getline(iss, part, ',')) {
        if (n >= 4) return false;
        try {
            vals[n++] = parse_double(trim(part), "crop");
        } catch (const std::runtime_error&) {
            return false;
        }
    }
    if (n != 4) return false;
    out.left   = vals[0];
    out.top    = vals[1];
    out.right  = vals[2];
    out.bottom = vals[3];
    return true;
}

// -----------------------------------------------------------------------
// Conversion
// -----------------------------------------------------------------------

EngineConfig to_engine_config(const Config& cfg, int screen_w, int screen_h) {
    EngineConfig e;
    e.mode       = cfg.engine.mode;
    e.brightness = cfg.engine.brightness / 100.0;
    e.smoothing  = cfg.engine.smoothing / 100.0;
    e.target_fps = cfg.engine.fps;
    e.edge_depth = cfg.engine.edge / 100.0;
    e.mirror     = cfg.engine.mirror;
    e.color      = cfg.engine.color;
    e.speed      = cfg.engine.speed / 50.0;
    e.crop       = cfg.crop.use_aspect
                       ? crop_for_aspect(screen_w, screen_h, cfg.crop.aspect)
                       : cfg.crop.region;
    return e;
}
