#include "data.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>
#include <vector>

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// -----------------------------------------------------------------------
// Modes
// -----------------------------------------------------------------------
static const std::vector<std::pair<std::string, Mode>> mode_names = {
    {"ambilight",   Mode::Ambilight},
    {"gaming",      Mode::Gaming   },
    {"film",        Mode::Film     },
    {"static",      Mode::Static   },
    {"rainbow",     Mode::Rainbow  },
    {"breathing",   Mode::Breathing},
    {"cycle",       Mode::Cycle    },
    // Aliases
    {"color_cycle", Mode::Cycle    },
    {"steady",      Mode::Static   },
};

bool parse_mode(const std::string& name, Mode& out) {
    std::string key = to_lower(name);
    for (auto& [n, m] : mode_names) {
        if (n == key) {
            out = m;
            return true;
        }
    }
    return false;
}

const char* mode_name(Mode mode) {
    for (auto& [n, m] : mode_names)
        if (m == mode) return n.c_str();
    return "unknown";
}

// Gaming reacts fast on a thin edge, film blends slowly over a wide one.
bool mode_preset(Mode mode, ModePreset& out) {
    switch (mode) {
        case Mode::Gaming: out = {10, 144, 4};  return true;
        case Mode::Film:   out = {50,  60, 10}; return true;
        default:           return false;
    }
}

// -----------------------------------------------------------------------
// Named colors
// -----------------------------------------------------------------------
static const std::map<std::string, LedColor> color_names = {
    {"red",     {255,   0,   0}},
    {"green",   {  0, 255,   0}},
    {"blue",    {  0,   0, 255}},
    {"white",   {255, 255, 255}},
    {"yellow",  {255, 255,   0}},
    {"cyan",    {  0, 255, 255}},
    {"magenta", {255,   0, 255}},
    {"orange",  {255, 128,   0}},
    {"purple",  {128,   0, 255}},
    {"pink",    {255,   0, 128}},
    {"warm",    {255, 180, 100}},  // warm white
    {"off",     {  0,   0,   0}},
    {"black",   {  0,   0,   0}},
    // German names
    {"rot",     {255,   0,   0}},
    {"gruen",   {  0, 255,   0}},
    {"blau",    {  0,   0, 255}},
    {"weiss",   {255, 255, 255}},
    {"gelb",    {255, 255,   0}},
    {"lila",    {128,   0, 255}},
    {"rosa",    {255,   0, 128}},
};

bool parse_color(const std::string& s, LedColor& out) {
    std::string str = to_lower(s);

    auto it = color_names.find(str);
    if (it != color_names.end()) {
        out = it->second;
        return true;
    }

    // r,g,b
    if (str.find(',') != std::string::npos) {
        std::istringstream iss(str);
        std::string part;
        int vals[3];
        int n = 0;
        while (std::getline(iss, part, ',')) {
            if (n >= 3) return false;
            try {
                size_t used = 0;
                int v = std::stoi(part, &used);
                if (used != part.size() || v < 0 || v > 255) return false;
                vals[n++] = v;
            } catch (const std::exception&) {
                return false;
            }
        }
        if (n != 3) return false;
        out = {static_cast<uint8_t>(vals[0]),
               static_cast<uint8_t>(vals[1]),
               static_cast<uint8_t>(vals[2])};
        return true;
    }

    // #rrggbb / rrggbb
    std::string hex = str;
    if (!hex.empty() && hex[0] == '#') hex = hex.substr(1);
    auto is_hex = [](unsigned char c) { return std::isxdigit(c) != 0; };
    if (hex.size() != 6 || !std::all_of(hex.begin(), hex.end(), is_hex))
        return false;
    uint32_t v = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    out = {static_cast<uint8_t>((v >> 16) & 0xff),
           static_cast<uint8_t>((v >>  8) & 0xff),
           static_cast<uint8_t>( v        & 0xff)};
    return true;
}

// -----------------------------------------------------------------------
// Aspect ratios
// -----------------------------------------------------------------------
static const std::vector<std::pair<std::string, double>> aspect_presets = {
    {"full",   0.0},
    {"16:9",   16.0 / 9.0},
    {"16:10",  16.0 / 10.0},
    {"21:9",   21.0 / 9.0},
    {"32:9",   32.0 / 9.0},
    {"4:3",    4.0 / 3.0},
    {"2.35:1", 2.35},
    {"2.39:1", 2.39},
    {"1:1",    1.0},
};

bool parse_aspect(const std::string& name, double& ratio) {
    std::string key = to_lower(name);
    if (key == "monitor" || key == "none") key = "full";

    for (auto& [n, r] : aspect_presets) {
        if (n == key) {
            ratio = r;
            return true;
        }
    }

    // Free-form W:H
    auto colon = key.find(':');
    if (colon == std::string::npos) return false;
    try {
        size_t used_w = 0, used_h = 0;
        std::string ws = key.substr(0, colon);
        std::string hs = key.substr(colon + 1);
        double w = std::stod(ws, &used_w);
        double h = std::stod(hs, &used_h);
        if (used_w != ws.size() || used_h != hs.size() || w <= 0.0 || h <= 0.0)
            return false;
        ratio = w / h;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

CropRegion crop_for_aspect(int screen_w, int screen_h, double ratio) {
    CropRegion crop;
    if (ratio <= 0.0 || screen_w <= 0 || screen_h <= 0)
        return crop;

    double screen_ratio = static_cast<double>(screen_w) / screen_h;
    if (std::fabs(ratio - screen_ratio) < 0.01)
        return crop;

    if (ratio < screen_ratio) {
        // Pillarbox: bars left and right.
        double content_w = screen_h * ratio;
        crop.left = crop.right = (screen_w - content_w) / 2.0 / screen_w;
    } else {
        // Letterbox: bars top and bottom.
        double content_h = screen_w / ratio;
        crop.top = crop.bottom = (screen_h - content_h) / 2.0 / screen_h;
    }
    return crop;
}

// -----------------------------------------------------------------------
// --list-presets
// -----------------------------------------------------------------------
void list_presets() {
    std::cout << "Modes:\n";
    for (auto& [n, m] : mode_names) {
        std::cout << "  " << n;
        ModePreset p;
        if (mode_preset(m, p))
            std::cout << "  (smoothing " << p.smoothing << "%, " << p.fps
                      << " fps, edge " << p.edge << "%)";
        std::cout << "\n";
    }

    std::cout << "\nColors (or #rrggbb, or r,g,b):\n";
    for (auto& [n, c] : color_names) {
        std::cout << "  " << n << "  (" << static_cast<int>(c.r) << ","
                  << static_cast<int>(c.g) << "," << static_cast<int>(c.b) << ")\n";
    }

    std::cout << "\nAspect ratios (or any W:H):\n";
    for (auto& [n, r] : aspect_presets)
        std::cout << "  " << n << "\n";
}
