#include <frameline/render/color.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace frameline::render {

namespace {

std::string trim_lower(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;

    std::string result = text.substr(begin, end - begin);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<Color> parse_hex(const std::string& digits) {
    for (char c : digits) {
        if (hex_value(c) < 0) return std::nullopt;
    }

    auto pair = [&digits](size_t i) {
        return static_cast<uint8_t>(hex_value(digits[i]) * 16 + hex_value(digits[i + 1]));
    };
    auto single = [&digits](size_t i) {
        return static_cast<uint8_t>(hex_value(digits[i]) * 17);
    };

    switch (digits.size()) {
        case 3: return Color::from_rgba8(single(0), single(1), single(2));
        case 4: return Color::from_rgba8(single(0), single(1), single(2), single(3));
        case 6: return Color::from_rgba8(pair(0), pair(2), pair(4));
        case 8: return Color::from_rgba8(pair(0), pair(2), pair(4), pair(6));
        default: return std::nullopt;
    }
}

std::optional<double> parse_number(const std::string& text) {
    std::string value = trim_lower(text);
    if (value.empty()) return std::nullopt;

    char* end = nullptr;
    double result = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

std::optional<Color> parse_function(const std::string& text, size_t open) {
    if (text.back() != ')') return std::nullopt;

    std::string name = text.substr(0, open);
    std::string args = text.substr(open + 1, text.size() - open - 2);

    std::vector<double> values;
    std::stringstream stream(args);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto number = parse_number(item);
        if (!number) return std::nullopt;
        values.push_back(*number);
    }

    bool has_alpha = name == "rgba";
    if (name != "rgb" && !has_alpha) return std::nullopt;
    if (values.size() != (has_alpha ? 4u : 3u)) return std::nullopt;

    auto channel = [](double v) {
        return static_cast<float>(std::clamp(v, 0.0, 255.0) / 255.0);
    };
    float alpha = has_alpha ? static_cast<float>(std::clamp(values[3], 0.0, 1.0)) : 1.0f;
    return Color(channel(values[0]), channel(values[1]), channel(values[2]), alpha);
}

} // anonymous namespace

const char* to_string(ColorSpace space) {
    switch (space) {
        case ColorSpace::SRGB: return "srgb";
        case ColorSpace::DisplayP3: return "display-p3";
        default: return "unknown";
    }
}

std::optional<ColorSpace> parse_color_space(const std::string& name) {
    std::string value = trim_lower(name);
    if (value == "srgb") return ColorSpace::SRGB;
    if (value == "display-p3") return ColorSpace::DisplayP3;
    return std::nullopt;
}

std::string Color::serialize() const {
    auto channel = [](float v) {
        return static_cast<int>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
    };

    std::ostringstream out;
    out << "rgba(" << channel(rgba.r) << ", " << channel(rgba.g) << ", " << channel(rgba.b)
        << ", " << std::clamp(rgba.a, 0.0f, 1.0f) << ")";
    return out.str();
}

std::optional<Color> Color::parse(const std::string& text) {
    std::string value = trim_lower(text);
    if (value.empty()) return std::nullopt;

    if (value[0] == '#') {
        return parse_hex(value.substr(1));
    }

    size_t open = value.find('(');
    if (open == std::string::npos) return std::nullopt;
    return parse_function(value, open);
}

Color Color::from_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
}

} // namespace frameline::render
