#include "rendering/Palette.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace orrery {

namespace {

const std::unordered_map<std::string, Color>& namedColors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black",   {0, 0, 0}},
        {"white",   {255, 255, 255}},
        {"grey",    {128, 128, 128}},
        {"gray",    {128, 128, 128}},
        {"silver",  {192, 192, 192}},
        {"red",     {255, 0, 0}},
        {"orange",  {255, 165, 0}},
        {"yellow",  {255, 255, 0}},
        {"gold",    {255, 215, 0}},
        {"green",   {0, 128, 0}},
        {"lime",    {0, 255, 0}},
        {"cyan",    {0, 255, 255}},
        {"blue",    {0, 0, 255}},
        {"navy",    {0, 0, 128}},
        {"purple",  {128, 0, 128}},
        {"magenta", {255, 0, 255}},
        {"pink",    {255, 192, 203}},
        {"brown",   {165, 42, 42}},
        {"tan",     {210, 180, 140}},
    };
    return colors;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<uint8_t> hexByte(const std::string& s, size_t pos) {
    int hi = hexDigit(s[pos]);
    int lo = hexDigit(s[pos + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    return static_cast<uint8_t>(hi * 16 + lo);
}

} // namespace

std::optional<Color> Palette::parse(const std::string& name) {
    if (!name.empty() && name[0] == '#') {
        if (name.size() != 7 && name.size() != 9) return std::nullopt;

        auto r = hexByte(name, 1);
        auto g = hexByte(name, 3);
        auto b = hexByte(name, 5);
        if (!r || !g || !b) return std::nullopt;

        uint8_t a = 255;
        if (name.size() == 9) {
            auto alpha = hexByte(name, 7);
            if (!alpha) return std::nullopt;
            a = *alpha;
        }
        return Color{*r, *g, *b, a};
    }

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& colors = namedColors();
    auto it = colors.find(lower);
    if (it == colors.end()) return std::nullopt;
    return it->second;
}

} // namespace orrery
