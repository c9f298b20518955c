#include "skintone/analysis/PaletteMapper.hpp"
#include "skintone/core/Logger.hpp"

namespace skintone {
namespace analysis {

namespace {

const std::vector<ColorEntry> SPRING_BEST = {
    {"Peach", "#FFD8B1", "Soft warm peach"},
    {"Coral", "#FF8370", "Bright warm coral"},
    {"Warm Yellow", "#FFD166", "Clear golden yellow"},
    {"Apple Green", "#80BD9E", "Fresh apple green"},
    {"Aqua", "#7FCDCD", "Clear light turquoise"},
    {"Periwinkle", "#98B6EB", "Light clear blue"},
    {"Salmon Pink", "#FF9A8D", "Warm pinkish coral"},
    {"Warm Red", "#E84A5F", "Clear tomato red"}
};

const std::vector<ColorEntry> SUMMER_BEST = {
    {"Rose Pink", "#DBA1A1", "Soft muted rose"},
    {"Lavender", "#CBC5F9", "Soft muted purple"},
    {"Powder Blue", "#A3BBE3", "Soft blue with gray"},
    {"Sage Green", "#B2C9AB", "Muted soft green"},
    {"Mauve", "#C295A5", "Dusty rose pink"},
    {"Periwinkle", "#8F9FBC", "Muted blue-purple"},
    {"Soft Teal", "#7AA5A6", "Muted teal"},
    {"Raspberry", "#C25B7A", "Muted cool pink"}
};

const std::vector<ColorEntry> AUTUMN_BEST = {
    {"Terracotta", "#C87C56", "Earthy warm orange"},
    {"Olive", "#8A8B60", "Muted yellow-green"},
    {"Rust", "#BF612A", "Deep orangey-brown"},
    {"Moss Green", "#606B38", "Deep muted green"},
    {"Teal", "#406A73", "Deep blue-green"},
    {"Bronze", "#C69F6A", "Warm metallic brown"},
    {"Tomato Red", "#AB3428", "Muted warm red"},
    {"Mustard", "#D2A54A", "Deep yellow-gold"}
};

const std::vector<ColorEntry> WINTER_BEST = {
    {"Royal Purple", "#6A3790", "Rich blue-purple"},
    {"Ice Blue", "#78A4C0", "Clear cool blue"},
    {"Emerald", "#00A383", "Deep clear green"},
    {"Crimson", "#C91F37", "Bold blue-red"},
    {"Fuchsia", "#D33682", "Vivid cool pink"},
    {"Navy", "#1F3659", "Deep blue"},
    {"Ice Pink", "#F0A1BF", "Cool clear pink"},
    {"Bright Blue", "#0078BF", "Clear strong blue"}
};

const std::vector<ColorEntry> SPRING_NEUTRAL = {
    {"Camel", "#C8A77E", "Light warm tan"},
    {"Ivory", "#FFF8E7", "Warm off-white"},
    {"Navy", "#2F3E5F", "Slightly warm navy"},
    {"Soft White", "#F5F5DC", "Warm cream white"}
};

const std::vector<ColorEntry> SUMMER_NEUTRAL = {
    {"Taupe", "#BCB6A8", "Cool light brown"},
    {"Soft White", "#F0EEE9", "Cool off-white"},
    {"Slate Gray", "#708090", "Medium blue-gray"},
    {"Soft Navy", "#39516D", "Muted navy"}
};

const std::vector<ColorEntry> AUTUMN_NEUTRAL = {
    {"Chocolate", "#6B4226", "Deep warm brown"},
    {"Cream", "#F2E4C8", "Warm soft yellow-white"},
    {"Khaki", "#B09D78", "Muted yellow-brown"},
    {"Dark Brown", "#4A3728", "Rich warm brown"}
};

const std::vector<ColorEntry> WINTER_NEUTRAL = {
    {"True White", "#FFFFFF", "Pure bright white"},
    {"Black", "#000000", "True black"},
    {"Charcoal", "#36454F", "Deep cool gray"},
    {"Silver Gray", "#C0C0C0", "Cool light gray"}
};

const std::vector<ColorEntry> SPRING_AVOID = {
    {"Black", "#000000", "Too harsh"},
    {"Burgundy", "#800020", "Too deep and cool"},
    {"Plum", "#673147", "Too cool and muted"},
    {"Cool Gray", "#BEBEBE", "Too cool-toned"}
};

const std::vector<ColorEntry> SUMMER_AVOID = {
    {"Orange", "#FF7F00", "Too warm and bright"},
    {"Bright Yellow", "#FFFF00", "Too bright and warm"},
    {"Camel", "#C19A6B", "Too warm"},
    {"Tomato Red", "#FF6347", "Too warm and bright"}
};

const std::vector<ColorEntry> AUTUMN_AVOID = {
    {"True White", "#FFFFFF", "Too stark"},
    {"Fuchsia", "#FF00FF", "Too cool and bright"},
    {"Icy Blue", "#A5F2F3", "Too cool and clear"},
    {"Bubblegum Pink", "#FFC1CC", "Too cool and bright"}
};

const std::vector<ColorEntry> WINTER_AVOID = {
    {"Cream", "#FFFDD0", "Too muted and warm"},
    {"Peach", "#FFE5B4", "Too warm and soft"},
    {"Camel", "#C19A6B", "Too warm and muted"},
    {"Moss Green", "#8A9A5B", "Too muted"}
};

} // namespace

PaletteMapper::PaletteMapper(const PaletteConfig& config, int grid_size)
    : config_(config)
    , grid_size_(grid_size) {
}

bool PaletteMapper::isHashedCell(size_t cell) const {
    if (!config_.hash_central_cells_only || grid_size_ < 2) {
        return true;
    }
    const int n = grid_size_;
    const int row = static_cast<int>(cell) / n;
    const int col = static_cast<int>(cell) % n;
    const int lo = n / 4;
    const int hi = n - n / 4;
    return row >= lo && row < hi && col >= lo && col < hi;
}

uint32_t PaletteMapper::hash(const FaceSignature& signature) const {
    uint32_t h = 0;
    for (size_t i = 0; i < signature.size(); ++i) {
        if (!isHashedCell(i / 3)) {
            continue;
        }
        h = (h << 5) - h + static_cast<uint32_t>(signature[i]);
    }
    return config_.hash_modulus > 0 ? h % config_.hash_modulus : h;
}

SeasonalPalette PaletteMapper::selectPalette(Undertone undertone, uint32_t hash) {
    const uint32_t bucket = hash % 100;
    switch (undertone) {
        case Undertone::WARM:
            return bucket < 50 ? SeasonalPalette::SPRING : SeasonalPalette::AUTUMN;
        case Undertone::COOL:
            return bucket < 50 ? SeasonalPalette::SUMMER : SeasonalPalette::WINTER;
        case Undertone::NEUTRAL:
            return ALL_PALETTES[bucket / 25];
    }
    return SeasonalPalette::SUMMER;
}

AnalysisResult PaletteMapper::buildResult(Undertone undertone, SeasonalPalette palette) const {
    AnalysisResult result;
    result.undertone = undertone;
    result.skin_tone = skinToneLabel(undertone);
    result.palette = palette;
    result.best_colors = bestColors(palette);
    result.neutral_colors = neutralColors(palette);
    result.avoid_colors = avoidColors(palette);
    result.undertone_description = undertoneDescription(undertone);
    result.palette_description = paletteDescription(palette);
    return result;
}

AnalysisResult PaletteMapper::map(Undertone undertone, const FaceSignature& signature) const {
    const uint32_t h = hash(signature);
    const SeasonalPalette palette = selectPalette(undertone, h);
    LOG_DEBUG("Palette: hash " + std::to_string(h) + " with " + undertoneToString(undertone) +
              " undertone -> " + paletteToString(palette));
    return buildResult(undertone, palette);
}

AnalysisResult PaletteMapper::fallbackResult() const {
    return buildResult(Undertone::NEUTRAL, config_.fallback_palette);
}

const std::vector<ColorEntry>& PaletteMapper::bestColors(SeasonalPalette palette) {
    switch (palette) {
        case SeasonalPalette::SPRING: return SPRING_BEST;
        case SeasonalPalette::SUMMER: return SUMMER_BEST;
        case SeasonalPalette::AUTUMN: return AUTUMN_BEST;
        case SeasonalPalette::WINTER: return WINTER_BEST;
    }
    return SUMMER_BEST;
}

const std::vector<ColorEntry>& PaletteMapper::neutralColors(SeasonalPalette palette) {
    switch (palette) {
        case SeasonalPalette::SPRING: return SPRING_NEUTRAL;
        case SeasonalPalette::SUMMER: return SUMMER_NEUTRAL;
        case SeasonalPalette::AUTUMN: return AUTUMN_NEUTRAL;
        case SeasonalPalette::WINTER: return WINTER_NEUTRAL;
    }
    return SUMMER_NEUTRAL;
}

const std::vector<ColorEntry>& PaletteMapper::avoidColors(SeasonalPalette palette) {
    switch (palette) {
        case SeasonalPalette::SPRING: return SPRING_AVOID;
        case SeasonalPalette::SUMMER: return SUMMER_AVOID;
        case SeasonalPalette::AUTUMN: return AUTUMN_AVOID;
        case SeasonalPalette::WINTER: return WINTER_AVOID;
    }
    return SUMMER_AVOID;
}

std::string PaletteMapper::skinToneLabel(Undertone undertone) {
    switch (undertone) {
        case Undertone::WARM: return "Warm / Golden";
        case Undertone::COOL: return "Cool / Rosy";
        case Undertone::NEUTRAL: return "Neutral / Balanced";
    }
    return "Neutral / Balanced";
}

std::string PaletteMapper::undertoneDescription(Undertone undertone) {
    switch (undertone) {
        case Undertone::WARM:
            return "Your skin has golden, peachy, or yellow undertones. You'll shine in warm colors "
                   "that complement these golden qualities.";
        case Undertone::COOL:
            return "Your skin has rosy, pink, or bluish undertones. Cool-toned colors will enhance "
                   "your natural coloring.";
        case Undertone::NEUTRAL:
            return "Your skin has a balanced undertone that's neither distinctly warm nor cool. "
                   "This gives you versatility in color choices.";
    }
    return "";
}

std::string PaletteMapper::paletteDescription(SeasonalPalette palette) {
    switch (palette) {
        case SeasonalPalette::SPRING:
            return "As a Spring type, you have a warm and clear quality to your coloring. "
                   "Your best colors are bright, warm, and clear.";
        case SeasonalPalette::SUMMER:
            return "As a Summer type, you have a cool and muted quality to your coloring. "
                   "Soft, cool colors with blue undertones suit you best.";
        case SeasonalPalette::AUTUMN:
            return "As an Autumn type, you have warm, muted coloring. Rich, warm, and earthy "
                   "colors complement your natural palette.";
        case SeasonalPalette::WINTER:
            return "As a Winter type, you have cool, clear coloring with high contrast. Bold, "
                   "cool colors create harmony with your natural look.";
    }
    return "";
}

} // namespace analysis
} // namespace skintone
