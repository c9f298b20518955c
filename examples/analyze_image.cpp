/**
 * @file analyze_image.cpp
 * @brief Command-line skin undertone and seasonal palette analysis
 *
 * Usage: skintone_analyze <image> [--config file.yaml] [--log-dir dir] [--verbose] [--no-normalize]
 *
 * Exit codes: 0 success, 1 unreadable image or invalid configuration, 2 usage error.
 */

#include <skintone/skintone.h>
#include <iostream>
#include <string>

using namespace skintone;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <image> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config, -c <file>   YAML analysis configuration" << std::endl;
    std::cout << "  --log-dir <dir>       Write a timestamped log file to <dir>" << std::endl;
    std::cout << "  --verbose, -v         Debug logging" << std::endl;
    std::cout << "  --no-normalize        Skip size and color normalization" << std::endl;
    std::cout << "  --help, -h            Show this help message" << std::endl;
}

void printColors(const std::string& title, const std::vector<analysis::ColorEntry>& colors) {
    std::cout << title << ":" << std::endl;
    for (const auto& color : colors) {
        std::cout << "  " << color.hex << "  " << color.name << " - " << color.description << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string image_path;
    std::string config_path;
    std::string log_dir;
    bool verbose = false;
    bool normalize = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--log-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 2;
            }
            log_dir = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--no-normalize") {
            normalize = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else if (image_path.empty()) {
            image_path = arg;
        } else {
            std::cerr << "Only one image may be given" << std::endl;
            return 2;
        }
    }

    if (image_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    const auto level = verbose ? core::LogLevel::DEBUG : core::LogLevel::WARNING;
    if (initialize(level, log_dir) != core::ResultCode::SUCCESS) {
        std::cerr << "Warning: could not open a log file in " << log_dir << std::endl;
    }

    try {
        analysis::AnalysisConfig config;
        if (!config_path.empty()) {
            core::Configuration document;
            document.load(config_path);
            config = analysis::loadAnalysisConfig(document);
        }
        if (!normalize) {
            config.normalization.enabled = false;
        }

        analysis::AnalysisService service(config);

        analysis::PixelBuffer image = io::ImageLoader::load(image_path);
        image = io::ImageNormalizer(config.normalization).normalize(image);

        const auto validation = service.validateFace(image);
        if (!validation.is_valid) {
            std::cout << "Note: " << validation.message << std::endl;
        }

        const auto face = service.detectFace(image);
        const auto result = service.analyze(image);

        std::cout << "=========================================" << std::endl;
        std::cout << "   SKIN TONE ANALYSIS" << std::endl;
        std::cout << "=========================================" << std::endl;
        std::cout << "Image:       " << image_path << " (" << image.width() << "x" << image.height() << ")" << std::endl;
        if (face.face_detected) {
            const auto& r = *face.region;
            std::cout << "Face region: " << r.x << "," << r.y << " " << r.width << "x" << r.height << std::endl;
        } else {
            std::cout << "Face region: not found, whole image sampled" << std::endl;
        }
        std::cout << "Skin tone:   " << result.skin_tone << std::endl;
        std::cout << "Palette:     " << analysis::paletteToString(result.palette) << std::endl;
        std::cout << std::endl << result.undertone_description << std::endl;
        std::cout << result.palette_description << std::endl << std::endl;

        printColors("Best colors", result.best_colors);
        printColors("Neutral colors", result.neutral_colors);
        printColors("Colors to avoid", result.avoid_colors);

    } catch (const core::ConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        shutdown();
        return 1;
    } catch (const core::ImageException& e) {
        std::cerr << "Image error: " << e.what() << std::endl;
        shutdown();
        return 1;
    }

    shutdown();
    return 0;
}
