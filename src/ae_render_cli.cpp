// ae_render_cli.cpp - Command-line renderer for AE Render animation descriptions
// Renders a JSON description to numbered PNG frame and mask sequences.

#include "../shared/AnimationLoader.h"
#include "../shared/FrameRenderer.h"
#include "../shared/frame_export.h"
#include "../shared/version.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

using namespace aerender;

namespace {

// Print help screen
void printHelp(const char* programName) {
    std::cerr << AERenderVersion::getVersionBanner() << "\n\n";
    std::cerr << "USAGE:\n";
    std::cerr << "    " << programName << " <description.json> [OPTIONS]\n\n";
    std::cerr << "DESCRIPTION:\n";
    std::cerr << "    Renders a keyframed layer animation to PNG frames and coverage masks.\n";
    std::cerr << "    Writes frame_NNNN.png and mask_NNNN.png into the output directory.\n\n";
    std::cerr << "OPTIONS:\n";
    std::cerr << "    -h, --help          Show this help message and exit\n";
    std::cerr << "    -v, --version       Show version information and exit\n";
    std::cerr << "    -s, --start N       First frame to render (default: 0)\n";
    std::cerr << "    -e, --end N         Frame to stop before, -1 for all (default: -1)\n";
    std::cerr << "    -t, --threads N     Worker threads, 0 for all cores (default: 1)\n";
    std::cerr << "    -o, --out DIR       Output directory (default: current directory)\n";
    std::cerr << "    -q, --quiet         Suppress progress and warning output\n\n";
    std::cerr << "EXIT STATUS:\n";
    std::cerr << "    0   Frames written (possibly degraded, see warnings)\n";
    std::cerr << "    1   Invalid arguments or output could not be written\n";
}

// Parse a decimal integer argument, rejecting trailing garbage and overflow
bool parseIntArg(const char* text, int& value) {
    if (!text || *text == '\0') return false;
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) return false;
    value = static_cast<int>(parsed);
    return true;
}

bool isOption(const char* arg, const char* shortName, const char* longName) {
    return strcmp(arg, shortName) == 0 || strcmp(arg, longName) == 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    const char* inputPath = nullptr;
    std::string outputDir = ".";
    RenderRequest request;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (isOption(arg, "-v", "--version")) {
            std::cerr << AERenderVersion::getVersionBanner() << std::endl;
            return 0;
        }
        if (isOption(arg, "-h", "--help")) {
            printHelp(argv[0]);
            return 0;
        }

        if (isOption(arg, "-q", "--quiet")) {
            quiet = true;
        } else if (isOption(arg, "-s", "--start") || isOption(arg, "-e", "--end") ||
                   isOption(arg, "-t", "--threads")) {
            int value = 0;
            if (i + 1 >= argc || !parseIntArg(argv[i + 1], value)) {
                std::cerr << "Error: " << arg << " requires an integer argument." << std::endl;
                return 1;
            }
            ++i;
            if (isOption(arg, "-s", "--start")) {
                request.startFrame = value;
            } else if (isOption(arg, "-e", "--end")) {
                request.endFrame = value;
            } else {
                request.workerThreads = value;
            }
        } else if (isOption(arg, "-o", "--out")) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a directory argument." << std::endl;
                return 1;
            }
            outputDir = argv[++i];
        } else if (arg[0] != '-') {
            inputPath = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
            return 1;
        }
    }

    if (!inputPath) {
        std::cerr << "Error: No input file specified.\n" << std::endl;
        printHelp(argv[0]);
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create output directory " << outputDir << ": " << ec.message() << std::endl;
        return 1;
    }

    // A missing or malformed file still renders the placeholder pair
    AnimationLoader loader;
    loader.setVerbose(!quiet);
    std::optional<Animation> animation = loader.loadFromFile(inputPath);

    FrameRenderer renderer;
    renderer.setVerbose(!quiet);
    RenderResult result =
        animation ? renderer.render(*animation, request) : renderer.renderLoadFailure(loader.diagnostics());

    const std::filesystem::path outPath(outputDir);
    for (size_t i = 0; i < result.frameCount(); ++i) {
        int frameIndex = i < result.frameIndices.size() ? result.frameIndices[i] : static_cast<int>(i);
        std::string framePath = (outPath / exportFilename("frame", frameIndex)).string();
        std::string maskPath = (outPath / exportFilename("mask", frameIndex)).string();
        if (!saveImagePNG(result.frames[i], framePath) || !saveImagePNG(result.masks[i], maskPath)) {
            return 1;
        }
    }

    if (!quiet) {
        // A load failure already carries the loader's records
        size_t warnings = result.diagnostics.records().size();
        if (animation) warnings += loader.diagnostics().records().size();
        std::cout << "[AERender] Wrote " << result.frameCount() << " frame/mask pairs to " << outputDir;
        if (result.placeholder) std::cout << " (placeholder)";
        if (warnings > 0) std::cout << ", " << warnings << " warning(s)";
        std::cout << std::endl;
    }
    return 0;
}
