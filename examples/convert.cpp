#include <qoikit/qoikit.hpp>

#include <lodepng.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <input> <output>\n";
    std::cerr << "Converts between QOI and PNG/PPM/PAM.\n\n";
    std::cerr << "Supported conversions:\n";
    std::cerr << "  .qoi -> .png, .ppm, .pam, .qoi\n";
    std::cerr << "  .png -> .qoi\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --linear      Tag encoded QOI output as linear colorspace\n";
    std::cerr << "  -h, --help    Show this help\n";
}

bool load_qoi(const std::filesystem::path& path, qoikit::image& img) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Failed to open: " << path << "\n";
        return false;
    }

    qoikit::istream_source source(file);
    auto result = qoikit::decode(source, img);
    if (!result) {
        std::cerr << "Error: Failed to decode: " << result.message
                  << " (" << qoikit::to_string(result.error) << ")\n";
        return false;
    }
    return true;
}

bool load_png(const std::filesystem::path& path, qoikit::image& img, qoikit::colorspace space) {
    std::vector<unsigned char> rgba;
    unsigned width = 0;
    unsigned height = 0;

    unsigned error = lodepng::decode(rgba, width, height, path.string());
    if (error) {
        std::cerr << "Error: PNG decode error: " << lodepng_error_text(error) << "\n";
        return false;
    }

    if (!img.set_size(width, height, space)) {
        std::cerr << "Error: Image too large: " << width << "x" << height << "\n";
        return false;
    }

    std::memcpy(img.mutable_pixels().data(), rgba.data(), img.pixel_count() * sizeof(qoikit::color));
    return true;
}

bool save_qoi(const std::filesystem::path& path, const qoikit::image& img) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    qoikit::ostream_sink sink(file);
    auto result = qoikit::encode(img.view(), sink);
    if (!result) {
        std::cerr << "Error: Failed to encode: " << result.message << "\n";
        return false;
    }
    return true;
}

bool save_png(const std::filesystem::path& path, const qoikit::image& img) {
    const auto pixels = img.pixels();
    const auto* bytes = reinterpret_cast<const unsigned char*>(pixels.data());

    std::vector<unsigned char> rgba(bytes, bytes + pixels.size() * sizeof(qoikit::color));
    unsigned error = lodepng::encode(path.string(), rgba, img.width(), img.height());
    if (error) {
        std::cerr << "Error: PNG encode error: " << lodepng_error_text(error) << "\n";
        return false;
    }
    return true;
}

// Portable pixmap, alpha dropped
bool save_ppm(const std::filesystem::path& path, const qoikit::image& img) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file << "P6 " << img.width() << " " << img.height() << " 255\n";
    for (const auto& px : img.pixels()) {
        const char rgb[3] = {static_cast<char>(px.r), static_cast<char>(px.g), static_cast<char>(px.b)};
        file.write(rgb, sizeof(rgb));
    }
    return file.good();
}

// Portable arbitrary map with an RGB_ALPHA tuple
bool save_pam(const std::filesystem::path& path, const qoikit::image& img) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file << "P7\nWIDTH " << img.width() << "\nHEIGHT " << img.height()
         << "\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    const auto pixels = img.pixels();
    file.write(reinterpret_cast<const char*>(pixels.data()),
               static_cast<std::streamsize>(pixels.size() * sizeof(qoikit::color)));
    return file.good();
}

} // namespace

int main(int argc, char* argv[]) {
    qoikit::colorspace space = qoikit::colorspace::srgb;
    std::vector<std::filesystem::path> positionals;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "--linear") == 0) {
            space = qoikit::colorspace::linear;
            continue;
        }
        positionals.emplace_back(argv[i]);
    }

    if (positionals.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    const auto& input_path = positionals[0];
    const auto& output_path = positionals[1];

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    const std::string in_ext = input_path.extension().string();
    const std::string out_ext = output_path.extension().string();

    qoikit::image img;
    if (in_ext == ".qoi") {
        if (!load_qoi(input_path, img)) return 1;
        if (space == qoikit::colorspace::linear) img.set_colorspace(space);
    } else if (in_ext == ".png") {
        if (!load_png(input_path, img, space)) return 1;
    } else {
        std::cerr << "Error: Unsupported input format: " << in_ext << "\n";
        return 1;
    }

    std::cout << "Decoded: " << img.width() << "x" << img.height() << "\n";

    bool saved = false;
    if (out_ext == ".qoi") {
        saved = save_qoi(output_path, img);
    } else if (out_ext == ".png") {
        saved = save_png(output_path, img);
    } else if (out_ext == ".ppm") {
        saved = save_ppm(output_path, img);
    } else if (out_ext == ".pam") {
        saved = save_pam(output_path, img);
    } else {
        std::cerr << "Error: Unsupported output format: " << out_ext << "\n";
        return 1;
    }

    if (!saved) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << "\n";

    return 0;
}
