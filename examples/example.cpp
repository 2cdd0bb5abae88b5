#include <pngmsg/pngmsg.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [args]\n";
    std::cerr << "Hides text messages in PNG chunks.\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  encode <file.png> <type> <message> [output.png]\n";
    std::cerr << "  decode <file.png> <type>\n";
    std::cerr << "  remove <file.png> <type>\n";
    std::cerr << "  print  <file.png>\n";
    std::cerr << "  -h, --help    Show this help\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));

    return file.good();
}

// Load and parse a .png file, reporting failures on stderr
bool load_png(const std::filesystem::path& path, pngmsg::png_file& png) {
    if (path.extension() != ".png") {
        std::cerr << "Error: Not a .png file: " << path << "\n";
        return false;
    }

    if (!std::filesystem::exists(path)) {
        std::cerr << "Error: File not found: " << path << "\n";
        return false;
    }

    auto data = read_file(path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << path << "\n";
        return false;
    }

    auto result = pngmsg::png_file::parse(data, png);
    if (!result) {
        std::cerr << "Error: Failed to parse (" << pngmsg::to_string(result.error) << "): "
                  << result.message << "\n";
        return false;
    }

    return true;
}

bool save_png(const std::filesystem::path& path, const pngmsg::png_file& png) {
    if (!write_file(path, png.encode())) {
        std::cerr << "Error: Failed to save: " << path << "\n";
        return false;
    }
    return true;
}

int run_encode(int argc, char* argv[]) {
    if (argc < 5) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(argv[2]);
    pngmsg::png_file png;
    if (!load_png(input_path, png)) {
        return 1;
    }

    auto result = pngmsg::encode_message(png, argv[3], argv[4]);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    const std::filesystem::path output_path = argc >= 6 ? std::filesystem::path(argv[5]) : input_path;
    if (!save_png(output_path, png)) {
        return 1;
    }

    std::cout << "Message encoded: " << output_path << "\n";
    return 0;
}

int run_decode(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    pngmsg::png_file png;
    if (!load_png(argv[2], png)) {
        return 1;
    }

    std::string message;
    bool found = false;
    auto result = pngmsg::decode_message(png, argv[3], message, found);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    if (!found) {
        std::cout << "No message with chunk type " << argv[3] << "\n";
        return 0;
    }

    std::cout << "Message: " << message << "\n";
    return 0;
}

int run_remove(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path path(argv[2]);
    pngmsg::png_file png;
    if (!load_png(path, png)) {
        return 1;
    }

    auto result = pngmsg::remove_message(png, argv[3]);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    if (!save_png(path, png)) {
        return 1;
    }

    std::cout << "Message removed\n";
    return 0;
}

int run_print(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    pngmsg::png_file png;
    if (!load_png(argv[2], png)) {
        return 1;
    }

    std::cout << png.chunk_count() << " chunks:\n";
    for (const auto& line : pngmsg::list_chunks(png)) {
        std::cout << "  " << line << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    if (std::strcmp(argv[1], "encode") == 0) return run_encode(argc, argv);
    if (std::strcmp(argv[1], "decode") == 0) return run_decode(argc, argv);
    if (std::strcmp(argv[1], "remove") == 0) return run_remove(argc, argv);
    if (std::strcmp(argv[1], "print") == 0) return run_print(argc, argv);

    std::cerr << "Error: Unknown command: " << argv[1] << "\n";
    print_usage(argv[0]);
    return 1;
}
