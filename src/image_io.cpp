/**
 * @file image_io.cpp
 * @brief PNG frame source and sink (libpng)
 *
 * Frames are kept in B,G,R order in memory; libpng swaps to and from the
 * R,G,B order stored in the file.
 */

#include "image_io.hpp"
#include <png.h>
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace swisp {

namespace {

// The libpng helpers below hold no C++ objects across setjmp; buffers are
// owned by the callers and outlive any longjmp.

bool read_png_header(png_structp png, png_infop info, FILE* fp,
                     uint32_t& width, uint32_t& height, size_t& row_bytes)
{
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_init_io(png, fp);
    png_read_info(png, info);

    width = png_get_image_width(png, info);
    height = png_get_image_height(png, info);
    const int bit_depth = png_get_bit_depth(png, info);
    const int color_type = png_get_color_type(png, info);

    // Normalize everything to 8-bit, 3 channel, B,G,R
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (bit_depth == 16) {
        png_set_strip_16(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png);
    }
    // Palette expansion turns a tRNS chunk into an alpha channel
    if ((color_type & PNG_COLOR_MASK_ALPHA) || png_get_valid(png, info, PNG_INFO_tRNS)) {
        png_set_strip_alpha(png);
    }
    png_set_bgr(png);
    png_read_update_info(png, info);

    row_bytes = png_get_rowbytes(png, info);
    return true;
}

bool read_png_rows(png_structp png, png_bytepp rows)
{
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_read_image(png, rows);
    png_read_end(png, nullptr);
    return true;
}

bool write_png_rows(png_structp png, png_infop info, FILE* fp,
                    uint32_t width, uint32_t height, png_bytepp rows)
{
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, width, height, 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_compression_level(png, 0);
    png_write_info(png, info);
    png_set_bgr(png);

    png_write_image(png, rows);
    png_write_end(png, nullptr);
    return true;
}

} // anonymous namespace

bool load_frame_from_png(const std::string& png_path, Frame& frame)
{
    FILE* fp = fopen(png_path.c_str(), "rb");
    if (!fp) {
        std::cerr << "Failed to open PNG: " << png_path << std::endl;
        return false;
    }

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        fclose(fp);
        return false;
    }

    uint32_t width = 0;
    uint32_t height = 0;
    size_t row_bytes = 0;
    if (!read_png_header(png, info, fp, width, height, row_bytes)) {
        std::cerr << "libpng error while reading: " << png_path << std::endl;
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        return false;
    }

    if (row_bytes != static_cast<size_t>(width) * Frame::CHANNELS) {
        std::cerr << "PNG could not be converted to 8-bit RGB: " << png_path << std::endl;
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        return false;
    }

    std::vector<uint8_t> pixels(static_cast<size_t>(height) * row_bytes);
    std::vector<png_bytep> row_pointers(height);
    for (uint32_t y = 0; y < height; ++y) {
        row_pointers[y] = &pixels[static_cast<size_t>(y) * row_bytes];
    }

    const bool ok = read_png_rows(png, row_pointers.data());
    png_destroy_read_struct(&png, &info, nullptr);
    fclose(fp);

    if (!ok) {
        std::cerr << "libpng error while reading: " << png_path << std::endl;
        return false;
    }

    frame.width = width;
    frame.height = height;
    frame.channels = Frame::CHANNELS;
    frame.data.swap(pixels);
    return true;
}

bool write_frame_to_png(const Frame& frame, const std::string& png_path)
{
    if (!frame.is_valid()) {
        std::cerr << "Refusing to write invalid frame to " << png_path << std::endl;
        return false;
    }

    std::vector<png_bytep> row_pointers(frame.height);
    for (uint32_t y = 0; y < frame.height; ++y) {
        row_pointers[y] = const_cast<png_bytep>(frame.pixel(0, y));
    }

    FILE* fp = fopen(png_path.c_str(), "wb");
    if (!fp) {
        std::cerr << "Failed to create PNG: " << png_path << std::endl;
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        return false;
    }

    const bool ok = write_png_rows(png, info, fp, frame.width, frame.height, row_pointers.data());
    png_destroy_write_struct(&png, &info);
    fclose(fp);

    if (!ok) {
        std::cerr << "libpng error while writing: " << png_path << std::endl;
        return false;
    }
    return true;
}

bool list_png_inputs(const std::string& input_path, std::vector<std::string>& files)
{
    struct stat st;
    if (stat(input_path.c_str(), &st) != 0) {
        std::cerr << "Input path does not exist: " << input_path << std::endl;
        return false;
    }

    if (!S_ISDIR(st.st_mode)) {
        files.push_back(input_path);
        return true;
    }

    DIR* dir = opendir(input_path.c_str());
    if (!dir) {
        std::cerr << "Failed to open input directory: " << input_path << std::endl;
        return false;
    }

    std::vector<std::string> found;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        const std::string filename = entry->d_name;
        if (filename.length() > 4 && filename.substr(filename.length() - 4) == ".png") {
            found.push_back(input_path + "/" + filename);
        }
    }
    closedir(dir);

    if (found.empty()) {
        std::cerr << "No PNG files found in input directory" << std::endl;
        return false;
    }

    std::sort(found.begin(), found.end());
    files.insert(files.end(), found.begin(), found.end());
    return true;
}

bool ensure_directory(const std::string& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << "Output path is not a directory: " << path << std::endl;
            return false;
        }
        return true;
    }

    if (mkdir(path.c_str(), 0755) != 0) {
        std::cerr << "Failed to create output directory: " << path << std::endl;
        return false;
    }
    return true;
}

std::string path_stem(const std::string& path)
{
    const size_t slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    const size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}

} // namespace swisp
