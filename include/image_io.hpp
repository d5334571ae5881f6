#pragma once

#include <string>
#include <vector>
#include "frame.hpp"

namespace swisp {

/**
 * @brief Load a PNG file into an 8-bit B,G,R frame
 *
 * Any PNG color type is accepted: palettes and grayscale are expanded to
 * RGB, alpha is stripped and 16-bit samples are reduced to 8 bits.
 *
 * @param png_path Path to PNG file
 * @param frame Output frame; frame_index and timestamp are left untouched
 * @return true if successful, false otherwise
 */
bool load_frame_from_png(const std::string& png_path, Frame& frame);

/**
 * @brief Write a frame as an 8-bit RGB PNG
 *
 * Uses compression level 0 so writes stay fast and lossless.
 *
 * @param frame Frame to write
 * @param png_path Destination path
 * @return true if successful, false otherwise
 */
bool write_frame_to_png(const Frame& frame, const std::string& png_path);

/**
 * @brief Collect PNG inputs
 *
 * A file path yields itself. A directory yields every *.png entry in it,
 * sorted by name.
 *
 * @param input_path File or directory
 * @param files Output list of paths
 * @return false if the path cannot be read or no PNG was found
 */
bool list_png_inputs(const std::string& input_path, std::vector<std::string>& files);

/**
 * @brief Create a directory if it does not exist yet
 */
bool ensure_directory(const std::string& path);

/**
 * @brief File name without directory and extension
 */
std::string path_stem(const std::string& path);

} // namespace swisp
