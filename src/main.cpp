/**
 * @file    main.cpp
 * @brief   BatchMark - CLI Entry Point
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Adds tiled, rotated, semi-transparent text watermarks to batches of images.
 *
 * Usage:
 *   BatchMark photo.jpg photos/                              (simple mode)
 *   BatchMark -i photos/ -t "CONFIDENTIAL" -n 4 -o out/ -j 4
 *   BatchMark -i photo.jpg --template company --preview preview.png
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return bmk::cli::run(argc, argv);
}
