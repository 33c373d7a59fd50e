/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @author  BatchMark Authors
 * @license MIT
 */

#pragma once

namespace bmk::cli {

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success, 1 = failure, 130 = canceled)
 */
int run(int argc, char** argv);

/**
 * Run in simple mode (drag & drop)
 *
 * Every argument is an image or directory; the default watermark is
 * applied and results go to <input dir>/watermarked.
 *
 * @param argc  Argument count
 * @param argv  Argument values (paths only, no flags)
 * @return      Exit code (0 = success)
 */
int run_simple_mode(int argc, char** argv);

/**
 * Check if arguments indicate simple mode
 * Simple mode: one or more paths without any flags
 */
[[nodiscard]] bool is_simple_mode(int argc, char** argv);

}  // namespace bmk::cli
