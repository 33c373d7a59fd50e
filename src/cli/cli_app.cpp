/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Command-line interface for BatchMark.
 * Supports batch processing of files and directories, previews,
 * named templates and drag & drop.
 */

#include "cli/cli_app.hpp"
#include "core/batch_scheduler.hpp"
#include "core/layout_engine.hpp"
#include "core/text_rasterizer.hpp"
#include "core/types.hpp"
#include "core/watermark_config.hpp"
#include "core/watermark_renderer.hpp"
#include "io/file_service.hpp"
#include "io/template_store.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace bmk::cli {

namespace {

constexpr int kExitCanceled = 130;

// Set from the SIGINT handler, polled by the scheduler between jobs
CancelToken g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

void setup_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::stdout_color_mt("batchmark");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

// =============================================================================
// Banner
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  BatchMark");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n", kVersion);
    fmt::print(fmt::fg(fmt::color::gray), "  Batch text watermarking for JPEG/PNG/GIF/BMP\n");
    fmt::print("\n");
}

// =============================================================================
// Progress and summary
// =============================================================================

class ConsoleProgressSink final : public IProgressSink {
public:
    void update(size_t completed, size_t total, const fs::path& current_path) override {
        fmt::print(fmt::fg(fmt::color::cyan), "[{:>3}/{}] ", completed, total);
        fmt::print("{}\n", filename_utf8(current_path));
    }

private:
    static std::string filename_utf8(const fs::path& p) { return to_utf8(p.filename()); }
};

void print_summary(const BatchResult& result) {
    fmt::print("\n");
    if (result.canceled) {
        fmt::print(fmt::fg(fmt::color::yellow), "[CANCELED] {} of {} processed\n",
                   result.processed(), result.total);
    }

    fmt::print(fmt::fg(fmt::color::green), "[OK] Completed: {} succeeded", result.succeeded);
    if (!result.failed.empty()) {
        fmt::print(fmt::fg(fmt::color::red), ", {} failed", result.failed.size());
    }
    fmt::print("\n");

    for (const auto& f : result.failed) {
        fmt::print(fmt::fg(fmt::color::red), "  [{}] ", to_string(f.kind));
        fmt::print("{}: {}\n", to_utf8(f.path), f.message);
    }
}

int exit_code(const BatchResult& result) {
    if (result.canceled) return kExitCanceled;
    return result.failed.empty() ? 0 : 1;
}

// =============================================================================
// Processing helpers
// =============================================================================

/**
 * Expand directories, keep supported files, report the rest
 */
std::vector<fs::path> gather_inputs(const std::vector<std::string>& args) {
    std::vector<fs::path> inputs;

    for (const auto& arg : args) {
        const fs::path path = path_from_utf8(arg);
        std::error_code ec;

        if (fs::is_directory(path, ec)) {
            auto images = io::collect_images(path);
            spdlog::info("Directory {}: {} images", path, images.size());
            inputs.insert(inputs.end(), images.begin(), images.end());
        } else if (!fs::exists(path, ec)) {
            spdlog::error("File not found: {}", path);
        } else if (!io::is_supported_extension(path)) {
            spdlog::warn("Skipping unsupported file: {}", path);
        } else {
            inputs.push_back(path);
        }
    }
    return inputs;
}

int process_batch(const std::vector<fs::path>& inputs,
                  const WatermarkConfig& config,
                  const OutputConfig& output,
                  int workers) {
    if (inputs.empty()) {
        spdlog::error("No supported images to process");
        return 1;
    }

    // Pre-flight: free space at the destination
    const fs::path space_dir = output.destination_directory.empty()
        ? inputs.front().parent_path()
        : output.destination_directory;
    if (!io::check_disk_space(inputs, output, space_dir)) {
        spdlog::error("Not enough disk space in {}: need about {}, {} available",
                      space_dir,
                      format_file_size(io::estimate_output_size(inputs, output)),
                      format_file_size(io::available_space(space_dir)));
        return 1;
    }

    FreeTypeRasterizer rasterizer(config.font_path);
    WatermarkRenderer renderer(rasterizer);
    io::LocalImageStore store;
    BatchScheduler scheduler(store, renderer, workers);
    ConsoleProgressSink progress;

    const std::vector<ImageJob> jobs = io::make_jobs(inputs, output);

    g_interrupted.store(false);
    auto previous_handler = std::signal(SIGINT, on_interrupt);

    BatchResult result;
    try {
        result = scheduler.run_batch(jobs, config, output, &progress, &g_interrupted);
    } catch (...) {
        std::signal(SIGINT, previous_handler);
        throw;
    }
    std::signal(SIGINT, previous_handler);

    print_summary(result);
    return exit_code(result);
}

int run_preview(const fs::path& input,
                const fs::path& preview_path,
                const WatermarkConfig& config,
                const OutputConfig& output,
                int preview_size) {
    FreeTypeRasterizer rasterizer(config.font_path);
    WatermarkRenderer renderer(rasterizer, preview_size);
    io::LocalImageStore store;

    const cv::Mat image = store.load(input);
    const RenderedImage preview = renderer.render_preview(image, config, output);

    spdlog::info("Preview {}x{} (scale {:.3f}): grid {}x{}, font {:.1f}px, {} tiles",
                 preview.image.cols, preview.image.rows, preview.scale,
                 preview.layout.rows, preview.layout.cols, preview.layout.font_size,
                 preview.layout.placements.size());

    const auto encoded = encode_image(preview.image, OutputConfig{.format = ImageFormat::PNG});
    store.write(preview_path, encoded);

    fmt::print(fmt::fg(fmt::color::green), "[OK] Preview: {}\n", to_utf8(preview_path));
    return 0;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

bool is_simple_mode(int argc, char** argv) {
    if (argc < 2) return false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!arg.empty() && arg[0] == '-') {
            return false;
        }
    }
    return true;
}

int run_simple_mode(int argc, char** argv) {
    setup_console();
    print_banner();
    setup_logging(spdlog::level::info);

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        const std::vector<fs::path> inputs = gather_inputs(args);

        // Default watermark, outputs next to the inputs
        return process_batch(inputs, WatermarkConfig{}, OutputConfig{}, 1);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

int run(int argc, char** argv) {
    // Check for simple mode first
    if (is_simple_mode(argc, argv)) {
        return run_simple_mode(argc, argv);
    }

    setup_console();

    CLI::App app{"BatchMark - Batch text watermarking"};
    app.footer("\nSimple usage: BatchMark <image|dir>...  (output to <dir>/watermarked)");
    print_banner();

    app.set_version_flag("-V,--version", kVersion);

    // Input/Output paths
    std::vector<std::string> input_paths;
    std::string output_dir;

    app.add_option("-i,--input", input_paths, "Input image file(s) or directories")
        ->check(CLI::ExistingPath);
    auto* opt_output = app.add_option("-o,--output", output_dir,
        "Output directory (default: <input dir>/watermarked)");

    // Watermark
    std::vector<std::string> text_lines;
    std::string font_path;
    int font_size = 36;
    float font_ratio = 0.04f;
    std::string color;
    float opacity = 70.0f;
    float rotation = 45.0f;
    int count = 1;

    auto* opt_text = app.add_option("-t,--text", text_lines,
        "Watermark text line (repeat for a second line)");
    auto* opt_font = app.add_option("--font", font_path, "TrueType/OpenType font file")
        ->check(CLI::ExistingFile);
    auto* opt_font_size = app.add_option("--font-size", font_size,
        "Fixed font size in pixels (disables adaptive sizing)")
        ->check(CLI::Range(kMinFontSize, kMaxFontSize));
    auto* opt_font_ratio = app.add_option("--font-ratio", font_ratio,
        "Adaptive font size as a fraction of the shorter image side")
        ->check(CLI::Range(kMinAdaptiveRatio, kMaxAdaptiveRatio));
    opt_font_size->excludes(opt_font_ratio);
    auto* opt_color = app.add_option("-c,--color", color, "Text color #RRGGBB")
        ->check([](const std::string& s) {
            return parse_hex_color(s) ? std::string{} : "expected #RRGGBB, got " + s;
        });
    auto* opt_opacity = app.add_option("--opacity", opacity, "Opacity in percent (0-100)")
        ->check(CLI::Range(0.0f, 100.0f));
    auto* opt_rotation = app.add_option("-r,--rotation", rotation,
        "Rotation in degrees, counter-clockwise [0, 360)")
        ->check(CLI::Range(0.0f, 359.99f));
    auto* opt_count = app.add_option("-n,--count", count, "Number of watermark tiles (1-20)")
        ->check(CLI::Range(kMinCount, kMaxCount));

    // Output
    std::string format;
    int quality = 90;
    std::string name_rule;
    std::string suffix;

    auto* opt_format = app.add_option("-f,--format", format, "Output format: jpeg or png")
        ->check(CLI::IsMember({"jpeg", "jpg", "png"}, CLI::ignore_case));
    auto* opt_quality = app.add_option("--quality", quality, "JPEG quality (50-100)")
        ->check(CLI::Range(kMinJpegQuality, kMaxJpegQuality));
    auto* opt_name_rule = app.add_option("--name-rule", name_rule,
        "Output naming: original, numbered or timestamp")
        ->check(CLI::IsMember({"original", "numbered", "timestamp"}, CLI::ignore_case));
    auto* opt_suffix = app.add_option("--suffix", suffix, "Suffix appended to output names");

    // Execution
    int workers = 1;
    app.add_option("-j,--jobs", workers, "Images processed concurrently")
        ->check(CLI::Range(1, 64));

    std::string preview_path;
    int preview_size = kDefaultPreviewMaxSize;
    auto* opt_preview = app.add_option("--preview", preview_path,
        "Write a scaled preview (PNG) of a single input instead of processing");
    app.add_option("--preview-size", preview_size, "Longest preview side in pixels")
        ->check(CLI::Range(64, 4096));

    // Templates
    std::string template_name;
    std::string save_template;
    std::string delete_template;
    std::string template_dir;
    bool list_templates = false;

    app.add_option("--template", template_name, "Load settings from a saved template");
    app.add_option("--save-template", save_template, "Save the effective settings as a template");
    app.add_option("--delete-template", delete_template, "Delete a saved template");
    app.add_flag("--list-templates", list_templates, "List saved templates");
    app.add_option("--template-dir", template_dir, "Template directory");

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    if (quiet) {
        setup_logging(spdlog::level::err);
    } else if (verbose) {
        setup_logging(spdlog::level::debug);
    } else {
        setup_logging(spdlog::level::info);
    }

    try {
        io::TemplateStore templates(template_dir.empty()
            ? io::TemplateStore::default_directory()
            : path_from_utf8(template_dir));

        if (list_templates) {
            const auto names = templates.list();
            fmt::print("Templates in {}:\n", to_utf8(templates.directory()));
            for (const auto& name : names) {
                fmt::print("  {}\n", name);
            }
            if (names.empty()) {
                fmt::print(fmt::fg(fmt::color::gray), "  (none)\n");
            }
            return 0;
        }

        if (!delete_template.empty()) {
            if (!templates.remove(delete_template)) {
                spdlog::error("Template not found: {}", delete_template);
                return 1;
            }
            return 0;
        }

        // Base settings: template or defaults, then explicit options
        WatermarkConfig config;
        OutputConfig output;
        if (!template_name.empty()) {
            io::Template tpl = templates.load(template_name);
            config = tpl.watermark;
            output = tpl.output;
            spdlog::info("Using template '{}'", template_name);
        }

        if (*opt_text) config.text = text_lines;
        if (*opt_font) config.font_path = path_from_utf8(font_path);
        if (*opt_font_size) {
            config.font_size_mode = FontSizeMode::Manual;
            config.manual_font_size = font_size;
        }
        if (*opt_font_ratio) {
            config.font_size_mode = FontSizeMode::Adaptive;
            config.adaptive_ratio = font_ratio;
        }
        if (*opt_color) config.color = *parse_hex_color(color);
        if (*opt_opacity) config.opacity = opacity / 100.0f;
        if (*opt_rotation) config.rotation_degrees = rotation;
        if (*opt_count) config.count = count;

        if (*opt_output) output.destination_directory = path_from_utf8(output_dir);
        if (*opt_format) output.format = *parse_image_format(format);
        if (*opt_quality) output.jpeg_quality = quality;
        if (*opt_name_rule) output.name_rule = *parse_name_rule(name_rule);
        if (*opt_suffix) output.suffix = suffix;

        // Fail fast on bad settings, before touching any image
        config.validate();
        output.validate();

        if (!save_template.empty()) {
            templates.save(io::Template{save_template, config, output});
            if (input_paths.empty()) {
                return 0;
            }
        }

        if (input_paths.empty()) {
            spdlog::error("No input given (use -i <file|dir>)");
            return 1;
        }

        const std::vector<fs::path> inputs = gather_inputs(input_paths);

        if (*opt_preview) {
            if (inputs.size() != 1) {
                spdlog::error("--preview needs exactly one input image (got {})", inputs.size());
                return 1;
            }
            return run_preview(inputs.front(), path_from_utf8(preview_path),
                               config, output, preview_size);
        }

        if (!output.destination_directory.empty()) {
            auto [ok, message] = io::validate_output_directory(output.destination_directory);
            if (!ok) {
                spdlog::error("{}", message);
                return 1;
            }
        }

        return process_batch(inputs, config, output, workers);
    } catch (const WatermarkError& e) {
        spdlog::error("{}: {}", to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace bmk::cli
