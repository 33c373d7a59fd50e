/**
 * @file    template_store.cpp
 * @brief   Named watermark/output templates stored as JSON
 * @author  BatchMark Authors
 * @license MIT
 */

#include "io/template_store.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits>

namespace fs = std::filesystem;
using nlohmann::json;

namespace bmk::io {

namespace {

constexpr const char* kExtension = ".json";

[[noreturn]] void invalid(const std::string& message) {
    throw WatermarkError(ErrorKind::InvalidConfig, message);
}

/**
 * Require exactly the given keys in an object
 */
void expect_fields(const json& j, std::initializer_list<const char*> fields, const char* context) {
    if (!j.is_object()) {
        invalid(fmt::format("{}: expected an object", context));
    }
    for (const char* field : fields) {
        if (!j.contains(field)) {
            invalid(fmt::format("{}: missing field '{}'", context, field));
        }
    }
    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        const bool known = std::any_of(fields.begin(), fields.end(),
                                       [&](const char* f) { return key == f; });
        if (!known) {
            invalid(fmt::format("{}: unknown field '{}'", context, key));
        }
    }
}

std::string get_string(const json& j, const char* field, const char* context) {
    const json& v = j.at(field);
    if (!v.is_string()) {
        invalid(fmt::format("{}.{}: expected a string", context, field));
    }
    return v.get<std::string>();
}

double get_number(const json& j, const char* field, const char* context) {
    const json& v = j.at(field);
    if (!v.is_number()) {
        invalid(fmt::format("{}.{}: expected a number", context, field));
    }
    return v.get<double>();
}

int get_integer(const json& j, const char* field, const char* context) {
    const json& v = j.at(field);
    if (!v.is_number_integer()) {
        invalid(fmt::format("{}.{}: expected an integer", context, field));
    }
    // get<int>() truncates silently; range-check in the wider type first
    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();
    const bool in_range = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(hi)
        : v.get<std::int64_t>() >= lo && v.get<std::int64_t>() <= hi;
    if (!in_range) {
        invalid(fmt::format("{}.{}: {} is out of range", context, field, v.dump()));
    }
    return v.get<int>();
}

WatermarkConfig watermark_from_json(const json& j) {
    constexpr const char* ctx = "watermark_config";
    expect_fields(j, {"text", "font_size_mode", "adaptive_ratio", "manual_font_size",
                      "color", "opacity", "rotation", "count", "font_path"}, ctx);

    WatermarkConfig cfg;

    const json& text = j.at("text");
    if (!text.is_array()) {
        invalid("watermark_config.text: expected an array of strings");
    }
    cfg.text.clear();
    for (const auto& line : text) {
        if (!line.is_string()) {
            invalid("watermark_config.text: expected an array of strings");
        }
        cfg.text.push_back(line.get<std::string>());
    }

    const std::string mode = get_string(j, "font_size_mode", ctx);
    const auto parsed_mode = parse_font_size_mode(mode);
    if (!parsed_mode) {
        invalid(fmt::format("watermark_config.font_size_mode: unknown value '{}'", mode));
    }
    cfg.font_size_mode = *parsed_mode;

    cfg.adaptive_ratio = static_cast<float>(get_number(j, "adaptive_ratio", ctx));
    cfg.manual_font_size = get_integer(j, "manual_font_size", ctx);

    const std::string color = get_string(j, "color", ctx);
    const auto parsed_color = parse_hex_color(color);
    if (!parsed_color) {
        invalid(fmt::format("watermark_config.color: '{}' is not #RRGGBB", color));
    }
    cfg.color = *parsed_color;

    cfg.opacity = static_cast<float>(get_number(j, "opacity", ctx) / 100.0);
    cfg.rotation_degrees = static_cast<float>(get_number(j, "rotation", ctx));
    cfg.count = get_integer(j, "count", ctx);
    cfg.font_path = path_from_utf8(get_string(j, "font_path", ctx));

    cfg.validate();
    return cfg;
}

OutputConfig output_from_json(const json& j) {
    constexpr const char* ctx = "output_config";
    expect_fields(j, {"output_dir", "format", "jpeg_quality", "name_rule", "suffix"}, ctx);

    OutputConfig out;
    out.destination_directory = path_from_utf8(get_string(j, "output_dir", ctx));

    const std::string format = get_string(j, "format", ctx);
    const auto parsed_format = parse_image_format(format);
    if (!parsed_format) {
        invalid(fmt::format("output_config.format: unknown value '{}'", format));
    }
    out.format = *parsed_format;

    out.jpeg_quality = get_integer(j, "jpeg_quality", ctx);

    const std::string rule = get_string(j, "name_rule", ctx);
    const auto parsed_rule = parse_name_rule(rule);
    if (!parsed_rule) {
        invalid(fmt::format("output_config.name_rule: unknown value '{}'", rule));
    }
    out.name_rule = *parsed_rule;

    out.suffix = get_string(j, "suffix", ctx);

    out.validate();
    return out;
}

void check_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find_first_of("/\\:") != std::string::npos) {
        invalid(fmt::format("Invalid template name '{}'", name));
    }
}

}  // anonymous namespace

// =============================================================================
// JSON conversion
// =============================================================================

json template_to_json(const Template& tpl) {
    const WatermarkConfig& w = tpl.watermark;
    const OutputConfig& o = tpl.output;

    return json{
        {"name", tpl.name},
        {"watermark_config", {
            {"text", w.text},
            {"font_size_mode", std::string(to_string(w.font_size_mode))},
            {"adaptive_ratio", w.adaptive_ratio},
            {"manual_font_size", w.manual_font_size},
            {"color", to_hex(w.color)},
            {"opacity", std::lround(w.opacity * 100.0f)},
            {"rotation", w.rotation_degrees},
            {"count", w.count},
            {"font_path", to_utf8(w.font_path)}
        }},
        {"output_config", {
            {"output_dir", to_utf8(o.destination_directory)},
            {"format", std::string(to_string(o.format))},
            {"jpeg_quality", o.jpeg_quality},
            {"name_rule", std::string(to_string(o.name_rule))},
            {"suffix", o.suffix}
        }}
    };
}

Template template_from_json(const json& j) {
    expect_fields(j, {"name", "watermark_config", "output_config"}, "template");

    Template tpl;
    tpl.name = get_string(j, "name", "template");
    tpl.watermark = watermark_from_json(j.at("watermark_config"));
    tpl.output = output_from_json(j.at("output_config"));
    return tpl;
}

// =============================================================================
// TemplateStore
// =============================================================================

TemplateStore::TemplateStore(fs::path directory)
    : m_directory(std::move(directory))
{
}

fs::path TemplateStore::default_directory() {
    constexpr const char* kAppDir = "BatchMark";

#ifdef _WIN32
    if (const char* appdata = std::getenv("APPDATA"); appdata && *appdata) {
        return path_from_utf8(appdata) / kAppDir;
    }
#endif
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return path_from_utf8(xdg) / kAppDir;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return path_from_utf8(home) / ".BatchMark";
    }
    return fs::current_path() / ".BatchMark";
}

fs::path TemplateStore::path_for(const std::string& name) const {
    check_name(name);
    return m_directory / path_from_utf8(name + kExtension);
}

void TemplateStore::save(const Template& tpl) const {
    const fs::path path = path_for(tpl.name);
    tpl.watermark.validate();
    tpl.output.validate();

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        throw WatermarkError(ErrorKind::IOFailure,
                             fmt::format("Cannot create template directory {}: {}",
                                         m_directory, ec.message()));
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw WatermarkError(ErrorKind::IOFailure, fmt::format("Cannot write template {}", path));
    }
    file << template_to_json(tpl).dump(2) << '\n';
    if (!file) {
        throw WatermarkError(ErrorKind::IOFailure, fmt::format("Failed to write template {}", path));
    }

    spdlog::info("Saved template '{}' to {}", tpl.name, path);
}

Template TemplateStore::load(const std::string& name) const {
    const fs::path path = path_for(name);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw WatermarkError(ErrorKind::IOFailure, fmt::format("Template not found: {}", path));
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        invalid(fmt::format("JSON parse error in {}: {}", path, e.what()));
    }

    Template tpl = template_from_json(j);
    if (tpl.name != name) {
        spdlog::warn("Template file {} declares name '{}'", path, tpl.name);
    }

    spdlog::debug("Loaded template '{}' from {}", name, path);
    return tpl;
}

std::vector<std::string> TemplateStore::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        return names;
    }

    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != kExtension) continue;
        names.push_back(to_utf8(entry.path().stem()));
    }

    std::sort(names.begin(), names.end());
    return names;
}

bool TemplateStore::remove(const std::string& name) const {
    std::error_code ec;
    const bool removed = fs::remove(path_for(name), ec);
    if (ec) {
        throw WatermarkError(ErrorKind::IOFailure,
                             fmt::format("Cannot delete template '{}': {}", name, ec.message()));
    }
    if (removed) {
        spdlog::info("Deleted template '{}'", name);
    }
    return removed;
}

bool TemplateStore::exists(const std::string& name) const {
    std::error_code ec;
    return fs::is_regular_file(path_for(name), ec);
}

}  // namespace bmk::io
