/**
 * @file    template_store.hpp
 * @brief   Named watermark/output templates stored as JSON
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * One file per template: <dir>/<name>.json
 *
 * {
 *   "name": "company",
 *   "watermark_config": {
 *     "text": ["CONFIDENTIAL"], "font_size_mode": "adaptive",
 *     "adaptive_ratio": 0.04, "manual_font_size": 36, "color": "#FF0000",
 *     "opacity": 70, "rotation": 45, "count": 4, "font_path": ""
 *   },
 *   "output_config": {
 *     "output_dir": "", "format": "JPEG", "jpeg_quality": 90,
 *     "name_rule": "original", "suffix": "watermarked"
 *   }
 * }
 *
 * Loading is strict: a missing, unknown or mistyped field, or a value
 * outside its domain, is rejected with InvalidConfig instead of being
 * defaulted.
 */

#pragma once

#include "core/watermark_config.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace bmk::io {

struct Template {
    std::string name;
    WatermarkConfig watermark;
    OutputConfig output;
};

/**
 * Serialize a template (opacity as 0-100 percent)
 */
[[nodiscard]] nlohmann::json template_to_json(const Template& tpl);

/**
 * Parse and validate a template
 * @throws WatermarkError(InvalidConfig)
 */
[[nodiscard]] Template template_from_json(const nlohmann::json& j);

class TemplateStore {
public:
    /**
     * @param directory  Template directory (created on first save)
     */
    explicit TemplateStore(std::filesystem::path directory = default_directory());

    /**
     * $XDG_CONFIG_HOME/BatchMark, %APPDATA%/BatchMark or ~/.BatchMark
     */
    [[nodiscard]] static std::filesystem::path default_directory();

    /**
     * Validate and write a template, replacing any existing one
     * @throws WatermarkError  InvalidConfig, IOFailure
     */
    void save(const Template& tpl) const;

    /**
     * @throws WatermarkError  IOFailure (missing/unreadable), InvalidConfig
     */
    [[nodiscard]] Template load(const std::string& name) const;

    /**
     * Template names, sorted
     */
    [[nodiscard]] std::vector<std::string> list() const;

    /**
     * @return  true if a template was deleted
     */
    bool remove(const std::string& name) const;

    [[nodiscard]] bool exists(const std::string& name) const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }

private:
    std::filesystem::path m_directory;

    [[nodiscard]] std::filesystem::path path_for(const std::string& name) const;
};

}  // namespace bmk::io
