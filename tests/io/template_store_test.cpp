/**
 * @file    template_store_test.cpp
 * @brief   Unit tests for JSON template persistence
 * @author  BatchMark Authors
 * @license MIT
 */

#include <gtest/gtest.h>
#include "io/template_store.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <string>

namespace bmk::io {

namespace fs = std::filesystem;
using nlohmann::json;

class TemplateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() /
               ("batchmark_templates_" + std::to_string(stamp));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static Template make_template(const std::string& name) {
        Template tpl;
        tpl.name = name;
        tpl.watermark.text = {"CONFIDENTIAL", "ACME"};
        tpl.watermark.font_size_mode = FontSizeMode::Manual;
        tpl.watermark.manual_font_size = 48;
        tpl.watermark.color = RgbColor{0, 128, 255};
        tpl.watermark.opacity = 0.5f;
        tpl.watermark.rotation_degrees = 30.0f;
        tpl.watermark.count = 6;
        tpl.output.format = ImageFormat::PNG;
        tpl.output.name_rule = NameRule::Numbered;
        tpl.output.suffix = "wm";
        tpl.output.destination_directory = "/tmp/out";
        return tpl;
    }

    static ErrorKind parse_error_kind(const json& j) {
        try {
            (void)template_from_json(j);
        } catch (const WatermarkError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected WatermarkError for " << j.dump();
        return ErrorKind::IOFailure;
    }

    fs::path dir_;
};

// =============================================================================
// JSON Conversion
// =============================================================================

TEST_F(TemplateStoreTest, JsonLayout) {
    const json j = template_to_json(make_template("company"));

    EXPECT_EQ(j.at("name").get<std::string>(), "company");
    const json& w = j.at("watermark_config");
    EXPECT_EQ(w.at("text"), json::array({"CONFIDENTIAL", "ACME"}));
    EXPECT_EQ(w.at("font_size_mode").get<std::string>(), "manual");
    EXPECT_EQ(w.at("color").get<std::string>(), "#0080FF");
    EXPECT_EQ(w.at("opacity").get<int>(), 50);
    EXPECT_EQ(w.at("count").get<int>(), 6);

    const json& o = j.at("output_config");
    EXPECT_EQ(o.at("format").get<std::string>(), "PNG");
    EXPECT_EQ(o.at("name_rule").get<std::string>(), "numbered");
    EXPECT_EQ(o.at("suffix").get<std::string>(), "wm");
    EXPECT_EQ(o.at("output_dir").get<std::string>(), "/tmp/out");
}

TEST_F(TemplateStoreTest, JsonRoundTripKeepsSettings) {
    const Template tpl = make_template("company");
    const Template back = template_from_json(template_to_json(tpl));

    EXPECT_EQ(back.name, tpl.name);
    EXPECT_EQ(back.watermark, tpl.watermark);
    EXPECT_EQ(back.output, tpl.output);
}

TEST_F(TemplateStoreTest, RejectsMissingAndUnknownFields) {
    json missing = template_to_json(make_template("t"));
    missing.at("watermark_config").erase("count");
    EXPECT_EQ(parse_error_kind(missing), ErrorKind::InvalidConfig);

    json unknown = template_to_json(make_template("t"));
    unknown.at("output_config")["compression"] = 9;
    EXPECT_EQ(parse_error_kind(unknown), ErrorKind::InvalidConfig);
}

TEST_F(TemplateStoreTest, RejectsWrongTypesAndValues) {
    json text_string = template_to_json(make_template("t"));
    text_string.at("watermark_config")["text"] = "single string";
    EXPECT_EQ(parse_error_kind(text_string), ErrorKind::InvalidConfig);

    json bad_color = template_to_json(make_template("t"));
    bad_color.at("watermark_config")["color"] = "red";
    EXPECT_EQ(parse_error_kind(bad_color), ErrorKind::InvalidConfig);

    json bad_count = template_to_json(make_template("t"));
    bad_count.at("watermark_config")["count"] = 50;
    EXPECT_EQ(parse_error_kind(bad_count), ErrorKind::InvalidConfig);

    json bad_format = template_to_json(make_template("t"));
    bad_format.at("output_config")["format"] = "TIFF";
    EXPECT_EQ(parse_error_kind(bad_format), ErrorKind::InvalidConfig);

    json float_quality = template_to_json(make_template("t"));
    float_quality.at("output_config")["jpeg_quality"] = 90.5;
    EXPECT_EQ(parse_error_kind(float_quality), ErrorKind::InvalidConfig);
}

TEST_F(TemplateStoreTest, RejectsIntegersBeyondIntRange) {
    // 2^32 + 1 and 2^32 + 90 would wrap to valid values if narrowed
    json huge_count = template_to_json(make_template("t"));
    huge_count.at("watermark_config")["count"] = 4294967297LL;
    EXPECT_EQ(parse_error_kind(huge_count), ErrorKind::InvalidConfig);

    json huge_quality = template_to_json(make_template("t"));
    huge_quality.at("output_config")["jpeg_quality"] = 4294967386LL;
    EXPECT_EQ(parse_error_kind(huge_quality), ErrorKind::InvalidConfig);

    json huge_unsigned = template_to_json(make_template("t"));
    huge_unsigned.at("watermark_config")["manual_font_size"] = 18446744073709551615ULL;
    EXPECT_EQ(parse_error_kind(huge_unsigned), ErrorKind::InvalidConfig);

    json negative = template_to_json(make_template("t"));
    negative.at("watermark_config")["count"] = -4294967295LL;
    EXPECT_EQ(parse_error_kind(negative), ErrorKind::InvalidConfig);
}

// =============================================================================
// Store
// =============================================================================

TEST_F(TemplateStoreTest, SaveLoadListRemove) {
    TemplateStore store(dir_);
    EXPECT_TRUE(store.list().empty());

    store.save(make_template("zeta"));
    store.save(make_template("alpha"));

    EXPECT_TRUE(fs::is_regular_file(dir_ / "alpha.json"));
    EXPECT_TRUE(store.exists("alpha"));
    EXPECT_EQ(store.list(), (std::vector<std::string>{"alpha", "zeta"}));

    const Template loaded = store.load("alpha");
    EXPECT_EQ(loaded.watermark, make_template("alpha").watermark);
    EXPECT_EQ(loaded.output, make_template("alpha").output);

    EXPECT_TRUE(store.remove("alpha"));
    EXPECT_FALSE(store.remove("alpha"));
    EXPECT_FALSE(store.exists("alpha"));
    EXPECT_EQ(store.list(), (std::vector<std::string>{"zeta"}));
}

TEST_F(TemplateStoreTest, SaveOverwrites) {
    TemplateStore store(dir_);
    Template tpl = make_template("t");
    store.save(tpl);

    tpl.watermark.count = 2;
    store.save(tpl);
    EXPECT_EQ(store.load("t").watermark.count, 2);
}

TEST_F(TemplateStoreTest, SaveRejectsInvalidSettings) {
    TemplateStore store(dir_);
    Template tpl = make_template("bad");
    tpl.watermark.opacity = 2.0f;

    EXPECT_THROW(store.save(tpl), WatermarkError);
    EXPECT_FALSE(store.exists("bad"));
}

TEST_F(TemplateStoreTest, LoadMissingIsIoFailure) {
    TemplateStore store(dir_);
    try {
        (void)store.load("nothing");
        FAIL() << "expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
    }
}

TEST_F(TemplateStoreTest, LoadMalformedJsonIsInvalidConfig) {
    fs::create_directories(dir_);
    std::ofstream(dir_ / "broken.json") << "{ \"name\": ";

    TemplateStore store(dir_);
    try {
        (void)store.load("broken");
        FAIL() << "expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfig);
    }
}

TEST_F(TemplateStoreTest, RejectsPathLikeNames) {
    TemplateStore store(dir_);
    for (const char* name : {"", "..", "a/b", "a\\b"}) {
        EXPECT_THROW(store.save(make_template(name)), WatermarkError) << name;
    }
}

}  // namespace bmk::io
