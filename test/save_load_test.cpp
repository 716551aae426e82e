#include <cstdint>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../include/Kindle.h"
#include "test_support.hpp"

namespace {
    namespace SaveLoad = Kindle::Common::SaveLoad;
    namespace Settings = Kindle::Settings;
    namespace Selection = Kindle::Selection;
    namespace Init = Kindle::Initialization;

    void write_text(const std::filesystem::path& path, const std::string& text) {
        std::ofstream stream(path);
        stream << text;
    }
}

TEST(SaveLoad, SettingsSurviveAFileRoundTrip) {
    KindleTest::TempDir dir;
    const auto settings = Settings::WarmStart(
        "/models/previous",
        Selection::Pattern("encoder\\..*"),
        {{"encoder.embedding.weight",
          Settings::Vocab("new.txt", 100, 2, "old.txt", 80, Init::TruncatedNormal(0.0, 0.02))}},
        {{"encoder.embedding.weight", "embed/weights"}});

    SaveLoad::write_settings(dir / "warm_start.json", settings);
    const auto loaded = SaveLoad::read_settings(dir / "warm_start.json");

    EXPECT_EQ(loaded.checkpoint.string(), settings.checkpoint.string());
    EXPECT_EQ(loaded.selector.mode, Selection::Mode::Pattern);
    EXPECT_EQ(loaded.selector.pattern, "encoder\\..*");
    ASSERT_EQ(loaded.vocab_info_by_variable.count("encoder.embedding.weight"), 1U);
    const auto& info = loaded.vocab_info_by_variable.at("encoder.embedding.weight");
    EXPECT_EQ(info.new_vocab.string(), "new.txt");
    EXPECT_EQ(info.new_vocab_size, 100);
    EXPECT_EQ(info.num_oov_buckets, 2);
    EXPECT_EQ(info.old_vocab_size, 80);
    ASSERT_TRUE(info.backup.has_value());
    EXPECT_EQ(info.backup->type, Init::Type::TruncatedNormal);
    EXPECT_DOUBLE_EQ(info.backup->std, 0.02);
    EXPECT_EQ(loaded.prev_name_by_variable.at("encoder.embedding.weight"), "embed/weights");
}

TEST(SaveLoad, DefaultsApplyToOptionalFields) {
    KindleTest::TempDir dir;
    write_text(dir / "settings.json", R"({
        "checkpoint": "ckpt",
        "vocabularies": [
            {"variable": "emb", "new_vocab": "n.txt", "new_vocab_size": 4, "old_vocab": "o.txt"}
        ]
    })");

    const auto loaded = SaveLoad::read_settings(dir / "settings.json");

    EXPECT_EQ(loaded.selector.mode, Selection::Mode::All);
    const auto& info = loaded.vocab_info_by_variable.at("emb");
    EXPECT_EQ(info.num_oov_buckets, 0);
    EXPECT_EQ(info.old_vocab_size, -1);
    EXPECT_FALSE(info.backup.has_value());
    EXPECT_TRUE(loaded.prev_name_by_variable.empty());
}

TEST(SaveLoad, MissingCheckpointIsAConfigurationError) {
    KindleTest::TempDir dir;
    write_text(dir / "settings.json", R"({"selector": {"mode": "all"}})");

    EXPECT_THROW((void)SaveLoad::read_settings(dir / "settings.json"), Kindle::ConfigurationError);
}

TEST(SaveLoad, UnknownSelectorModeOrInitializerIsRejected) {
    KindleTest::TempDir dir;
    write_text(dir / "mode.json", R"({"checkpoint": "c", "selector": {"mode": "some"}})");
    write_text(dir / "init.json", R"({"checkpoint": "c", "vocabularies": [
        {"variable": "e", "new_vocab": "n", "new_vocab_size": 1, "old_vocab": "o", "backup": {"type": "orthogonal"}}
    ]})");

    EXPECT_THROW((void)SaveLoad::read_settings(dir / "mode.json"), Kindle::ConfigurationError);
    EXPECT_THROW((void)SaveLoad::read_settings(dir / "init.json"), Kindle::ConfigurationError);
}

TEST(SaveLoad, DuplicateVocabularyEntriesAreRejected) {
    KindleTest::TempDir dir;
    write_text(dir / "dup.json", R"({"checkpoint": "c", "vocabularies": [
        {"variable": "e", "new_vocab": "n", "new_vocab_size": 1, "old_vocab": "o"},
        {"variable": "e", "new_vocab": "n", "new_vocab_size": 2, "old_vocab": "o"}
    ]})");

    EXPECT_THROW((void)SaveLoad::read_settings(dir / "dup.json"), Kindle::ConfigurationError);
}

TEST(SaveLoad, CustomInitializersCannotBeWritten) {
    KindleTest::TempDir dir;
    const auto settings = Settings::WarmStart(
        "ckpt", Selection::All,
        {{"emb", Settings::Vocab("n", 2, 0, "o", -1,
                                 Init::Custom([](const std::vector<std::int64_t>& shape) { return torch::ones(shape); }))}});

    EXPECT_THROW(SaveLoad::write_settings(dir / "s.json", settings), Kindle::ConfigurationError);
}

TEST(SaveLoad, MissingAndMalformedFiles) {
    KindleTest::TempDir dir;
    write_text(dir / "broken.json", "{\"checkpoint\": ");

    EXPECT_THROW((void)SaveLoad::read_settings(dir / "absent.json"), Kindle::NotFoundError);
    EXPECT_THROW((void)SaveLoad::read_settings(dir / "broken.json"), Kindle::ConfigurationError);
}

TEST(SaveLoad, FactoriesValidateTheirArguments) {
    EXPECT_THROW((void)Settings::Vocab("n", 0, 0, "o"), Kindle::ConfigurationError);
    EXPECT_THROW((void)Settings::Vocab("n", 3, -1, "o"), Kindle::ConfigurationError);
    EXPECT_THROW((void)Settings::Vocab("n", 3, 0, "o", -2), Kindle::ConfigurationError);
    EXPECT_THROW((void)Settings::Vocab("", 3, 0, "o"), Kindle::ConfigurationError);
    EXPECT_THROW((void)Settings::WarmStart(""), Kindle::ConfigurationError);
    EXPECT_THROW((void)Settings::WarmStart("c", Selection::Pattern("[")), Kindle::ConfigurationError);
}
