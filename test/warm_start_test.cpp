#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Kindle.h"
#include "test_support.hpp"

namespace {
    namespace Checkpoint = Kindle::Checkpoint;
    namespace Parameter = Kindle::Parameter;
    namespace Selection = Kindle::Selection;
    namespace Settings = Kindle::Settings;

    std::vector<std::string> lines_containing(const std::string& text, const std::string& needle) {
        std::vector<std::string> found;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            if (line.find(needle) != std::string::npos) {
                found.push_back(line);
            }
        }
        return found;
    }

    // Old model: embedding rows for ["a", "b", "c"] hold [1], [2], [3].
    class WarmStartTest : public ::testing::Test {
    protected:
        void SetUp() override {
            old_vocab_ = KindleTest::write_vocab(dir_ / "old_vocab.txt", {"a", "b", "c"});
            new_vocab_ = KindleTest::write_vocab(dir_ / "new_vocab.txt", {"c", "a", "d"});
            checkpoint_ = dir_ / "checkpoint";
            (void)Checkpoint::save(checkpoint_, {
                {"embedding.weight", KindleTest::column({1.0F, 2.0F, 3.0F})},
                {"fc.weight", fc_weight_},
                {"fc.bias", fc_bias_},
            });
        }

        [[nodiscard]] Settings::VocabInfo vocab(std::int64_t old_size = -1) const {
            return Settings::Vocab(new_vocab_, 3, 1, old_vocab_, old_size);
        }

        [[nodiscard]] Kindle::WarmStartOptions quiet() const {
            return Kindle::WarmStartOptions{{&log_, false, true}};
        }

        KindleTest::TempDir dir_;
        std::filesystem::path old_vocab_;
        std::filesystem::path new_vocab_;
        std::filesystem::path checkpoint_;
        torch::Tensor fc_weight_ = torch::tensor({{0.5F}, {-0.5F}});
        torch::Tensor fc_bias_ = torch::tensor({0.25F, 0.75F});
        mutable std::ostringstream log_;
    };
}

TEST_F(WarmStartTest, RemapsVocabularyRowsAndRestoresTheRest) {
    KindleTest::ToyModel model(4, 1);
    const auto settings = Settings::WarmStart(checkpoint_, Selection::All, {{"embedding.weight", vocab()}});

    const auto report = Kindle::warm_start(settings, *model, quiet());

    EXPECT_TRUE(torch::equal(model->embedding->weight, KindleTest::column({3.0F, 1.0F, 0.0F, 0.0F})));
    EXPECT_TRUE(torch::equal(model->fc->weight, fc_weight_));
    EXPECT_TRUE(torch::equal(model->fc->bias, fc_bias_));
    EXPECT_EQ(report.remapped, (std::vector<std::string>{"embedding.weight"}));
    EXPECT_EQ(report.restored, (std::vector<std::string>{"fc.weight", "fc.bias"}));
    EXPECT_TRUE(report.skipped.empty());
}

TEST_F(WarmStartTest, SelectorNoneOnlyTouchesVocabularyParameters) {
    KindleTest::ToyModel model(4, 1);
    const auto fc_before = model->fc->weight.detach().clone();
    const auto settings = Settings::WarmStart(checkpoint_, Selection::None, {{"embedding.weight", vocab()}});

    const auto report = Kindle::warm_start(settings, *model, quiet());

    EXPECT_TRUE(torch::equal(model->embedding->weight, KindleTest::column({3.0F, 1.0F, 0.0F, 0.0F})));
    EXPECT_TRUE(torch::equal(model->fc->weight, fc_before));
    EXPECT_EQ(report.skipped, (std::vector<std::string>{"fc.weight", "fc.bias"}));
}

TEST_F(WarmStartTest, SelectorNoneWithoutVocabularyWarnsAndChangesNothing) {
    KindleTest::ToyModel model(3, 1);
    const auto before = model->embedding->weight.detach().clone();

    const auto report = Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::None), *model, quiet());

    EXPECT_EQ(report.warm_started(), 0U);
    EXPECT_TRUE(torch::equal(model->embedding->weight, before));
    EXPECT_EQ(lines_containing(log_.str(), "nothing will be warm-started").size(), 1U);
}

TEST_F(WarmStartTest, VocabularyParametersIgnoreThePattern) {
    KindleTest::ToyModel model(4, 1);
    const auto settings = Settings::WarmStart(checkpoint_, Selection::Pattern("fc\\.weight"),
                                              {{"embedding.weight", vocab()}});

    const auto report = Kindle::warm_start(settings, *model, quiet());

    EXPECT_EQ(report.restored, (std::vector<std::string>{"fc.weight"}));
    EXPECT_EQ(report.remapped, (std::vector<std::string>{"embedding.weight"}));
    EXPECT_EQ(report.skipped, (std::vector<std::string>{"fc.bias"}));
    EXPECT_TRUE(torch::equal(model->embedding->weight, KindleTest::column({3.0F, 1.0F, 0.0F, 0.0F})));
}

TEST_F(WarmStartTest, TruncatedOldVocabularyLeavesLaterTokensUnmatched) {
    KindleTest::ToyModel model(4, 1);
    const auto settings = Settings::WarmStart(checkpoint_, Selection::None, {{"embedding.weight", vocab(1)}});

    (void)Kindle::warm_start(settings, *model, quiet());

    EXPECT_TRUE(torch::equal(model->embedding->weight, KindleTest::column({0.0F, 1.0F, 0.0F, 0.0F})));
}

TEST_F(WarmStartTest, BackupInitializerFillsUnmatchedRows) {
    KindleTest::ToyModel model(4, 1);
    const auto info = Settings::Vocab(new_vocab_, 3, 1, old_vocab_, -1, Kindle::Initialization::Constant(-1.0));
    const auto settings = Settings::WarmStart(checkpoint_, Selection::None, {{"embedding.weight", info}});

    (void)Kindle::warm_start(settings, *model, quiet());

    EXPECT_TRUE(torch::equal(model->embedding->weight, KindleTest::column({3.0F, 1.0F, -1.0F, -1.0F})));
    EXPECT_EQ(lines_containing(log_.str(), "initializer: constant(-1)").size(), 1U);
}

TEST_F(WarmStartTest, PreviousNamesRedirectCheckpointLookups) {
    const auto renamed = dir_ / "renamed";
    (void)Checkpoint::save(renamed, {{"legacy.projection", torch::tensor({{9.0F}, {8.0F}})}});
    KindleTest::ToyModel model(4, 1);
    const auto settings = Settings::WarmStart(renamed, Selection::Pattern("fc\\.weight"), {},
                                              {{"fc.weight", "legacy.projection"}});

    const auto report = Kindle::warm_start(settings, *model, quiet());

    EXPECT_TRUE(torch::equal(model->fc->weight, torch::tensor({{9.0F}, {8.0F}})));
    EXPECT_EQ(report.restored, (std::vector<std::string>{"fc.weight"}));
    EXPECT_EQ(lines_containing(log_.str(), "prev_var_name: legacy.projection").size(), 1U);
}

TEST_F(WarmStartTest, RepeatedRunsProduceTheSameValues) {
    KindleTest::ToyModel first(4, 1);
    KindleTest::ToyModel second(4, 1);
    const auto settings = Settings::WarmStart(checkpoint_, Selection::All, {{"embedding.weight", vocab()}});

    (void)Kindle::warm_start(settings, *first, quiet());
    (void)Kindle::warm_start(settings, *second, quiet());
    (void)Kindle::warm_start(settings, *second, quiet());

    EXPECT_TRUE(torch::equal(first->embedding->weight, second->embedding->weight));
    EXPECT_TRUE(torch::equal(first->fc->weight, second->fc->weight));
}

TEST_F(WarmStartTest, PartitionedEmbeddingReceivesItsOwnRows) {
    const auto top = torch::zeros({2, 1});
    const auto bottom = torch::zeros({2, 1});
    Parameter::Collection collection;
    collection.add(Parameter::partition("embedding.weight", {top, bottom}));
    const auto settings = Settings::WarmStart(checkpoint_, Selection::All, {{"embedding.weight", vocab()}});

    const auto report = Kindle::warm_start(settings, collection, quiet());

    EXPECT_TRUE(torch::equal(top, KindleTest::column({3.0F, 1.0F})));
    EXPECT_TRUE(torch::equal(bottom, KindleTest::column({0.0F, 0.0F})));
    EXPECT_EQ(report.remapped, (std::vector<std::string>{"embedding.weight"}));
}

TEST_F(WarmStartTest, UnknownParameterNamesAreRejectedBeforeAnyWrite) {
    KindleTest::ToyModel model(4, 1);
    const auto before = model->fc->weight.detach().clone();

    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::All, {{"missing.weight", vocab()}}),
                                          *model, quiet()),
                 Kindle::ConfigurationError);
    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::All, {}, {{"nope", "x"}}),
                                          *model, quiet()),
                 Kindle::ConfigurationError);
    EXPECT_TRUE(torch::equal(model->fc->weight, before));
}

TEST_F(WarmStartTest, MissingInputsAreNotFound) {
    KindleTest::ToyModel model(4, 1);
    const auto absent_vocab = Settings::Vocab(dir_ / "absent.txt", 3, 1, old_vocab_);

    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::None,
                                                              {{"embedding.weight", absent_vocab}}),
                                          *model, quiet()),
                 Kindle::NotFoundError);
    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(dir_ / "no_checkpoint"), *model, quiet()),
                 Kindle::NotFoundError);
}

TEST_F(WarmStartTest, PlainRestoreRequiresMatchingShapes) {
    KindleTest::ToyModel model(5, 1);

    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(checkpoint_), *model, quiet()),
                 Kindle::ShapeMismatchError);

    const auto attempts = lines_containing(log_.str(), "Warm-starting variable: ");
    ASSERT_FALSE(attempts.empty());
    EXPECT_NE(attempts.back().find("embedding.weight"), std::string::npos);
}

TEST_F(WarmStartTest, LogsOneLinePerWarmStartedParameter) {
    KindleTest::ToyModel model(4, 1);
    const auto settings = Settings::WarmStart(checkpoint_, Selection::All, {{"embedding.weight", vocab()}});

    (void)Kindle::warm_start(settings, *model, quiet());

    const auto text = log_.str();
    EXPECT_EQ(lines_containing(text, "Warm-starting variable: ").size(), 3U);
    const auto remapped = lines_containing(text, "Warm-starting variable: embedding.weight");
    ASSERT_EQ(remapped.size(), 1U);
    EXPECT_NE(remapped.front().find("current_vocab_size: 3"), std::string::npos);
    EXPECT_NE(remapped.front().find("prev_vocab_size: All"), std::string::npos);
    EXPECT_NE(remapped.front().find("current_oov: 1"), std::string::npos);
    EXPECT_NE(remapped.front().find("prev_tensor: Unchanged"), std::string::npos);
    EXPECT_NE(remapped.front().find("initializer: zero-initialized"), std::string::npos);
    EXPECT_EQ(lines_containing(text, "prev_var_name: Unchanged").size(), 2U);
    EXPECT_EQ(text.find('\033'), std::string::npos);
}

TEST_F(WarmStartTest, QuietSinkStillReportsWarnings) {
    KindleTest::ToyModel model(3, 1);
    const Kindle::WarmStartOptions options{{&log_, false, false}};

    (void)Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::None), *model, options);

    EXPECT_TRUE(lines_containing(log_.str(), "Warm-starting").empty());
    EXPECT_EQ(lines_containing(log_.str(), "nothing will be warm-started").size(), 1U);
}

TEST_F(WarmStartTest, FailedPassLeavesEveryParameterUntouched) {
    const auto mismatched = dir_ / "mismatched";
    (void)Checkpoint::save(mismatched, {
        {"embedding.weight", KindleTest::column({1.0F, 2.0F, 3.0F})},
        {"fc.weight", torch::ones({3, 1})},
        {"fc.bias", fc_bias_},
    });
    KindleTest::ToyModel model(4, 1);
    const auto embedding_before = model->embedding->weight.detach().clone();
    const auto settings = Settings::WarmStart(mismatched, Selection::All, {{"embedding.weight", vocab()}});

    EXPECT_THROW((void)Kindle::warm_start(settings, *model, quiet()), Kindle::ShapeMismatchError);

    EXPECT_TRUE(torch::equal(model->embedding->weight, embedding_before));
    const auto attempts = lines_containing(log_.str(), "Warm-starting variable: ");
    ASSERT_FALSE(attempts.empty());
    EXPECT_NE(attempts.back().find("fc.weight"), std::string::npos);
}

TEST_F(WarmStartTest, VocabularyParameterTakesEveryPartitionWhateverThePattern) {
    const auto top = torch::full({2, 1}, 5.0F);
    const auto bottom = torch::full({2, 1}, 5.0F);
    Parameter::Collection collection;
    collection.add(Parameter::partition("embedding.weight", {top, bottom}));
    const auto settings = Settings::WarmStart(checkpoint_, Selection::Pattern("embedding\\.weight/part_0"),
                                              {{"embedding.weight", vocab()}});

    const auto report = Kindle::warm_start(settings, collection, quiet());

    EXPECT_TRUE(torch::equal(top, KindleTest::column({3.0F, 1.0F})));
    EXPECT_TRUE(torch::equal(bottom, KindleTest::column({0.0F, 0.0F})));
    EXPECT_EQ(report.remapped, (std::vector<std::string>{"embedding.weight"}));
}

TEST_F(WarmStartTest, VocabularySizeLargerThanItsFileIsRejected) {
    KindleTest::ToyModel model(4, 1);
    const auto before = model->embedding->weight.detach().clone();
    const auto new_too_long = Settings::Vocab(new_vocab_, 4, 0, old_vocab_);
    const auto old_too_long = Settings::Vocab(new_vocab_, 3, 1, old_vocab_, 5);

    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::None,
                                                              {{"embedding.weight", new_too_long}}),
                                          *model, quiet()),
                 Kindle::ConfigurationError);
    EXPECT_THROW((void)Kindle::warm_start(Settings::WarmStart(checkpoint_, Selection::None,
                                                              {{"embedding.weight", old_too_long}}),
                                          *model, quiet()),
                 Kindle::ConfigurationError);
    EXPECT_TRUE(torch::equal(model->embedding->weight, before));
}

TEST_F(WarmStartTest, EmptyOldVocabularyIsLoggedAsAll) {
    KindleTest::ToyModel model(4, 1);
    const auto settings = Settings::WarmStart(checkpoint_, Selection::None, {{"embedding.weight", vocab(0)}});

    (void)Kindle::warm_start(settings, *model, quiet());

    EXPECT_TRUE(torch::equal(model->embedding->weight, torch::zeros({4, 1})));
    const auto remapped = lines_containing(log_.str(), "Warm-starting variable: embedding.weight");
    ASSERT_EQ(remapped.size(), 1U);
    EXPECT_NE(remapped.front().find("prev_vocab_size: All"), std::string::npos);
}
