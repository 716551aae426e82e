#ifndef KINDLE_COMMON_SETTINGS_HPP
#define KINDLE_COMMON_SETTINGS_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "../initialization/initialization.hpp"
#include "errors.hpp"
#include "selector.hpp"

namespace Kindle::Settings {
    /*
     * Vocabulary of a remapped parameter:
     *   new_vocab        vocabulary file of the model being trained
     *   new_vocab_size   entries of new_vocab in use (> 0)
     *   num_oov_buckets  OOV rows appended after the vocabulary (>= 0)
     *   old_vocab        vocabulary file the checkpoint was trained with
     *   old_vocab_size   entries of old_vocab in use, -1 for all of them
     *   backup           values for rows without a source; zeros if unset
     */
    struct VocabInfo {
        std::filesystem::path new_vocab{};
        std::int64_t new_vocab_size{0};
        std::int64_t num_oov_buckets{0};
        std::filesystem::path old_vocab{};
        std::int64_t old_vocab_size{-1};
        std::optional<Initialization::Descriptor> backup{};
    };

    struct WarmStartSettings {
        std::filesystem::path checkpoint{};
        Selection::Selector selector{Selection::All};
        std::map<std::string, VocabInfo> vocab_info_by_variable{};
        std::map<std::string, std::string> prev_name_by_variable{};
    };

    inline void validate(const VocabInfo& info, const std::string& context = "vocabulary info") {
        std::ostringstream message;
        if (info.new_vocab.empty()) {
            message << "Missing new vocabulary path in " << context << '.';
        } else if (info.new_vocab_size <= 0) {
            message << "New vocabulary size must be positive in " << context << ", got " << info.new_vocab_size << '.';
        } else if (info.num_oov_buckets < 0) {
            message << "OOV bucket count must be non-negative in " << context << ", got " << info.num_oov_buckets << '.';
        } else if (info.old_vocab.empty()) {
            message << "Missing old vocabulary path in " << context << '.';
        } else if (info.old_vocab_size < -1) {
            message << "Old vocabulary size must be -1 or non-negative in " << context << ", got "
                    << info.old_vocab_size << '.';
        } else {
            return;
        }
        throw ConfigurationError(message.str());
    }

    inline void validate(const WarmStartSettings& settings) {
        if (settings.checkpoint.empty()) {
            throw ConfigurationError("Warm-start settings require a checkpoint to initialize from.");
        }
        if (settings.selector.mode == Selection::Mode::Pattern) {
            [[maybe_unused]] const Selection::Matcher matcher(settings.selector);
        }
        for (const auto& [name, info] : settings.vocab_info_by_variable) {
            validate(info, "vocabulary info of '" + name + "'");
        }
    }

    [[nodiscard]] inline auto Vocab(std::filesystem::path new_vocab,
                                    std::int64_t new_vocab_size,
                                    std::int64_t num_oov_buckets,
                                    std::filesystem::path old_vocab,
                                    std::int64_t old_vocab_size = -1,
                                    std::optional<Initialization::Descriptor> backup = std::nullopt) -> VocabInfo {
        VocabInfo info{std::move(new_vocab), new_vocab_size, num_oov_buckets, std::move(old_vocab), old_vocab_size,
                       std::move(backup)};
        validate(info);
        return info;
    }

    [[nodiscard]] inline auto WarmStart(std::filesystem::path checkpoint,
                                        Selection::Selector selector = Selection::All,
                                        std::map<std::string, VocabInfo> vocab_info_by_variable = {},
                                        std::map<std::string, std::string> prev_name_by_variable = {}) -> WarmStartSettings {
        WarmStartSettings settings{std::move(checkpoint), std::move(selector), std::move(vocab_info_by_variable),
                                   std::move(prev_name_by_variable)};
        validate(settings);
        return settings;
    }
}

#endif // KINDLE_COMMON_SETTINGS_HPP
