#ifndef KINDLE_VOCABULARY_HPP
#define KINDLE_VOCABULARY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../common/errors.hpp"

namespace Kindle::Vocabulary {
    inline constexpr std::int64_t kUseAll = -1;

    /*
     * Ordered token list of a vocabulary file. Position = row of the matching
     * embedding matrix. Duplicates keep their row; lookup resolves to the
     * first occurrence.
     */
    class Index {
    public:
        Index() = default;

        explicit Index(std::vector<std::string> tokens)
            : tokens_(std::move(tokens))
        {
            positions_.reserve(tokens_.size());
            for (std::size_t position = 0; position < tokens_.size(); ++position) {
                positions_.emplace(tokens_[position], static_cast<std::int64_t>(position));
            }
        }

        [[nodiscard]] std::int64_t size() const noexcept { return static_cast<std::int64_t>(tokens_.size()); }
        [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }

        [[nodiscard]] const std::string& token_at(std::int64_t position) const {
            if (position < 0 || position >= size()) {
                std::ostringstream message;
                message << "Vocabulary position " << position << " out of range [0, " << size() << ").";
                throw std::out_of_range(message.str());
            }
            return tokens_[static_cast<std::size_t>(position)];
        }

        [[nodiscard]] std::optional<std::int64_t> find(const std::string& token) const {
            const auto it = positions_.find(token);
            if (it == positions_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        [[nodiscard]] bool contains(const std::string& token) const { return positions_.count(token) > 0; }

        [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }

    private:
        std::vector<std::string> tokens_{};
        std::unordered_map<std::string, std::int64_t> positions_{};
    };

    // Reads the first size_cap lines of a newline-delimited vocabulary (every
    // line when size_cap == kUseAll). A file shorter than size_cap is a
    // configuration error.
    inline Index load(const std::filesystem::path& path, std::int64_t size_cap = kUseAll)
    {
        if (size_cap < kUseAll) {
            std::ostringstream message;
            message << "Vocabulary size cap must be -1 or non-negative, got " << size_cap << '.';
            throw ConfigurationError(message.str());
        }

        std::error_code error;
        if (path.empty() || !std::filesystem::is_regular_file(path, error)) {
            throw NotFoundError("Vocabulary file not found at '" + path.string() + "'.");
        }

        std::ifstream stream(path);
        if (!stream) {
            throw NotFoundError("Failed to open vocabulary file '" + path.string() + "'.");
        }

        std::vector<std::string> tokens;

        std::string line;
        while ((size_cap == kUseAll || static_cast<std::int64_t>(tokens.size()) < size_cap)
               && std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            tokens.push_back(std::move(line));
            line.clear();
        }

        if (stream.bad()) {
            throw NotFoundError("Failed while reading vocabulary file '" + path.string() + "'.");
        }
        if (size_cap != kUseAll && static_cast<std::int64_t>(tokens.size()) < size_cap) {
            std::ostringstream message;
            message << "Vocabulary file '" << path.string() << "' has " << tokens.size() << " entries but "
                    << size_cap << " were requested.";
            throw ConfigurationError(message.str());
        }

        return Index(std::move(tokens));
    }
}

#endif // KINDLE_VOCABULARY_HPP
