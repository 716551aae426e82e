#ifndef KINDLE_REMAP_HPP
#define KINDLE_REMAP_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../common/errors.hpp"
#include "../vocabulary/vocabulary.hpp"

namespace Kindle::Remap {
    inline constexpr std::int64_t kNoSource = -1;

    // One entry per new row: the old row to copy, or kNoSource for rows that
    // take the backup initializer.
    class Plan {
    public:
        Plan() = default;
        explicit Plan(std::vector<std::int64_t> sources) : sources_(std::move(sources)) {}

        [[nodiscard]] std::int64_t size() const noexcept { return static_cast<std::int64_t>(sources_.size()); }
        [[nodiscard]] bool empty() const noexcept { return sources_.empty(); }

        [[nodiscard]] std::int64_t source(std::int64_t position) const {
            if (position < 0 || position >= size()) {
                std::ostringstream message;
                message << "Remap plan position " << position << " out of range [0, " << size() << ").";
                throw std::out_of_range(message.str());
            }
            return sources_[static_cast<std::size_t>(position)];
        }

        [[nodiscard]] bool copies(std::int64_t position) const { return source(position) != kNoSource; }

        [[nodiscard]] std::int64_t copied_count() const noexcept {
            std::int64_t count = 0;
            for (const auto value : sources_) {
                count += value != kNoSource ? 1 : 0;
            }
            return count;
        }

        [[nodiscard]] std::int64_t missing_count() const noexcept { return size() - copied_count(); }

        [[nodiscard]] const std::vector<std::int64_t>& sources() const noexcept { return sources_; }

    private:
        std::vector<std::int64_t> sources_{};
    };

    /*
     * Row plan for a vocabulary-backed matrix of new_vocab_size + num_oov_buckets
     * rows. A new row copies the old row holding the same token. Rows whose
     * token is absent from the old vocabulary, and the whole OOV bucket range,
     * fall back to backup. The new index must hold new_vocab_size tokens.
     * Old OOV buckets are hash assigned and never carried over.
     */
    inline Plan build_plan(const Vocabulary::Index& old_index,
                           const Vocabulary::Index& new_index,
                           std::int64_t new_vocab_size,
                           std::int64_t num_oov_buckets)
    {
        if (new_vocab_size <= 0) {
            std::ostringstream message;
            message << "Remap plan requires a positive new vocabulary size, got " << new_vocab_size << '.';
            throw ConfigurationError(message.str());
        }
        if (num_oov_buckets < 0) {
            std::ostringstream message;
            message << "Remap plan requires a non-negative OOV bucket count, got " << num_oov_buckets << '.';
            throw ConfigurationError(message.str());
        }

        if (new_index.size() < new_vocab_size) {
            std::ostringstream message;
            message << "New vocabulary holds " << new_index.size() << " tokens but its size is declared as "
                    << new_vocab_size << '.';
            throw ConfigurationError(message.str());
        }

        std::vector<std::int64_t> sources(static_cast<std::size_t>(new_vocab_size + num_oov_buckets), kNoSource);
        for (std::int64_t position = 0; position < new_vocab_size; ++position) {
            if (const auto old_position = old_index.find(new_index.token_at(position))) {
                sources[static_cast<std::size_t>(position)] = *old_position;
            }
        }
        return Plan(std::move(sources));
    }

    // Same token rule applied to the column vocabulary of a matrix.
    inline Plan build_column_plan(const Vocabulary::Index& old_index,
                                  const Vocabulary::Index& new_index,
                                  std::int64_t num_oov_buckets = 0)
    {
        return build_plan(old_index, new_index, new_index.size(), num_oov_buckets);
    }
}

#endif // KINDLE_REMAP_HPP
