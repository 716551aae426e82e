#ifndef KINDLE_COMMON_SELECTOR_HPP
#define KINDLE_COMMON_SELECTOR_HPP

#include <regex>
#include <string>
#include <utility>

#include "errors.hpp"

namespace Kindle::Selection {
    enum class Mode {
        All,     // every trainable parameter
        None,    // only parameters that carry a vocabulary
        Pattern, // regex anchored at the start of the parameter name
    };

    struct Selector {
        Mode mode{Mode::All};
        std::string pattern{};
    };

    inline const Selector All{Mode::All, {}};
    inline const Selector None{Mode::None, {}};

    [[nodiscard]] inline auto Pattern(std::string pattern) -> Selector {
        return Selector{Mode::Pattern, std::move(pattern)};
    }

    class Matcher {
    public:
        explicit Matcher(const Selector& selector) : mode_(selector.mode) {
            if (mode_ != Mode::Pattern) {
                return;
            }
            try {
                regex_ = std::regex(selector.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& error) {
                throw ConfigurationError("Invalid variable selector pattern '" + selector.pattern + "': " + error.what());
            }
        }

        [[nodiscard]] bool matches(const std::string& name) const {
            switch (mode_) {
                case Mode::All: return true;
                case Mode::None: return false;
                case Mode::Pattern:
                default:
                    return std::regex_search(name, regex_, std::regex_constants::match_continuous);
            }
        }

    private:
        Mode mode_;
        std::regex regex_{};
    };

    [[nodiscard]] inline std::string to_string(const Selector& selector) {
        switch (selector.mode) {
            case Mode::All: return "all";
            case Mode::None: return "none";
            case Mode::Pattern:
            default: return "pattern '" + selector.pattern + "'";
        }
    }
}

#endif // KINDLE_COMMON_SELECTOR_HPP
