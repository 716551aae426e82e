#ifndef KINDLE_UTILS_LOG_HPP
#define KINDLE_UTILS_LOG_HPP

#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "terminal.hpp"

namespace Kindle::Utils::Log {
    struct Sink {
        std::ostream* stream{&std::cout};
        bool colored{true};
        bool verbose{true};
    };

    namespace Details {
        template <class... Parts>
        inline std::string concat(Parts&&... parts) {
            std::ostringstream stream;
            (stream << ... << std::forward<Parts>(parts));
            return stream.str();
        }

        inline void emit(const Sink& sink, std::string_view glyph, std::string_view color, const std::string& line) {
            if (sink.stream == nullptr) {
                return;
            }
            *sink.stream << Terminal::Prefix(glyph, color, sink.colored) << line << '\n';
        }
    }

    template <class... Parts>
    inline void info(const Sink& sink, Parts&&... parts) {
        if (!sink.verbose) {
            return;
        }
        Details::emit(sink, Terminal::Symbols::kInfo, Terminal::Colors::kAzure,
                      Details::concat(std::forward<Parts>(parts)...));
    }

    // Warnings ignore the verbose flag.
    template <class... Parts>
    inline void warn(const Sink& sink, Parts&&... parts) {
        Details::emit(sink, Terminal::Symbols::kWarn, Terminal::Colors::kOrange,
                      Details::concat(std::forward<Parts>(parts)...));
    }

    template <class... Parts>
    inline void done(const Sink& sink, Parts&&... parts) {
        if (!sink.verbose) {
            return;
        }
        Details::emit(sink, Terminal::Symbols::kCheck, Terminal::Colors::kGreen,
                      Details::concat(std::forward<Parts>(parts)...));
    }
}

#endif // KINDLE_UTILS_LOG_HPP
