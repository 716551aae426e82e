#ifndef KINDLE_INITIALIZATION_HPP
#define KINDLE_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Kindle::Initialization {
    // Produces values for rows (or columns) that have no source in the old
    // checkpoint. Receives the shape of the block to fill.
    using BackupFn = std::function<torch::Tensor(const std::vector<std::int64_t>& shape)>;

    enum class Type {
        Zeros,
        Constant,
        Normal,
        TruncatedNormal, // redraws beyond two standard deviations
        Uniform,
        XavierUniform,
        XavierNormal,
        KaimingUniform,
        KaimingNormal,
        Custom,
    };

    struct Descriptor {
        Type type{Type::Zeros};
        double value{0.0};
        double mean{0.0};
        double std{1.0};
        double low{-0.05};
        double high{0.05};
        double gain{1.0};
        BackupFn custom{};
        std::string label{};
    };

    [[nodiscard]] inline auto Zeros() -> Descriptor {
        return Descriptor{.type = Type::Zeros};
    }

    [[nodiscard]] inline auto Constant(double value) -> Descriptor {
        return Descriptor{.type = Type::Constant, .value = value};
    }

    [[nodiscard]] inline auto Normal(double mean = 0.0, double std = 1.0) -> Descriptor {
        return Descriptor{.type = Type::Normal, .mean = mean, .std = std};
    }

    [[nodiscard]] inline auto TruncatedNormal(double mean = 0.0, double std = 1.0) -> Descriptor {
        return Descriptor{.type = Type::TruncatedNormal, .mean = mean, .std = std};
    }

    [[nodiscard]] inline auto Uniform(double low = -0.05, double high = 0.05) -> Descriptor {
        return Descriptor{.type = Type::Uniform, .low = low, .high = high};
    }

    [[nodiscard]] inline auto XavierUniform(double gain = 1.0) -> Descriptor {
        return Descriptor{.type = Type::XavierUniform, .gain = gain};
    }

    [[nodiscard]] inline auto XavierNormal(double gain = 1.0) -> Descriptor {
        return Descriptor{.type = Type::XavierNormal, .gain = gain};
    }

    [[nodiscard]] inline auto KaimingUniform() -> Descriptor {
        return Descriptor{.type = Type::KaimingUniform};
    }

    [[nodiscard]] inline auto KaimingNormal() -> Descriptor {
        return Descriptor{.type = Type::KaimingNormal};
    }

    [[nodiscard]] inline auto Custom(BackupFn function, std::string label = "custom") -> Descriptor {
        return Descriptor{.type = Type::Custom, .custom = std::move(function), .label = std::move(label)};
    }
}

#endif // KINDLE_INITIALIZATION_HPP
