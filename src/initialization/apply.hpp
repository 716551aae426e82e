#ifndef KINDLE_INITIALIZATION_APPLY_HPP
#define KINDLE_INITIALIZATION_APPLY_HPP
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "initialization.hpp"

namespace Kindle::Initialization::Details {
    namespace detail {
        inline void truncated_normal_(torch::Tensor& tensor, double mean, double std) {
            tensor.normal_(mean, std);
            const double bound = 2.0 * std;
            while (true) {
                const auto outside = (tensor - mean).abs() > bound;
                if (!outside.any().item<bool>()) {
                    break;
                }
                auto redraw = torch::empty_like(tensor).normal_(mean, std);
                tensor = torch::where(outside, redraw, tensor);
            }
        }

        inline void require_matrix(const torch::Tensor& tensor, const char* name) {
            if (tensor.dim() < 2) {
                std::ostringstream message;
                message << name << " initialization needs at least two dimensions, got " << tensor.dim() << '.';
                throw ShapeMismatchError(message.str());
            }
        }
    }  // namespace detail

    inline torch::Tensor apply_initialization(const Descriptor& descriptor, const std::vector<std::int64_t>& shape) {
        torch::NoGradGuard guard;
        auto tensor = torch::zeros(shape, torch::TensorOptions().dtype(torch::kFloat32));

        switch (descriptor.type) {
            case Type::Constant:
                torch::nn::init::constant_(tensor, descriptor.value);
                break;
            case Type::Normal:
                torch::nn::init::normal_(tensor, descriptor.mean, descriptor.std);
                break;
            case Type::TruncatedNormal:
                detail::truncated_normal_(tensor, descriptor.mean, descriptor.std);
                break;
            case Type::Uniform:
                torch::nn::init::uniform_(tensor, descriptor.low, descriptor.high);
                break;
            case Type::XavierUniform:
                detail::require_matrix(tensor, "Xavier");
                torch::nn::init::xavier_uniform_(tensor, descriptor.gain);
                break;
            case Type::XavierNormal:
                detail::require_matrix(tensor, "Xavier");
                torch::nn::init::xavier_normal_(tensor, descriptor.gain);
                break;
            case Type::KaimingUniform:
                detail::require_matrix(tensor, "Kaiming");
                torch::nn::init::kaiming_uniform_(tensor,
                                                  /*a=*/0.0,
                                                  torch::kFanIn,
                                                  torch::kReLU);
                break;
            case Type::KaimingNormal:
                detail::require_matrix(tensor, "Kaiming");
                torch::nn::init::kaiming_normal_(tensor,
                                                 /*a=*/0.0,
                                                 torch::kFanIn,
                                                 torch::kReLU);
                break;
            case Type::Custom:
                if (!descriptor.custom) {
                    throw ConfigurationError("Custom backup initializer has no callable attached.");
                }
                return descriptor.custom(shape);
            case Type::Zeros:
            default:
                break;
        }
        return tensor;
    }
}

namespace Kindle::Initialization {
    // Zeros stays an empty BackupFn: callers treat "no backup" as zero fill.
    [[nodiscard]] inline BackupFn make_backup(const Descriptor& descriptor) {
        if (descriptor.type == Type::Zeros) {
            return {};
        }
        if (descriptor.type == Type::Custom) {
            if (!descriptor.custom) {
                throw ConfigurationError("Custom backup initializer has no callable attached.");
            }
            return descriptor.custom;
        }
        return [descriptor](const std::vector<std::int64_t>& shape) {
            return Details::apply_initialization(descriptor, shape);
        };
    }

    [[nodiscard]] inline std::string name(const Descriptor& descriptor) {
        std::ostringstream stream;
        switch (descriptor.type) {
            case Type::Zeros: return "zero-initialized";
            case Type::Constant: stream << "constant(" << descriptor.value << ")"; break;
            case Type::Normal: stream << "normal(mean=" << descriptor.mean << ", std=" << descriptor.std << ")"; break;
            case Type::TruncatedNormal:
                stream << "truncated_normal(mean=" << descriptor.mean << ", std=" << descriptor.std << ")";
                break;
            case Type::Uniform: stream << "uniform(" << descriptor.low << ", " << descriptor.high << ")"; break;
            case Type::XavierUniform: stream << "xavier_uniform(gain=" << descriptor.gain << ")"; break;
            case Type::XavierNormal: stream << "xavier_normal(gain=" << descriptor.gain << ")"; break;
            case Type::KaimingUniform: return "kaiming_uniform";
            case Type::KaimingNormal: return "kaiming_normal";
            case Type::Custom: return descriptor.label.empty() ? std::string{"custom"} : descriptor.label;
        }
        return stream.str();
    }
}
#endif // KINDLE_INITIALIZATION_APPLY_HPP
