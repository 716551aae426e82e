#ifndef KINDLE_VARIABLE_HPP
#define KINDLE_VARIABLE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../common/selector.hpp"

namespace Kindle::Parameter {
    // Position of a slice inside the logical parameter it belongs to.
    struct SliceInfo {
        std::string full_name{};
        std::vector<std::int64_t> full_shape{};
        std::vector<std::int64_t> offset{};
    };

    // Aliases a model tensor; the model keeps ownership of the storage.
    struct Variable {
        std::string name{};
        torch::Tensor value{};
        std::optional<SliceInfo> slice{};
    };

    // One logical matrix stored as disjoint row-range partitions.
    struct PartitionedVariable {
        std::string name{};
        std::vector<std::int64_t> full_shape{};
        std::vector<Variable> partitions{};
    };

    using Handle = std::variant<Variable, std::vector<Variable>, PartitionedVariable>;

    struct Slice {
        Variable variable{};
        std::vector<std::int64_t> offset{};
        std::vector<std::int64_t> shape{};

        [[nodiscard]] std::int64_t row_begin() const { return offset.empty() ? 0 : offset.front(); }
        [[nodiscard]] std::int64_t row_end() const { return row_begin() + (shape.empty() ? 0 : shape.front()); }
    };

    struct LogicalParameter {
        std::string name{};
        std::vector<std::int64_t> full_shape{};
        std::vector<Slice> slices{};

        [[nodiscard]] bool partitioned() const noexcept {
            return slices.size() > 1 || (slices.size() == 1 && slices.front().variable.slice.has_value());
        }
    };

    namespace Details {
        inline std::string format_shape(const std::vector<std::int64_t>& shape) {
            std::ostringstream stream;
            stream << '(';
            for (std::size_t i = 0; i < shape.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << shape[i];
            }
            stream << ')';
            return stream.str();
        }

        inline void require_defined(const Variable& variable) {
            if (!variable.value.defined()) {
                throw UnsupportedParameterTypeError("Parameter '" + variable.name + "' holds an undefined tensor.");
            }
        }

        inline bool overlaps(const Slice& a, const Slice& b) {
            for (std::size_t dim = 0; dim < a.offset.size(); ++dim) {
                const auto a_end = a.offset[dim] + a.shape[dim];
                const auto b_end = b.offset[dim] + b.shape[dim];
                if (a_end <= b.offset[dim] || b_end <= a.offset[dim]) {
                    return false;
                }
            }
            return true;
        }

        inline Slice to_slice(const Variable& variable) {
            require_defined(variable);
            Slice slice{variable, {}, variable.value.sizes().vec()};
            if (variable.slice) {
                slice.offset = variable.slice->offset;
            } else {
                slice.offset.assign(slice.shape.size(), 0);
            }
            return slice;
        }

        inline void validate_slices(const LogicalParameter& parameter) {
            const auto rank = parameter.full_shape.size();
            for (const auto& slice : parameter.slices) {
                if (slice.offset.size() != rank || slice.shape.size() != rank) {
                    std::ostringstream message;
                    message << "Slice '" << slice.variable.name << "' of shape " << format_shape(slice.shape)
                            << " does not match the rank of '" << parameter.name << "' "
                            << format_shape(parameter.full_shape) << '.';
                    throw InconsistentSliceError(message.str());
                }
                for (std::size_t dim = 0; dim < rank; ++dim) {
                    if (slice.offset[dim] < 0 || slice.offset[dim] + slice.shape[dim] > parameter.full_shape[dim]) {
                        std::ostringstream message;
                        message << "Slice '" << slice.variable.name << "' at offset " << format_shape(slice.offset)
                                << " exceeds the full shape " << format_shape(parameter.full_shape) << " of '"
                                << parameter.name << "'.";
                        throw InconsistentSliceError(message.str());
                    }
                }
            }
            for (std::size_t i = 0; i < parameter.slices.size(); ++i) {
                for (std::size_t j = i + 1; j < parameter.slices.size(); ++j) {
                    if (overlaps(parameter.slices[i], parameter.slices[j])) {
                        throw InconsistentSliceError("Slices '" + parameter.slices[i].variable.name + "' and '"
                                                     + parameter.slices[j].variable.name + "' of '" + parameter.name
                                                     + "' overlap.");
                    }
                }
            }
        }

        inline LogicalParameter from_slices(const std::vector<Variable>& variables) {
            if (variables.empty()) {
                throw UnsupportedParameterTypeError("An empty list of parameter slices cannot be warm-started.");
            }

            LogicalParameter parameter;
            for (const auto& variable : variables) {
                auto slice = to_slice(variable);
                const auto name = variable.slice ? variable.slice->full_name : variable.name;
                const auto full_shape = variable.slice ? variable.slice->full_shape : slice.shape;
                if (parameter.slices.empty()) {
                    parameter.name = name;
                    parameter.full_shape = full_shape;
                } else if (name != parameter.name || full_shape != parameter.full_shape) {
                    std::ostringstream message;
                    message << "Parameter slices disagree on their logical parameter: '" << parameter.name << "' "
                            << format_shape(parameter.full_shape) << " vs '" << name << "' "
                            << format_shape(full_shape) << '.';
                    throw InconsistentSliceError(message.str());
                }
                parameter.slices.push_back(std::move(slice));
            }
            if (parameter.slices.size() > 1) {
                for (const auto& slice : parameter.slices) {
                    if (!slice.variable.slice) {
                        throw InconsistentSliceError("Parameter '" + slice.variable.name
                                                     + "' is listed with other slices but carries no slice information.");
                    }
                }
            }
            validate_slices(parameter);
            return parameter;
        }
    }

    [[nodiscard]] inline std::string logical_name(const Variable& variable) {
        return variable.slice ? variable.slice->full_name : variable.name;
    }

    /*
     * Resolves any accepted parameter form into one logical parameter with the
     * offset of each slice. Every slice must belong to the same full parameter,
     * share its full shape, stay inside it, and not overlap another slice.
     */
    [[nodiscard]] inline LogicalParameter resolve(const Handle& handle) {
        return std::visit([](const auto& value) -> LogicalParameter {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Variable>) {
                return Details::from_slices({value});
            } else if constexpr (std::is_same_v<T, std::vector<Variable>>) {
                return Details::from_slices(value);
            } else {
                if (value.name.empty()) {
                    throw UnsupportedParameterTypeError("Partitioned parameter has no name.");
                }
                if (value.partitions.empty()) {
                    throw UnsupportedParameterTypeError("Partitioned parameter '" + value.name + "' has no partitions.");
                }
                for (const auto& partition : value.partitions) {
                    if (!partition.slice) {
                        throw InconsistentSliceError("Partition '" + partition.name + "' of '" + value.name
                                                     + "' carries no slice information.");
                    }
                }
                auto parameter = Details::from_slices(value.partitions);
                if (parameter.name != value.name || parameter.full_shape != value.full_shape) {
                    throw InconsistentSliceError("Partitions of '" + value.name + "' describe logical parameter '"
                                                 + parameter.name + "' " + Details::format_shape(parameter.full_shape)
                                                 + ".");
                }
                return parameter;
            }
        }, handle);
    }

    // Wraps row-range tensors as the partitions of `name`, stacked along axis 0.
    [[nodiscard]] inline PartitionedVariable partition(const std::string& name, const std::vector<torch::Tensor>& parts) {
        if (parts.empty()) {
            throw UnsupportedParameterTypeError("Partitioned parameter '" + name + "' needs at least one partition.");
        }

        PartitionedVariable result;
        result.name = name;
        result.full_shape = parts.front().sizes().vec();
        result.full_shape[0] = 0;
        for (const auto& part : parts) {
            if (!part.defined() || part.dim() != static_cast<std::int64_t>(result.full_shape.size())) {
                throw InconsistentSliceError("Partitions of '" + name + "' must be defined and share one rank.");
            }
            for (std::int64_t dim = 1; dim < part.dim(); ++dim) {
                if (part.size(dim) != result.full_shape[static_cast<std::size_t>(dim)]) {
                    throw InconsistentSliceError("Partitions of '" + name + "' must agree on every non-row dimension.");
                }
            }
            result.full_shape[0] += part.size(0);
        }

        std::int64_t row = 0;
        for (std::size_t index = 0; index < parts.size(); ++index) {
            std::vector<std::int64_t> offset(result.full_shape.size(), 0);
            offset[0] = row;
            result.partitions.push_back(Variable{
                name + "/part_" + std::to_string(index),
                parts[index],
                SliceInfo{name, result.full_shape, std::move(offset)}});
            row += parts[index].size(0);
        }
        return result;
    }

    /*
     * Collects the starting value of every parameter slice before training
     * reads it. Values are staged by set_initial_value() and written into the
     * model only by commit(), so a pass that throws half way leaves the model
     * untouched. A slice is assigned at most once per sink.
     */
    class InitialValueSink {
    public:
        void set_initial_value(const Variable& variable, const torch::Tensor& value) {
            Details::require_defined(variable);
            if (!value.defined() || value.sizes() != variable.value.sizes()) {
                std::ostringstream message;
                message << "Initial value for '" << variable.name << "' has shape "
                        << (value.defined() ? Details::format_shape(value.sizes().vec()) : std::string{"<undefined>"})
                        << " but the parameter has shape " << Details::format_shape(variable.value.sizes().vec()) << '.';
                throw ShapeMismatchError(message.str());
            }
            const void* key = variable.value.unsafeGetTensorImpl();
            if (!assigned_.insert(key).second) {
                throw std::logic_error("Parameter '" + variable.name + "' already received its initial value.");
            }
            staged_.emplace_back(variable.value, value.detach());
        }

        // Writes every staged value into its parameter; returns how many.
        std::size_t commit() {
            torch::NoGradGuard guard;
            const auto written = staged_.size();
            for (auto& [target, value] : staged_) {
                target.copy_(value);
            }
            staged_.clear();
            return written;
        }

        [[nodiscard]] std::size_t assigned() const noexcept { return assigned_.size(); }
        [[nodiscard]] std::size_t staged() const noexcept { return staged_.size(); }

    private:
        std::unordered_set<const void*> assigned_{};
        std::vector<std::pair<torch::Tensor, torch::Tensor>> staged_{};
    };

    /*
     * Trainable parameters of a model, in registration order. Plain module
     * parameters enumerate as single variables; partitioned parameters
     * enumerate one variable per partition, like a flattened collection.
     */
    class Collection {
    public:
        Collection() = default;

        explicit Collection(const torch::nn::Module& module, const std::string& prefix = {}) {
            add(module, prefix);
        }

        void add(const torch::nn::Module& module, const std::string& prefix = {}) {
            for (const auto& item : module.named_parameters(/*recurse=*/true)) {
                if (!item.value().requires_grad()) {
                    continue;
                }
                add(Variable{prefix + item.key(), item.value(), std::nullopt});
            }
        }

        void add(Variable variable) {
            Details::require_defined(variable);
            variables_.push_back(std::move(variable));
        }

        void add(const PartitionedVariable& partitioned) {
            [[maybe_unused]] const auto checked = resolve(Handle{partitioned});
            for (const auto& partition : partitioned.partitions) {
                variables_.push_back(partition);
            }
        }

        [[nodiscard]] std::vector<Handle> enumerate(const Selection::Selector& selector) const {
            const Selection::Matcher matcher(selector);
            std::vector<Handle> handles;
            for (const auto& variable : variables_) {
                if (matcher.matches(variable.name)) {
                    handles.emplace_back(variable);
                }
            }
            return handles;
        }

        // Logical names, first occurrence order.
        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> result;
            std::unordered_set<std::string> seen;
            for (const auto& variable : variables_) {
                auto name = logical_name(variable);
                if (seen.insert(name).second) {
                    result.push_back(std::move(name));
                }
            }
            return result;
        }

        [[nodiscard]] bool contains(const std::string& name) const {
            for (const auto& variable : variables_) {
                if (logical_name(variable) == name) {
                    return true;
                }
            }
            return false;
        }

        // Every slice of `name`, enumerated regardless of any selector.
        [[nodiscard]] std::vector<Variable> slices_of(const std::string& name) const {
            std::vector<Variable> result;
            for (const auto& variable : variables_) {
                if (logical_name(variable) == name) {
                    result.push_back(variable);
                }
            }
            return result;
        }

        // Full tensors keyed by logical name; partitions are stitched back together.
        [[nodiscard]] std::vector<std::pair<std::string, torch::Tensor>> logical_tensors() const {
            std::vector<std::pair<std::string, torch::Tensor>> result;
            for (const auto& name : names()) {
                const auto parameter = resolve(Handle{slices_of(name)});
                torch::NoGradGuard guard;
                if (!parameter.partitioned()) {
                    result.emplace_back(name, parameter.slices.front().variable.value.detach().clone());
                    continue;
                }
                auto full = torch::zeros(parameter.full_shape, parameter.slices.front().variable.value.options());
                for (const auto& slice : parameter.slices) {
                    auto view = full;
                    for (std::size_t dim = 0; dim < slice.offset.size(); ++dim) {
                        view = view.narrow(static_cast<std::int64_t>(dim), slice.offset[dim], slice.shape[dim]);
                    }
                    view.copy_(slice.variable.value.detach());
                }
                result.emplace_back(name, full);
            }
            return result;
        }

    private:
        std::vector<Variable> variables_{};
    };
}

#endif // KINDLE_VARIABLE_HPP
