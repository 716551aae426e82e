#ifndef KINDLE_REMAP_MATERIALIZE_HPP
#define KINDLE_REMAP_MATERIALIZE_HPP
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../initialization/initialization.hpp"
#include "remap.hpp"

namespace Kindle::Remap {
    // Row range [begin, end) of a plan owned by one partition.
    struct Window {
        std::int64_t begin{0};
        std::int64_t end{0};

        [[nodiscard]] std::int64_t rows() const noexcept { return end - begin; }
    };

    /*
     * Anything the initializer can pull old rows from:
     *   shape()      -> full shape of the old matrix
     *   dtype()      -> scalar type of the old matrix
     *   rows(index)  -> rows of the old matrix at the int64 positions in index
     */
    template <class Reader>
    concept RowReader = requires(const Reader& reader, const torch::Tensor& index) {
        { reader.shape() } -> std::convertible_to<std::vector<std::int64_t>>;
        { reader.dtype() } -> std::convertible_to<torch::ScalarType>;
        { reader.rows(index) } -> std::convertible_to<torch::Tensor>;
    };

    // In-memory old matrix.
    class TensorRows {
    public:
        explicit TensorRows(torch::Tensor matrix) : matrix_(std::move(matrix)) {}

        [[nodiscard]] std::vector<std::int64_t> shape() const { return matrix_.sizes().vec(); }
        [[nodiscard]] torch::ScalarType dtype() const { return matrix_.scalar_type(); }
        [[nodiscard]] torch::Tensor rows(const torch::Tensor& index) const { return matrix_.index_select(0, index); }

    private:
        torch::Tensor matrix_;
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

        inline torch::Tensor index_tensor(const std::vector<std::int64_t>& values) {
            return torch::tensor(values, torch::TensorOptions().dtype(torch::kLong));
        }

        inline torch::Tensor backup_block(const Initialization::BackupFn& backup,
                                          const std::vector<std::int64_t>& shape,
                                          torch::ScalarType dtype) {
            if (!backup) {
                return torch::zeros(shape, torch::TensorOptions().dtype(dtype));
            }
            auto values = backup(shape);
            if (!values.defined() || values.sizes().vec() != shape) {
                std::ostringstream message;
                message << "Backup initializer returned shape "
                        << (values.defined() ? format_shape(values.sizes().vec()) : std::string{"<undefined>"})
                        << " but " << format_shape(shape) << " was requested.";
                throw ShapeMismatchError(message.str());
            }
            return values.to(dtype);
        }

        // Rebuilds the columns of already gathered rows using the column plan.
        inline torch::Tensor stitch_columns(const torch::Tensor& gathered,
                                            const Plan& column_plan,
                                            const Initialization::BackupFn& backup) {
            const auto row_count = gathered.size(0);
            const auto old_columns = gathered.size(1);
            auto stitched = torch::zeros({row_count, column_plan.size()}, gathered.options());

            std::vector<std::int64_t> copied_local;
            std::vector<std::int64_t> copied_source;
            std::vector<std::int64_t> missing_local;
            for (std::int64_t column = 0; column < column_plan.size(); ++column) {
                const auto source = column_plan.source(column);
                if (source == kNoSource) {
                    missing_local.push_back(column);
                    continue;
                }
                if (source >= old_columns) {
                    std::ostringstream message;
                    message << "Column plan refers to old column " << source << " but the old matrix has "
                            << old_columns << " columns.";
                    throw ShapeMismatchError(message.str());
                }
                copied_local.push_back(column);
                copied_source.push_back(source);
            }

            if (!copied_local.empty()) {
                stitched.index_copy_(1, index_tensor(copied_local),
                                     gathered.index_select(1, index_tensor(copied_source)));
            }
            if (!missing_local.empty() && row_count > 0) {
                const std::vector<std::int64_t> shape{row_count, static_cast<std::int64_t>(missing_local.size())};
                stitched.index_copy_(1, index_tensor(missing_local),
                                     backup_block(backup, shape, gathered.scalar_type()));
            }
            return stitched;
        }
    }

    /*
     * Builds the rows [window.begin, window.end) of the new matrix.
     * Copied rows are gathered from the reader in one call; only those rows
     * are requested. Rows without a source take the backup initializer, which
     * is called once per window with shape {missing_rows, column_count} and
     * consumed in plan order. No backup means zeros.
     *
     * When the old column count differs from column_count a column plan is
     * required; the gathered rows are then stitched column-wise by the same
     * token rule.
     */
    template <RowReader Reader>
    [[nodiscard]] torch::Tensor materialize(const Plan& row_plan,
                                            const Reader& reader,
                                            std::int64_t column_count,
                                            const Initialization::BackupFn& backup,
                                            Window window,
                                            const std::optional<Plan>& column_plan = std::nullopt)
    {
        if (window.begin < 0 || window.end < window.begin || window.end > row_plan.size()) {
            std::ostringstream message;
            message << "Partition window [" << window.begin << ", " << window.end
                    << ") lies outside the remap plan of " << row_plan.size() << " rows.";
            throw ShapeMismatchError(message.str());
        }
        if (column_count <= 0) {
            std::ostringstream message;
            message << "Column count must be positive, got " << column_count << '.';
            throw ShapeMismatchError(message.str());
        }

        const auto old_shape = reader.shape();
        if (old_shape.size() != 2) {
            throw ShapeMismatchError("Old matrix must be two-dimensional, got shape " + Details::format_shape(old_shape) + ".");
        }
        if (column_plan) {
            if (column_plan->size() != column_count) {
                std::ostringstream message;
                message << "Column plan covers " << column_plan->size() << " columns but " << column_count
                        << " were declared.";
                throw ShapeMismatchError(message.str());
            }
        } else if (old_shape[1] != column_count) {
            std::ostringstream message;
            message << "Old matrix has " << old_shape[1] << " columns but the new matrix declares " << column_count
                    << "; a column remapping is required.";
            throw ShapeMismatchError(message.str());
        }

        std::vector<std::int64_t> copied_local;
        std::vector<std::int64_t> copied_source;
        std::vector<std::int64_t> missing_local;
        for (std::int64_t row = window.begin; row < window.end; ++row) {
            const auto source = row_plan.source(row);
            if (source == kNoSource) {
                missing_local.push_back(row - window.begin);
                continue;
            }
            if (source >= old_shape[0]) {
                std::ostringstream message;
                message << "Remap plan refers to old row " << source << " but the old matrix has " << old_shape[0]
                        << " rows.";
                throw ShapeMismatchError(message.str());
            }
            copied_local.push_back(row - window.begin);
            copied_source.push_back(source);
        }

        const auto dtype = reader.dtype();
        auto block = torch::zeros({window.rows(), column_count}, torch::TensorOptions().dtype(dtype));

        if (!copied_local.empty()) {
            auto gathered = reader.rows(Details::index_tensor(copied_source));
            if (column_plan) {
                gathered = Details::stitch_columns(gathered, *column_plan, backup);
            }
            block.index_copy_(0, Details::index_tensor(copied_local), gathered.to(dtype));
        }
        if (!missing_local.empty()) {
            const std::vector<std::int64_t> shape{static_cast<std::int64_t>(missing_local.size()), column_count};
            block.index_copy_(0, Details::index_tensor(missing_local), Details::backup_block(backup, shape, dtype));
        }
        return block;
    }

    template <RowReader Reader>
    [[nodiscard]] torch::Tensor materialize(const Plan& row_plan,
                                            const Reader& reader,
                                            std::int64_t column_count,
                                            const Initialization::BackupFn& backup = {},
                                            const std::optional<Plan>& column_plan = std::nullopt)
    {
        return materialize(row_plan, reader, column_count, backup, Window{0, row_plan.size()}, column_plan);
    }
}

#endif // KINDLE_REMAP_MATERIALIZE_HPP
