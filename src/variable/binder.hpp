#ifndef KINDLE_VARIABLE_BINDER_HPP
#define KINDLE_VARIABLE_BINDER_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../checkpoint/checkpoint.hpp"
#include "../common/errors.hpp"
#include "../initialization/initialization.hpp"
#include "../remap/materialize.hpp"
#include "../remap/remap.hpp"
#include "variable.hpp"

namespace Kindle::Parameter {
    // Row plan of a vocabulary-backed parameter plus the values for rows
    // that have no source.
    struct RowRemapping {
        Remap::Plan plan{};
        Initialization::BackupFn backup{};
    };

    /*
     * Assigns the initial value of every slice of a parameter from one
     * checkpoint tensor, either restored as is or stitched row by row.
     */
    class Binder {
    public:
        Binder(const Checkpoint::Reader& reader, InitialValueSink& sink) : reader_(&reader), sink_(&sink) {}

        LogicalParameter bind(const Handle& handle,
                              const std::string& tensor_name,
                              const std::optional<RowRemapping>& remapping = std::nullopt) const {
            auto parameter = resolve(handle);
            bind(parameter, tensor_name, remapping);
            return parameter;
        }

        void bind(const LogicalParameter& parameter,
                  const std::string& tensor_name,
                  const std::optional<RowRemapping>& remapping = std::nullopt) const {
            if (!remapping) {
                Checkpoint::Restorer(*reader_, *sink_).restore_exact(parameter, tensor_name);
                return;
            }
            bind_remapped(parameter, tensor_name, *remapping);
        }

    private:
        void bind_remapped(const LogicalParameter& parameter,
                           const std::string& tensor_name,
                           const RowRemapping& remapping) const {
            if (parameter.full_shape.size() != 2) {
                throw ShapeMismatchError("Vocabulary remapping needs a two-dimensional parameter, but '" + parameter.name
                                         + "' has shape " + Details::format_shape(parameter.full_shape) + ".");
            }
            if (remapping.plan.size() != parameter.full_shape[0]) {
                std::ostringstream message;
                message << "Parameter '" << parameter.name << "' has " << parameter.full_shape[0]
                        << " rows but its vocabulary with OOV buckets covers " << remapping.plan.size() << '.';
                throw ShapeMismatchError(message.str());
            }

            const auto column_count = parameter.full_shape[1];
            const Checkpoint::TensorRowReader old_rows(*reader_, tensor_name);
            for (const auto& slice : parameter.slices) {
                if (slice.offset[1] != 0 || slice.shape[1] != column_count) {
                    throw ShapeMismatchError("Slice '" + slice.variable.name + "' of '" + parameter.name
                                             + "' does not span every column; only row partitions can be remapped.");
                }
                const Remap::Window window{slice.row_begin(), slice.row_end()};
                auto block = Remap::materialize(remapping.plan, old_rows, column_count, remapping.backup, window);
                sink_->set_initial_value(slice.variable, block);
            }
        }

        const Checkpoint::Reader* reader_;
        InitialValueSink* sink_;
    };
}

#endif // KINDLE_VARIABLE_BINDER_HPP
