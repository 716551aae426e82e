#ifndef KINDLE_CORE_HPP
#define KINDLE_CORE_HPP
/*
 * Warm-start orchestrator.
 * ---------------------------------------------------------------------------
 *  - Enumerate the trainable parameters picked by the selector and group the
 *    partition slices back into logical parameters.
 *  - Parameters listed with a vocabulary are always warm-started by row
 *    remapping, whatever the selector says.
 *  - Every other selected parameter is restored as is, unless the selector is
 *    None, in which case it keeps its current value.
 *  - One checkpoint reader is opened per run and released when it returns.
 *  - A parameter's log line is written before it is touched, so a failure is
 *    attributable from the log tail.
 *  - All or nothing: values are staged and written into the model only after
 *    every parameter succeeded. Any error aborts the pass with the model
 *    unchanged.
 */

#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "checkpoint/checkpoint.hpp"
#include "common/errors.hpp"
#include "common/selector.hpp"
#include "common/settings.hpp"
#include "initialization/apply.hpp"
#include "initialization/initialization.hpp"
#include "remap/remap.hpp"
#include "utils/log.hpp"
#include "variable/binder.hpp"
#include "variable/variable.hpp"
#include "vocabulary/vocabulary.hpp"

namespace Kindle {
    struct WarmStartOptions {
        Utils::Log::Sink log{};
    };

    struct WarmStartReport {
        std::vector<std::string> restored{};
        std::vector<std::string> remapped{};
        std::vector<std::string> skipped{};

        [[nodiscard]] std::size_t warm_started() const noexcept { return restored.size() + remapped.size(); }
    };

    namespace Core::Details {
        struct Group {
            std::string name{};
            std::vector<Parameter::Variable> variables{};
        };

        // Keeps first-seen order so runs are reproducible.
        inline std::vector<Group> group_by_logical_name(const std::vector<Parameter::Handle>& handles) {
            std::vector<Group> groups;
            std::unordered_map<std::string, std::size_t> positions;
            for (const auto& handle : handles) {
                const auto parameter = Parameter::resolve(handle);
                auto [it, inserted] = positions.emplace(parameter.name, groups.size());
                if (inserted) {
                    groups.push_back(Group{parameter.name, {}});
                }
                for (const auto& slice : parameter.slices) {
                    groups[it->second].variables.push_back(slice.variable);
                }
            }
            return groups;
        }

        inline Parameter::Handle to_handle(const Group& group) {
            if (group.variables.size() == 1 && !group.variables.front().slice) {
                return group.variables.front();
            }
            return group.variables;
        }

        template <class Map>
        inline void require_known(const Map& entries, const Parameter::Collection& collection, const char* what) {
            std::ostringstream unknown;
            bool any = false;
            for (const auto& entry : entries) {
                if (collection.contains(entry.first)) {
                    continue;
                }
                unknown << (any ? ", " : "") << '\'' << entry.first << '\'';
                any = true;
            }
            if (any) {
                throw ConfigurationError(std::string(what) + " names parameters that are not trainable in this model: "
                                         + unknown.str() + ".");
            }
        }

        inline std::string describe_old_size(std::int64_t old_vocab_size) {
            return old_vocab_size > 0 ? std::to_string(old_vocab_size) : std::string{"All"};
        }

        inline Parameter::RowRemapping build_remapping(const Settings::VocabInfo& info) {
            const auto old_index = Vocabulary::load(info.old_vocab, info.old_vocab_size);
            const auto new_index = Vocabulary::load(info.new_vocab, info.new_vocab_size);
            return Parameter::RowRemapping{
                Remap::build_plan(old_index, new_index, info.new_vocab_size, info.num_oov_buckets),
                Initialization::make_backup(info.backup.value_or(Initialization::Zeros()))};
        }
    }

    /*
     * Warm-starts the trainable parameters of `collection` from the checkpoint
     * named in `settings`. All or nothing: the first error propagates before
     * any parameter is written.
     */
    inline WarmStartReport warm_start(const Settings::WarmStartSettings& settings,
                                      const Parameter::Collection& collection,
                                      const WarmStartOptions& options = {})
    {
        Settings::validate(settings);
        Core::Details::require_known(settings.vocab_info_by_variable, collection, "Vocabulary info");
        Core::Details::require_known(settings.prev_name_by_variable, collection, "Previous variable names");

        const auto& log = options.log;
        const bool select_none = settings.selector.mode == Selection::Mode::None;
        if (select_none && settings.vocab_info_by_variable.empty()) {
            Utils::Log::warn(log, "Warm-start selector is 'none' and no vocabulary is given; nothing will be warm-started.");
        }

        // A vocabulary parameter takes every slice, even when the selector only
        // matched some of its partitions or none at all.
        auto groups = Core::Details::group_by_logical_name(collection.enumerate(settings.selector));
        std::unordered_map<std::string, std::size_t> grouped;
        for (std::size_t index = 0; index < groups.size(); ++index) {
            grouped.emplace(groups[index].name, index);
        }
        for (const auto& [name, info] : settings.vocab_info_by_variable) {
            if (const auto it = grouped.find(name); it != grouped.end()) {
                groups[it->second].variables = collection.slices_of(name);
            } else {
                grouped.emplace(name, groups.size());
                groups.push_back(Core::Details::Group{name, collection.slices_of(name)});
            }
        }

        Utils::Log::info(log, "Warm-starting from '", settings.checkpoint.string(), "' (selector: ",
                         Selection::to_string(settings.selector), ").");

        const auto reader = Checkpoint::Reader::open(settings.checkpoint);
        Parameter::InitialValueSink sink;
        const Parameter::Binder binder(reader, sink);

        WarmStartReport report;
        std::unordered_set<std::string> handled;
        for (const auto& group : groups) {
            const auto prev_it = settings.prev_name_by_variable.find(group.name);
            const bool renamed = prev_it != settings.prev_name_by_variable.end();
            const auto& tensor_name = renamed ? prev_it->second : group.name;
            const auto vocab_it = settings.vocab_info_by_variable.find(group.name);

            if (vocab_it != settings.vocab_info_by_variable.end()) {
                const auto& info = vocab_it->second;
                Utils::Log::info(log, "Warm-starting variable: ", group.name,
                                 "; current_vocab: ", info.new_vocab.string(),
                                 " current_vocab_size: ", info.new_vocab_size,
                                 " prev_vocab: ", info.old_vocab.string(),
                                 " prev_vocab_size: ", Core::Details::describe_old_size(info.old_vocab_size),
                                 " current_oov: ", info.num_oov_buckets,
                                 " prev_tensor: ", renamed ? tensor_name : std::string{"Unchanged"},
                                 " initializer: ", Initialization::name(info.backup.value_or(Initialization::Zeros())));
                binder.bind(Core::Details::to_handle(group), tensor_name, Core::Details::build_remapping(info));
                report.remapped.push_back(group.name);
                handled.insert(group.name);
                continue;
            }

            if (select_none) {
                continue;
            }
            Utils::Log::info(log, "Warm-starting variable: ", group.name,
                             "; prev_var_name: ", renamed ? tensor_name : std::string{"Unchanged"});
            binder.bind(Core::Details::to_handle(group), tensor_name);
            report.restored.push_back(group.name);
            handled.insert(group.name);
        }

        sink.commit();

        for (const auto& name : collection.names()) {
            if (handled.count(name) == 0) {
                report.skipped.push_back(name);
            }
        }

        Utils::Log::done(log, "Warm-started ", report.warm_started(), " parameter(s): ", report.restored.size(),
                         " restored, ", report.remapped.size(), " remapped, ", report.skipped.size(), " left as is.");
        return report;
    }

    inline WarmStartReport warm_start(const Settings::WarmStartSettings& settings,
                                      const torch::nn::Module& module,
                                      const WarmStartOptions& options = {})
    {
        return warm_start(settings, Parameter::Collection(module), options);
    }
}

#endif // KINDLE_CORE_HPP
