#ifndef KINDLE_COMMON_SAVE_LOAD_HPP
#define KINDLE_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../initialization/initialization.hpp"
#include "errors.hpp"
#include "selector.hpp"
#include "settings.hpp"

namespace Kindle::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            std::optional<Numeric> value;
            try {
                if (const auto raw = tree.get_optional<Numeric>(key)) {
                    value = *raw;
                }
            } catch (const boost::property_tree::ptree_bad_data&) {
                value.reset();
            }
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        template <class Numeric>
        Numeric get_numeric_or(const PropertyTree& tree, const std::string& key, Numeric fallback,
                               const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                return fallback;
            }
            return get_numeric<Numeric>(tree, key, context);
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value || value->empty()) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        inline std::string initialization_type_to_string(Initialization::Type type)
        {
            switch (type) {
                case Initialization::Type::Zeros: return "zeros";
                case Initialization::Type::Constant: return "constant";
                case Initialization::Type::Normal: return "normal";
                case Initialization::Type::TruncatedNormal: return "truncated_normal";
                case Initialization::Type::Uniform: return "uniform";
                case Initialization::Type::XavierUniform: return "xavier_uniform";
                case Initialization::Type::XavierNormal: return "xavier_normal";
                case Initialization::Type::KaimingUniform: return "kaiming_uniform";
                case Initialization::Type::KaimingNormal: return "kaiming_normal";
                case Initialization::Type::Custom:
                default:
                    throw ConfigurationError("Custom backup initializers cannot be serialised.");
            }
        }

        inline Initialization::Type initialization_type_from_string(const std::string& value, const std::string& context)
        {
            const auto lowered = to_lower(value);
            if (lowered == "zeros") return Initialization::Type::Zeros;
            if (lowered == "constant") return Initialization::Type::Constant;
            if (lowered == "normal") return Initialization::Type::Normal;
            if (lowered == "truncated_normal") return Initialization::Type::TruncatedNormal;
            if (lowered == "uniform") return Initialization::Type::Uniform;
            if (lowered == "xavier_uniform") return Initialization::Type::XavierUniform;
            if (lowered == "xavier_normal") return Initialization::Type::XavierNormal;
            if (lowered == "kaiming_uniform") return Initialization::Type::KaimingUniform;
            if (lowered == "kaiming_normal") return Initialization::Type::KaimingNormal;
            std::ostringstream message;
            message << "Unknown backup initializer '" << value << "' in " << context;
            throw ConfigurationError(message.str());
        }
    }

    inline PropertyTree serialize_initialization(const Initialization::Descriptor& descriptor)
    {
        PropertyTree tree;
        tree.put("type", Detail::initialization_type_to_string(descriptor.type));
        switch (descriptor.type) {
            case Initialization::Type::Constant:
                tree.put("value", descriptor.value);
                break;
            case Initialization::Type::Normal:
            case Initialization::Type::TruncatedNormal:
                tree.put("mean", descriptor.mean);
                tree.put("std", descriptor.std);
                break;
            case Initialization::Type::Uniform:
                tree.put("low", descriptor.low);
                tree.put("high", descriptor.high);
                break;
            case Initialization::Type::XavierUniform:
            case Initialization::Type::XavierNormal:
                tree.put("gain", descriptor.gain);
                break;
            default:
                break;
        }
        return tree;
    }

    inline Initialization::Descriptor deserialize_initialization(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::initialization_type_from_string(Detail::get_string(tree, "type", context), context);
        switch (type) {
            case Initialization::Type::Constant:
                return Initialization::Constant(Detail::get_numeric<double>(tree, "value", context));
            case Initialization::Type::Normal:
                return Initialization::Normal(Detail::get_numeric_or<double>(tree, "mean", 0.0, context),
                                              Detail::get_numeric_or<double>(tree, "std", 1.0, context));
            case Initialization::Type::TruncatedNormal:
                return Initialization::TruncatedNormal(Detail::get_numeric_or<double>(tree, "mean", 0.0, context),
                                                       Detail::get_numeric_or<double>(tree, "std", 1.0, context));
            case Initialization::Type::Uniform:
                return Initialization::Uniform(Detail::get_numeric_or<double>(tree, "low", -0.05, context),
                                               Detail::get_numeric_or<double>(tree, "high", 0.05, context));
            case Initialization::Type::XavierUniform:
                return Initialization::XavierUniform(Detail::get_numeric_or<double>(tree, "gain", 1.0, context));
            case Initialization::Type::XavierNormal:
                return Initialization::XavierNormal(Detail::get_numeric_or<double>(tree, "gain", 1.0, context));
            case Initialization::Type::KaimingUniform:
                return Initialization::KaimingUniform();
            case Initialization::Type::KaimingNormal:
                return Initialization::KaimingNormal();
            case Initialization::Type::Zeros:
            default:
                return Initialization::Zeros();
        }
    }

    inline PropertyTree serialize_selector(const Selection::Selector& selector)
    {
        PropertyTree tree;
        switch (selector.mode) {
            case Selection::Mode::All: tree.put("mode", "all"); break;
            case Selection::Mode::None: tree.put("mode", "none"); break;
            case Selection::Mode::Pattern:
                tree.put("mode", "pattern");
                tree.put("pattern", selector.pattern);
                break;
        }
        return tree;
    }

    inline Selection::Selector deserialize_selector(const PropertyTree& tree, const std::string& context)
    {
        const auto mode = Detail::to_lower(Detail::get_string(tree, "mode", context));
        if (mode == "all") return Selection::All;
        if (mode == "none") return Selection::None;
        if (mode == "pattern") return Selection::Pattern(Detail::get_string(tree, "pattern", context));
        std::ostringstream message;
        message << "Unknown selector mode '" << mode << "' in " << context;
        throw ConfigurationError(message.str());
    }

    inline PropertyTree serialize_vocab_info(const std::string& variable, const Settings::VocabInfo& info)
    {
        PropertyTree tree;
        tree.put("variable", variable);
        tree.put("new_vocab", info.new_vocab.string());
        tree.put("new_vocab_size", info.new_vocab_size);
        tree.put("num_oov_buckets", info.num_oov_buckets);
        tree.put("old_vocab", info.old_vocab.string());
        tree.put("old_vocab_size", info.old_vocab_size);
        if (info.backup) {
            tree.add_child("backup", serialize_initialization(*info.backup));
        }
        return tree;
    }

    inline std::pair<std::string, Settings::VocabInfo> deserialize_vocab_info(const PropertyTree& tree,
                                                                              const std::string& context)
    {
        auto variable = Detail::get_string(tree, "variable", context);
        const auto entry_context = context + " '" + variable + "'";

        Settings::VocabInfo info;
        info.new_vocab = Detail::get_string(tree, "new_vocab", entry_context);
        info.new_vocab_size = Detail::get_numeric<std::int64_t>(tree, "new_vocab_size", entry_context);
        info.num_oov_buckets = Detail::get_numeric_or<std::int64_t>(tree, "num_oov_buckets", 0, entry_context);
        info.old_vocab = Detail::get_string(tree, "old_vocab", entry_context);
        info.old_vocab_size = Detail::get_numeric_or<std::int64_t>(tree, "old_vocab_size", -1, entry_context);
        if (const auto backup = tree.get_child_optional("backup")) {
            info.backup = deserialize_initialization(*backup, entry_context + " backup");
        }
        Settings::validate(info, entry_context);
        return {std::move(variable), std::move(info)};
    }

    inline PropertyTree serialize_settings(const Settings::WarmStartSettings& settings)
    {
        PropertyTree tree;
        tree.put("checkpoint", settings.checkpoint.string());
        tree.add_child("selector", serialize_selector(settings.selector));

        PropertyTree vocabularies;
        for (const auto& [variable, info] : settings.vocab_info_by_variable) {
            vocabularies.push_back({"", serialize_vocab_info(variable, info)});
        }
        tree.add_child("vocabularies", vocabularies);

        PropertyTree previous;
        for (const auto& [variable, prev_name] : settings.prev_name_by_variable) {
            PropertyTree entry;
            entry.put("variable", variable);
            entry.put("previous", prev_name);
            previous.push_back({"", entry});
        }
        tree.add_child("previous_names", previous);
        return tree;
    }

    inline Settings::WarmStartSettings deserialize_settings(const PropertyTree& tree, const std::string& context)
    {
        Settings::WarmStartSettings settings;
        settings.checkpoint = tree.get<std::string>("checkpoint", "");
        if (const auto selector = tree.get_child_optional("selector")) {
            settings.selector = deserialize_selector(*selector, context + " selector");
        }
        if (const auto vocabularies = tree.get_child_optional("vocabularies")) {
            for (const auto& node : *vocabularies) {
                auto [variable, info] = deserialize_vocab_info(node.second, context + " vocabulary");
                if (!settings.vocab_info_by_variable.emplace(variable, std::move(info)).second) {
                    throw ConfigurationError("Duplicate vocabulary entry for '" + variable + "' in " + context);
                }
            }
        }
        if (const auto previous = tree.get_child_optional("previous_names")) {
            for (const auto& node : *previous) {
                auto variable = Detail::get_string(node.second, "variable", context + " previous_names");
                auto prev_name = Detail::get_string(node.second, "previous", context + " previous_names");
                if (!settings.prev_name_by_variable.emplace(variable, std::move(prev_name)).second) {
                    throw ConfigurationError("Duplicate previous name for '" + variable + "' in " + context);
                }
            }
        }
        Settings::validate(settings);
        return settings;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        std::error_code error;
        if (!std::filesystem::is_regular_file(path, error)) {
            throw NotFoundError("Settings file not found at '" + path.string() + "'.");
        }
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error_value) {
            throw ConfigurationError("Malformed settings file '" + path.string() + "': " + error_value.what());
        }
        return tree;
    }

    inline void write_settings(const std::filesystem::path& path, const Settings::WarmStartSettings& settings)
    {
        write_json_file(path, serialize_settings(settings));
    }

    inline Settings::WarmStartSettings read_settings(const std::filesystem::path& path)
    {
        return deserialize_settings(read_json_file(path), "settings '" + path.string() + "'");
    }
}
#endif // KINDLE_COMMON_SAVE_LOAD_HPP
