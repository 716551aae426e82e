#ifndef KINDLE_CHECKPOINT_HPP
#define KINDLE_CHECKPOINT_HPP
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../variable/variable.hpp"

namespace Kindle::Checkpoint {
    inline constexpr const char* kManifestFile = "checkpoint.json";
    inline constexpr const char* kDefaultArchive = "parameters.binary";

    namespace Details {
        namespace fs = std::filesystem;

        // "encoder.embedding.weight" -> {"encoder", "embedding", "weight"}
        inline std::vector<std::string> split_name(const std::string& name) {
            std::vector<std::string> parts;
            std::string current;
            for (const char character : name) {
                if (character == '.') {
                    parts.push_back(std::move(current));
                    current.clear();
                } else {
                    current.push_back(character);
                }
            }
            parts.push_back(std::move(current));
            for (const auto& part : parts) {
                if (part.empty()) {
                    throw ConfigurationError("Tensor name '" + name + "' has an empty path component.");
                }
            }
            return parts;
        }

        // Nested layout used by torch::nn::Module::save: one sub-archive per
        // module path component, tensors at the leaves.
        struct ArchiveNode {
            std::map<std::string, torch::Tensor> tensors{};
            std::map<std::string, ArchiveNode> children{};
        };

        inline void write_node(const ArchiveNode& node, torch::serialize::OutputArchive& archive) {
            for (const auto& [key, tensor] : node.tensors) {
                archive.write(key, tensor);
            }
            for (const auto& [key, child] : node.children) {
                torch::serialize::OutputArchive child_archive(archive.compilation_unit());
                write_node(child, child_archive);
                archive.write(key, child_archive);
            }
        }

        inline fs::path resolve_manifest(const fs::path& directory) {
            const auto manifest = directory / kManifestFile;
            boost::property_tree::ptree tree;
            try {
                boost::property_tree::read_json(manifest.string(), tree);
            } catch (const boost::property_tree::json_parser_error& error) {
                throw NotFoundError("Failed to read checkpoint manifest '" + manifest.string() + "': " + error.what());
            }
            const auto latest = tree.get_optional<std::string>("latest");
            if (!latest || latest->empty()) {
                throw NotFoundError("Checkpoint manifest '" + manifest.string() + "' has no 'latest' entry.");
            }
            fs::path archive(*latest);
            if (archive.is_relative()) {
                archive = directory / archive;
            }
            return archive;
        }
    }

    /*
     * Resolves a checkpoint source to a concrete archive file. A file is taken
     * as is. A directory resolves through its checkpoint.json manifest when
     * present, and to parameters.binary otherwise.
     */
    [[nodiscard]] inline std::filesystem::path resolve(const std::filesystem::path& source)
    {
        namespace fs = std::filesystem;
        if (source.empty()) {
            throw NotFoundError("Checkpoint source is empty.");
        }

        std::error_code error;
        if (fs::is_regular_file(source, error)) {
            return source;
        }
        if (!fs::is_directory(source, error)) {
            throw NotFoundError("Checkpoint not found at '" + source.string() + "'.");
        }

        fs::path archive;
        if (fs::exists(source / kManifestFile, error)) {
            archive = Details::resolve_manifest(source);
        } else {
            archive = source / kDefaultArchive;
        }
        if (!fs::is_regular_file(archive, error)) {
            throw NotFoundError("No checkpoint archive in '" + source.string() + "' (looked for '" + archive.string()
                                + "').");
        }
        return archive;
    }

    /*
     * Read handle over one checkpoint archive, scoped to a warm-start run.
     * Tensors are loaded on first use and kept until the reader is released.
     */
    class Reader {
    public:
        [[nodiscard]] static Reader open(const std::filesystem::path& source) {
            auto path = resolve(source);
            auto archive = std::make_unique<torch::serialize::InputArchive>();
            try {
                archive->load_from(path.string());
            } catch (const c10::Error& error) {
                throw NotFoundError("Failed to open checkpoint archive '" + path.string() + "': " + error.what_without_backtrace());
            }
            return Reader(std::move(path), std::move(archive));
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

        [[nodiscard]] bool has_tensor(const std::string& name) const {
            return lookup(name).defined();
        }

        [[nodiscard]] torch::Tensor read_tensor(const std::string& name) const {
            auto tensor = lookup(name);
            if (!tensor.defined()) {
                throw NotFoundError("Checkpoint '" + path_.string() + "' has no tensor named '" + name + "'.");
            }
            return tensor;
        }

        [[nodiscard]] std::vector<std::int64_t> read_tensor_shape(const std::string& name) const {
            return read_tensor(name).sizes().vec();
        }

        [[nodiscard]] torch::Tensor read_tensor_row(const std::string& name, std::int64_t row) const {
            auto tensor = read_tensor(name);
            if (tensor.dim() == 0 || row < 0 || row >= tensor.size(0)) {
                std::ostringstream message;
                message << "Row " << row << " is out of range for checkpoint tensor '" << name << "' of shape "
                        << Parameter::Details::format_shape(tensor.sizes().vec()) << '.';
                throw ShapeMismatchError(message.str());
            }
            return tensor.select(0, row);
        }

        [[nodiscard]] torch::Tensor read_tensor_rows(const std::string& name, const torch::Tensor& rows) const {
            return read_tensor(name).index_select(0, rows);
        }

        // Number of tensors loaded so far in this run.
        [[nodiscard]] std::size_t cached() const noexcept { return cache_.size(); }

    private:
        Reader(std::filesystem::path path, std::unique_ptr<torch::serialize::InputArchive> archive)
            : path_(std::move(path)), archive_(std::move(archive)) {}

        torch::Tensor lookup(const std::string& name) const {
            if (const auto it = cache_.find(name); it != cache_.end()) {
                return it->second;
            }

            const auto parts = Details::split_name(name);
            torch::Tensor tensor;
            try {
                torch::serialize::InputArchive* current = archive_.get();
                torch::serialize::InputArchive nested;
                for (std::size_t index = 0; index + 1 < parts.size(); ++index) {
                    torch::serialize::InputArchive child;
                    if (!current->try_read(parts[index], child)) {
                        return {};
                    }
                    nested = std::move(child);
                    current = &nested;
                }
                if (!current->try_read(parts.back(), tensor) || !tensor.defined()) {
                    return {};
                }
            } catch (const c10::Error& error) {
                throw NotFoundError("Failed to read tensor '" + name + "' from checkpoint '" + path_.string()
                                    + "': " + error.what_without_backtrace());
            }

            tensor = tensor.detach();
            cache_.emplace(name, tensor);
            return tensor;
        }

        std::filesystem::path path_;
        std::unique_ptr<torch::serialize::InputArchive> archive_;
        mutable std::unordered_map<std::string, torch::Tensor> cache_{};
    };

    // Old matrix rows of one checkpoint tensor, read through a run's Reader.
    class TensorRowReader {
    public:
        TensorRowReader(const Reader& reader, std::string tensor_name)
            : reader_(&reader), tensor_name_(std::move(tensor_name)) {}

        [[nodiscard]] std::vector<std::int64_t> shape() const { return reader_->read_tensor_shape(tensor_name_); }
        [[nodiscard]] torch::ScalarType dtype() const { return reader_->read_tensor(tensor_name_).scalar_type(); }
        [[nodiscard]] torch::Tensor rows(const torch::Tensor& index) const {
            return reader_->read_tensor_rows(tensor_name_, index);
        }

    private:
        const Reader* reader_;
        std::string tensor_name_;
    };

    /*
     * Plain whole-tensor restore. The stored tensor must have exactly the
     * logical shape of the parameter; each slice receives its own window.
     */
    class Restorer {
    public:
        Restorer(const Reader& reader, Parameter::InitialValueSink& sink) : reader_(&reader), sink_(&sink) {}

        void restore_exact(const Parameter::Handle& handle, const std::string& tensor_name) const {
            restore_exact(Parameter::resolve(handle), tensor_name);
        }

        void restore_exact(const Parameter::LogicalParameter& parameter, const std::string& tensor_name) const {
            const auto stored = reader_->read_tensor(tensor_name);
            if (stored.sizes().vec() != parameter.full_shape) {
                std::ostringstream message;
                message << "Parameter '" << parameter.name << "' has shape "
                        << Parameter::Details::format_shape(parameter.full_shape) << " but checkpoint tensor '"
                        << tensor_name << "' has shape " << Parameter::Details::format_shape(stored.sizes().vec())
                        << '.';
                throw ShapeMismatchError(message.str());
            }
            for (const auto& slice : parameter.slices) {
                auto window = stored;
                for (std::size_t dim = 0; dim < slice.offset.size(); ++dim) {
                    window = window.narrow(static_cast<std::int64_t>(dim), slice.offset[dim], slice.shape[dim]);
                }
                sink_->set_initial_value(slice.variable, window);
            }
        }

    private:
        const Reader* reader_;
        Parameter::InitialValueSink* sink_;
    };

    /*
     * Writes tensors keyed by dotted names to `target`. A directory target
     * receives parameters.binary (or `archive_name`) and a checkpoint.json
     * manifest pointing at it; any other target is written as the archive.
     */
    inline std::filesystem::path save(const std::filesystem::path& target,
                                      const std::vector<std::pair<std::string, torch::Tensor>>& tensors,
                                      const std::string& archive_name = kDefaultArchive)
    {
        namespace fs = std::filesystem;
        if (target.empty()) {
            throw ConfigurationError("Checkpoint::save requires a non-empty target path.");
        }

        Details::ArchiveNode root;
        for (const auto& [name, tensor] : tensors) {
            if (!tensor.defined()) {
                throw UnsupportedParameterTypeError("Cannot save undefined tensor '" + name + "'.");
            }
            const auto parts = Details::split_name(name);
            auto* node = &root;
            for (std::size_t index = 0; index + 1 < parts.size(); ++index) {
                node = &node->children[parts[index]];
            }
            node->tensors[parts.back()] = tensor.detach().cpu();
        }

        std::error_code error;
        const bool directory_target = fs::is_directory(target, error) || !target.has_extension();
        const auto archive_path = directory_target ? target / archive_name : target;
        if (archive_path.has_parent_path()) {
            fs::create_directories(archive_path.parent_path());
        }

        torch::serialize::OutputArchive archive;
        Details::write_node(root, archive);
        try {
            archive.save_to(archive_path.string());
        } catch (const c10::Error& error_value) {
            throw std::runtime_error("Failed to write checkpoint archive '" + archive_path.string() + "': "
                                     + error_value.what_without_backtrace());
        }

        if (directory_target) {
            boost::property_tree::ptree manifest;
            manifest.put("latest", archive_name);
            try {
                boost::property_tree::write_json((target / kManifestFile).string(), manifest);
            } catch (const boost::property_tree::json_parser_error& error_value) {
                throw std::runtime_error("Failed to write checkpoint manifest in '" + target.string() + "': "
                                         + error_value.what());
            }
        }
        return archive_path;
    }

    inline std::filesystem::path save(const std::filesystem::path& target,
                                      const Parameter::Collection& collection,
                                      const std::string& archive_name = kDefaultArchive)
    {
        return save(target, collection.logical_tensors(), archive_name);
    }
}

#endif // KINDLE_CHECKPOINT_HPP
