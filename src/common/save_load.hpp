#ifndef PTAH_COMMON_SAVE_LOAD_HPP
#define PTAH_COMMON_SAVE_LOAD_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <variant>
#include <vector>

#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../initialization/initialization.hpp"

namespace Ptah::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;
    using Descriptor = Initialization::Descriptor;

    // A name or class name the registry has no factory for.
    class UnresolvedIdentifier : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    namespace Detail {
        using Initialization::Details::to_lower;

        inline void require_known_keys(const PropertyTree& config,
                                       std::initializer_list<std::string_view> known,
                                       const std::string& context)
        {
            for (const auto& [key, value] : config) {
                bool found = false;
                for (const auto candidate : known) {
                    if (key == candidate) {
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    std::ostringstream message;
                    message << "Unknown config key '" << key << "' for " << context;
                    throw std::invalid_argument(message.str());
                }
            }
        }

        // get_config writes infinities and NaN as the stream spells them ("inf", "-inf", "nan"),
        // which the ptree translator does not read back.
        template <class Value>
        boost::optional<Value> parse_non_finite(const std::string& data)
        {
            const auto lowered = to_lower(data);
            const bool negative = !lowered.empty() && lowered.front() == '-';
            const std::string_view magnitude = std::string_view(lowered).substr(
                !lowered.empty() && (lowered.front() == '-' || lowered.front() == '+') ? 1 : 0);
            if (magnitude == "inf" || magnitude == "infinity") {
                return negative ? -std::numeric_limits<Value>::infinity() : std::numeric_limits<Value>::infinity();
            }
            if (magnitude == "nan") {
                return std::numeric_limits<Value>::quiet_NaN();
            }
            return boost::none;
        }

        template <class Value>
        Value get_or(const PropertyTree& config, const std::string& key, Value fallback, const std::string& context)
        {
            const auto child = config.get_child_optional(key);
            if (!child) {
                return fallback;
            }
            auto value = child->get_value_optional<Value>();
            if constexpr (std::is_floating_point_v<Value>) {
                if (!value) {
                    value = parse_non_finite<Value>(child->data());
                }
            }
            if (!value) {
                std::ostringstream message;
                message << "Invalid value '" << child->data() << "' for config key '" << key << "' in " << context;
                throw std::invalid_argument(message.str());
            }
            return *value;
        }

        // JSON null is read back as the string "null".
        inline Initialization::Seed get_seed(const PropertyTree& config, const std::string& context)
        {
            const auto child = config.get_child_optional("seed");
            if (!child || child->data().empty() || to_lower(child->data()) == "null") {
                return std::nullopt;
            }
            // The stream translator wraps "-1" to 2^64 - 1 instead of failing.
            const auto first = child->data().find_first_not_of(" \t\r\n");
            const bool negative = first != std::string::npos && child->data()[first] == '-';
            boost::optional<std::uint64_t> value;
            if (!negative) {
                value = child->get_value_optional<std::uint64_t>();
            }
            if (!value) {
                std::ostringstream message;
                message << "Invalid seed '" << child->data() << "' in " << context;
                throw std::invalid_argument(message.str());
            }
            return *value;
        }

        inline void put_seed(PropertyTree& config, const Initialization::Seed& seed)
        {
            if (seed.has_value()) {
                config.put("seed", *seed);
            }
        }

        inline Descriptor build_zeros(const PropertyTree& config)
        {
            require_known_keys(config, {}, "Zeros");
            return Initialization::Zeros();
        }

        inline Descriptor build_ones(const PropertyTree& config)
        {
            require_known_keys(config, {}, "Ones");
            return Initialization::Ones();
        }

        inline Descriptor build_constant(const PropertyTree& config)
        {
            require_known_keys(config, {"value"}, "Constant");
            Initialization::ConstantOptions options{};
            options.value = get_or(config, "value", options.value, "Constant");
            return Initialization::Constant(options);
        }

        inline Descriptor build_random_normal(const PropertyTree& config)
        {
            require_known_keys(config, {"mean", "stddev", "seed"}, "RandomNormal");
            Initialization::RandomNormalOptions options{};
            options.mean = get_or(config, "mean", options.mean, "RandomNormal");
            options.stddev = get_or(config, "stddev", options.stddev, "RandomNormal");
            options.seed = get_seed(config, "RandomNormal");
            return Initialization::RandomNormal(options);
        }

        inline Descriptor build_random_uniform(const PropertyTree& config)
        {
            require_known_keys(config, {"minval", "maxval", "seed"}, "RandomUniform");
            Initialization::RandomUniformOptions options{};
            options.minval = get_or(config, "minval", options.minval, "RandomUniform");
            options.maxval = get_or(config, "maxval", options.maxval, "RandomUniform");
            options.seed = get_seed(config, "RandomUniform");
            return Initialization::RandomUniform(options);
        }

        inline Descriptor build_truncated_normal(const PropertyTree& config)
        {
            require_known_keys(config, {"mean", "stddev", "seed"}, "TruncatedNormal");
            Initialization::TruncatedNormalOptions options{};
            options.mean = get_or(config, "mean", options.mean, "TruncatedNormal");
            options.stddev = get_or(config, "stddev", options.stddev, "TruncatedNormal");
            options.seed = get_seed(config, "TruncatedNormal");
            return Initialization::TruncatedNormal(options);
        }

        inline Descriptor build_variance_scaling(const PropertyTree& config)
        {
            require_known_keys(config, {"scale", "mode", "distribution", "seed"}, "VarianceScaling");
            const Initialization::VarianceScalingOptions defaults{};
            return Initialization::VarianceScaling(
                get_or(config, "scale", defaults.scale, "VarianceScaling"),
                get_or(config, "mode", Initialization::Details::to_string(defaults.mode), "VarianceScaling"),
                get_or(config, "distribution", Initialization::Details::to_string(defaults.distribution), "VarianceScaling"),
                get_seed(config, "VarianceScaling"));
        }

        inline Descriptor build_orthogonal(const PropertyTree& config)
        {
            require_known_keys(config, {"gain", "seed"}, "Orthogonal");
            Initialization::OrthogonalOptions options{};
            options.gain = get_or(config, "gain", options.gain, "Orthogonal");
            options.seed = get_seed(config, "Orthogonal");
            return Initialization::Orthogonal(options);
        }

        inline Descriptor build_convolution_aware(const PropertyTree& config)
        {
            require_known_keys(config, {"eps_std", "seed"}, "ConvolutionAware");
            Initialization::ConvolutionAwareOptions options{};
            options.eps_std = get_or(config, "eps_std", options.eps_std, "ConvolutionAware");
            options.seed = get_seed(config, "ConvolutionAware");
            return Initialization::ConvolutionAware(options);
        }

        inline Descriptor build_identity(const PropertyTree& config)
        {
            require_known_keys(config, {"gain"}, "Identity");
            Initialization::IdentityOptions options{};
            options.gain = get_or(config, "gain", options.gain, "Identity");
            return Initialization::Identity(options);
        }

        template <Initialization::VarianceScalingDescriptor (*Preset)(Initialization::Seed)>
        Descriptor build_preset(const PropertyTree& config)
        {
            require_known_keys(config, {"seed"}, "variance scaling preset");
            return Preset(get_seed(config, "variance scaling preset"));
        }

        using Factory = Descriptor (*)(const PropertyTree&);

        // Class names, their snake_case spellings and the historical short aliases.
        inline const std::unordered_map<std::string, Factory>& factories()
        {
            static const std::unordered_map<std::string, Factory> table{
                {"Zeros", &build_zeros},
                {"zeros", &build_zeros},
                {"zero", &build_zeros},
                {"Ones", &build_ones},
                {"ones", &build_ones},
                {"one", &build_ones},
                {"Constant", &build_constant},
                {"constant", &build_constant},
                {"RandomNormal", &build_random_normal},
                {"random_normal", &build_random_normal},
                {"normal", &build_random_normal},
                {"RandomUniform", &build_random_uniform},
                {"random_uniform", &build_random_uniform},
                {"uniform", &build_random_uniform},
                {"TruncatedNormal", &build_truncated_normal},
                {"truncated_normal", &build_truncated_normal},
                {"VarianceScaling", &build_variance_scaling},
                {"variance_scaling", &build_variance_scaling},
                {"Orthogonal", &build_orthogonal},
                {"orthogonal", &build_orthogonal},
                {"ConvolutionAware", &build_convolution_aware},
                {"convolution_aware", &build_convolution_aware},
                {"CAI", &build_convolution_aware},
                {"cai", &build_convolution_aware},
                {"Identity", &build_identity},
                {"identity", &build_identity},
                {"lecun_uniform", &build_preset<&Initialization::LecunUniform>},
                {"lecun_normal", &build_preset<&Initialization::LecunNormal>},
                {"glorot_normal", &build_preset<&Initialization::GlorotNormal>},
                {"glorot_uniform", &build_preset<&Initialization::GlorotUniform>},
                {"he_normal", &build_preset<&Initialization::HeNormal>},
                {"he_uniform", &build_preset<&Initialization::HeUniform>},
            };
            return table;
        }
    }

    [[nodiscard]] inline std::vector<std::string> registered_names()
    {
        std::vector<std::string> names;
        names.reserve(Detail::factories().size());
        for (const auto& [name, factory] : Detail::factories()) {
            names.push_back(name);
        }
        return names;
    }

    [[nodiscard]] inline PropertyTree get_config(const Descriptor& descriptor)
    {
        PropertyTree config;
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, Initialization::ConstantDescriptor>) {
                    config.put("value", concrete.options.value);
                } else if constexpr (std::is_same_v<DescriptorType, Initialization::RandomNormalDescriptor>
                                     || std::is_same_v<DescriptorType, Initialization::TruncatedNormalDescriptor>) {
                    config.put("mean", concrete.options.mean);
                    config.put("stddev", concrete.options.stddev);
                    Detail::put_seed(config, concrete.options.seed);
                } else if constexpr (std::is_same_v<DescriptorType, Initialization::RandomUniformDescriptor>) {
                    config.put("minval", concrete.options.minval);
                    config.put("maxval", concrete.options.maxval);
                    Detail::put_seed(config, concrete.options.seed);
                } else if constexpr (std::is_same_v<DescriptorType, Initialization::VarianceScalingDescriptor>) {
                    config.put("scale", concrete.options.scale);
                    config.put("mode", Initialization::Details::to_string(concrete.options.mode));
                    config.put("distribution", Initialization::Details::to_string(concrete.options.distribution));
                    Detail::put_seed(config, concrete.options.seed);
                } else if constexpr (std::is_same_v<DescriptorType, Initialization::OrthogonalDescriptor>) {
                    config.put("gain", concrete.options.gain);
                    Detail::put_seed(config, concrete.options.seed);
                } else if constexpr (std::is_same_v<DescriptorType, Initialization::ConvolutionAwareDescriptor>) {
                    config.put("eps_std", concrete.options.eps_std);
                    Detail::put_seed(config, concrete.options.seed);
                } else if constexpr (std::is_same_v<DescriptorType, Initialization::IdentityDescriptor>) {
                    config.put("gain", concrete.options.gain);
                }
            },
            descriptor);
        return config;
    }

    [[nodiscard]] inline Descriptor from_config(const std::string& class_name, const PropertyTree& config)
    {
        const auto& table = Detail::factories();
        const auto entry = table.find(class_name);
        if (entry == table.end()) {
            std::ostringstream message;
            message << "Unknown initializer '" << class_name << "'.";
            throw UnresolvedIdentifier(message.str());
        }
        return entry->second(config);
    }

    [[nodiscard]] inline PropertyTree serialize(const Descriptor& descriptor)
    {
        PropertyTree tree;
        tree.put("class_name", Initialization::class_name(descriptor));
        tree.add_child("config", get_config(descriptor));
        return tree;
    }

    [[nodiscard]] inline Descriptor deserialize(const PropertyTree& tree)
    {
        const auto class_name = tree.get_optional<std::string>("class_name");
        if (!class_name || class_name->empty()) {
            throw UnresolvedIdentifier("Initializer config is missing 'class_name'.");
        }
        const auto config = tree.get_child_optional("config");
        return from_config(*class_name, config ? *config : PropertyTree{});
    }

    [[nodiscard]] inline Descriptor get(const Descriptor& descriptor)
    {
        return descriptor;
    }

    [[nodiscard]] inline Descriptor get(std::string_view name)
    {
        return from_config(std::string(name), PropertyTree{});
    }

    [[nodiscard]] inline Descriptor get(const PropertyTree& tree)
    {
        return deserialize(tree);
    }

    template <class Identifier>
        requires(!std::is_convertible_v<const Identifier&, Descriptor>
                 && !std::is_convertible_v<const Identifier&, std::string_view>
                 && !std::is_same_v<std::decay_t<Identifier>, PropertyTree>)
    [[nodiscard]] Descriptor get(const Identifier&)
    {
        std::ostringstream message;
        message << "Could not interpret initializer identifier of type '" << typeid(Identifier).name() << "'.";
        throw std::invalid_argument(message.str());
    }

    [[nodiscard]] inline std::string to_json(const Descriptor& descriptor, bool pretty = false)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, serialize(descriptor), pretty);
        return stream.str();
    }

    [[nodiscard]] inline Descriptor from_json(const std::string& json)
    {
        std::istringstream stream(json);
        PropertyTree tree;
        boost::property_tree::read_json(stream, tree);
        return deserialize(tree);
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
        std::ifstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for reading.";
            throw std::runtime_error(message.str());
        }
        PropertyTree tree;
        boost::property_tree::read_json(stream, tree);
        return tree;
    }

    inline void save(const Descriptor& descriptor, const std::filesystem::path& path)
    {
        write_json_file(path, serialize(descriptor));
    }

    [[nodiscard]] inline Descriptor load(const std::filesystem::path& path)
    {
        return deserialize(read_json_file(path));
    }

    // Either a single serialized initializer or {"initializers": [ ... ]}.
    [[nodiscard]] inline std::vector<Descriptor> load_list(const std::filesystem::path& path)
    {
        const auto tree = read_json_file(path);
        std::vector<Descriptor> descriptors;
        if (const auto list = tree.get_child_optional("initializers")) {
            descriptors.reserve(list->size());
            for (const auto& node : *list) {
                descriptors.push_back(deserialize(node.second));
            }
            return descriptors;
        }
        descriptors.push_back(deserialize(tree));
        return descriptors;
    }
}

#endif // PTAH_COMMON_SAVE_LOAD_HPP
