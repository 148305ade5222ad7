#ifndef PTAH_INITIALIZATION_REGISTRY_HPP
#define PTAH_INITIALIZATION_REGISTRY_HPP

#include <string>
#include <type_traits>
#include <variant>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Ptah::Initialization {
    namespace Details {
        template <class Descriptor>
        torch::Tensor build_tensor(const Descriptor&, const Shape&, torch::Dtype) {
            static_assert(sizeof(Descriptor) == 0, "Unsupported initializer descriptor provided to build_tensor.");
            return {};
        }

        inline torch::Tensor build_tensor(const ZerosDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const OnesDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const ConstantDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const RandomNormalDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const RandomUniformDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const TruncatedNormalDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const VarianceScalingDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const OrthogonalDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const ConvolutionAwareDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
        inline torch::Tensor build_tensor(const IdentityDescriptor& d, const Shape& s, torch::Dtype t) { return generate(d, s, t); }
    }

    // Fresh tensor of `shape`, generated by whichever initializer `descriptor` holds.
    [[nodiscard]] inline torch::Tensor generate(const Descriptor& descriptor,
                                                const Shape& shape,
                                                torch::Dtype dtype = torch::kFloat32)
    {
        return std::visit(
            [&](const auto& concrete) { return Details::build_tensor(concrete, shape, dtype); },
            descriptor);
    }

    [[nodiscard]] inline std::string class_name(const Descriptor& descriptor)
    {
        return std::visit(
            [](const auto& concrete) -> std::string {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, ZerosDescriptor>) {
                    return "Zeros";
                } else if constexpr (std::is_same_v<DescriptorType, OnesDescriptor>) {
                    return "Ones";
                } else if constexpr (std::is_same_v<DescriptorType, ConstantDescriptor>) {
                    return "Constant";
                } else if constexpr (std::is_same_v<DescriptorType, RandomNormalDescriptor>) {
                    return "RandomNormal";
                } else if constexpr (std::is_same_v<DescriptorType, RandomUniformDescriptor>) {
                    return "RandomUniform";
                } else if constexpr (std::is_same_v<DescriptorType, TruncatedNormalDescriptor>) {
                    return "TruncatedNormal";
                } else if constexpr (std::is_same_v<DescriptorType, VarianceScalingDescriptor>) {
                    return "VarianceScaling";
                } else if constexpr (std::is_same_v<DescriptorType, OrthogonalDescriptor>) {
                    return "Orthogonal";
                } else if constexpr (std::is_same_v<DescriptorType, ConvolutionAwareDescriptor>) {
                    return "ConvolutionAware";
                } else {
                    static_assert(std::is_same_v<DescriptorType, IdentityDescriptor>, "Unhandled initializer descriptor.");
                    return "Identity";
                }
            },
            descriptor);
    }
}

#endif // PTAH_INITIALIZATION_REGISTRY_HPP
