#ifndef PTAH_INITIALIZATION_APPLY_HPP
#define PTAH_INITIALIZATION_APPLY_HPP
#include <cstdint>
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Ptah::Initialization {
    namespace Details {
        // LibTorch stores weights as (out, in, spatial...). The initializers expect
        // (spatial..., in, out), the order in which fans are computed.
        inline std::vector<std::int64_t> torch_to_kernel_order(std::int64_t rank)
        {
            std::vector<std::int64_t> order;
            order.reserve(static_cast<std::size_t>(rank));
            for (std::int64_t axis = 2; axis < rank; ++axis) {
                order.push_back(axis);
            }
            order.push_back(1);
            order.push_back(0);
            return order;
        }

        inline std::vector<std::int64_t> invert(const std::vector<std::int64_t>& order)
        {
            std::vector<std::int64_t> inverse(order.size());
            for (std::size_t i = 0; i < order.size(); ++i) {
                inverse[static_cast<std::size_t>(order[i])] = static_cast<std::int64_t>(i);
            }
            return inverse;
        }
    }

    // Overwrites `parameter` in place. With DataFormat::ChannelsFirst the parameter is read
    // as a LibTorch weight and generated in kernel order, then permuted back.
    inline void apply(const Descriptor& descriptor,
                      torch::Tensor parameter,
                      DataFormat format = DataFormat::ChannelsLast)
    {
        torch::NoGradGuard no_grad;
        const auto rank = parameter.dim();
        if (format == DataFormat::ChannelsLast || rank < 2) {
            const Shape shape(parameter.sizes().begin(), parameter.sizes().end());
            parameter.copy_(generate(descriptor, shape, parameter.scalar_type()));
            return;
        }

        const auto order = Details::torch_to_kernel_order(rank);
        Shape kernel_shape;
        kernel_shape.reserve(order.size());
        for (const auto axis : order) {
            kernel_shape.push_back(parameter.size(axis));
        }
        const auto values = generate(descriptor, kernel_shape, parameter.scalar_type());
        parameter.copy_(values.permute(Details::invert(order)));
    }

    template <class Module>
    inline void apply_module_initialization(const Module& module,
                                            const Descriptor& weight,
                                            const std::optional<Descriptor>& bias = Descriptor{ZerosDescriptor{}})
    {
        apply(weight, module->weight, DataFormat::ChannelsFirst);
        if constexpr (requires { module->bias; }) {
            if (bias.has_value() && module->bias.defined()) {
                apply(*bias, module->bias);
            }
        }
    }
}

#endif // PTAH_INITIALIZATION_APPLY_HPP
