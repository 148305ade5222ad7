#ifndef PTAH_INITIALIZATION_DETAILS_FANS_HPP
#define PTAH_INITIALIZATION_DETAILS_FANS_HPP

#include <cmath>
#include <cstdint>
#include <functional>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common.hpp"

namespace Ptah::Initialization::Details {
    // Kernels are stored channels-last unless stated otherwise:
    //   channels_last  : (spatial..., input_depth, depth)
    //   channels_first : (depth, input_depth, spatial...)
    enum class DataFormat {
        ChannelsLast,
        ChannelsFirst,
    };

    struct Fans {
        double fan_in{0.0};
        double fan_out{0.0};
    };

    inline std::string to_string(DataFormat format)
    {
        switch (format) {
            case DataFormat::ChannelsFirst: return "channels_first";
            case DataFormat::ChannelsLast:
            default: return "channels_last";
        }
    }

    inline DataFormat data_format_from_string(std::string_view value)
    {
        const auto lowered = to_lower(value);
        if (lowered == "channels_last") return DataFormat::ChannelsLast;
        if (lowered == "channels_first") return DataFormat::ChannelsFirst;
        std::ostringstream message;
        message << "Invalid data_format '" << value << "', expected one of {channels_last, channels_first}.";
        throw std::invalid_argument(message.str());
    }

    namespace detail {
        inline double product(Shape::const_iterator first, Shape::const_iterator last)
        {
            return std::accumulate(first, last, 1.0, [](double accumulated, std::int64_t dimension) {
                return accumulated * static_cast<double>(dimension);
            });
        }
    }

    [[nodiscard]] inline Fans compute_fans(const Shape& shape, DataFormat format = DataFormat::ChannelsLast)
    {
        const auto rank = shape.size();
        if (rank == 2) {
            return {static_cast<double>(shape[0]), static_cast<double>(shape[1])};
        }

        if (rank >= 3 && rank <= 5) {
            if (format == DataFormat::ChannelsFirst) {
                const double receptive_field = detail::product(shape.begin() + 2, shape.end());
                return {static_cast<double>(shape[1]) * receptive_field,
                        static_cast<double>(shape[0]) * receptive_field};
            }
            const double receptive_field = detail::product(shape.begin(), shape.end() - 2);
            return {static_cast<double>(shape[rank - 2]) * receptive_field,
                    static_cast<double>(shape[rank - 1]) * receptive_field};
        }

        const double fan = std::sqrt(detail::product(shape.begin(), shape.end()));
        return {fan, fan};
    }

    // The layout only matters for convolution kernels; other ranks never parse it.
    [[nodiscard]] inline Fans compute_fans(const Shape& shape, std::string_view data_format)
    {
        if (shape.size() < 3 || shape.size() > 5) {
            return compute_fans(shape, DataFormat::ChannelsLast);
        }
        return compute_fans(shape, data_format_from_string(data_format));
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_FANS_HPP
