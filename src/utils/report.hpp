#ifndef PTAH_UTILS_REPORT_HPP
#define PTAH_UTILS_REPORT_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../initialization/details/common.hpp"
#include "terminal.hpp"

namespace Ptah::Utils::Report {
    struct Summary {
        std::vector<std::int64_t> shape{};
        double mean{0.0};
        double stddev{0.0};
        double min{0.0};
        double max{0.0};
        // max |G / g - I| with G the Gram matrix of the flattened tensor over its
        // shorter side and g its mean diagonal; empty below rank 2.
        std::optional<double> orthogonality_error{};
    };

    struct Entry {
        std::string name{};
        Summary summary{};
    };

    [[nodiscard]] inline std::optional<double> orthogonality_error(const torch::Tensor& tensor)
    {
        if (tensor.dim() < 2 || tensor.numel() == 0) {
            return std::nullopt;
        }
        torch::NoGradGuard no_grad;
        const auto columns = tensor.size(-1);
        auto matrix = tensor.to(torch::kFloat64).reshape({-1, columns});
        auto gram = matrix.size(0) >= matrix.size(1)
            ? torch::matmul(matrix.transpose(0, 1), matrix)
            : torch::matmul(matrix, matrix.transpose(0, 1));
        const double diagonal = gram.diagonal().mean().item<double>();
        if (diagonal == 0.0) {
            return std::nullopt;
        }
        auto identity = torch::eye(gram.size(0), gram.options());
        return (gram / diagonal - identity).abs().max().item<double>();
    }

    [[nodiscard]] inline Summary summarize(const torch::Tensor& tensor)
    {
        torch::NoGradGuard no_grad;
        Summary summary;
        summary.shape.assign(tensor.sizes().begin(), tensor.sizes().end());
        if (tensor.numel() == 0) {
            return summary;
        }
        const auto values = tensor.to(torch::kFloat64);
        summary.mean = values.mean().item<double>();
        summary.stddev = values.numel() > 1 ? values.std(/*unbiased=*/false).item<double>() : 0.0;
        summary.min = values.min().item<double>();
        summary.max = values.max().item<double>();
        summary.orthogonality_error = orthogonality_error(values);
        return summary;
    }

    namespace detail {
        inline std::string format_number(double value)
        {
            std::ostringstream stream;
            stream << std::setprecision(4) << value;
            return stream.str();
        }
    }

    inline void print(std::ostream& stream, const std::vector<Entry>& entries, bool use_color = true)
    {
        namespace Terminal = ::Ptah::Utils::Terminal;
        const auto frame = use_color ? Terminal::Colors::kBrightBlack : std::string_view{};
        const auto title = use_color ? Terminal::Colors::kGoldenrod : std::string_view{};

        const std::vector<std::string> header{"initializer", "shape", "mean", "std", "min", "max", "orth. err"};
        std::vector<std::size_t> spacings(header.size(), 12);
        spacings[0] = 20;
        spacings[1] = 18;
        for (const auto& entry : entries) {
            spacings[0] = std::max(spacings[0], entry.name.size() + 2);
        }

        stream << Terminal::HTop(spacings, frame) << '\n';
        stream << Terminal::ApplyColor(Terminal::Row(header, spacings, {}), title) << '\n';
        stream << Terminal::HMid(spacings, frame) << '\n';
        for (const auto& entry : entries) {
            const auto& summary = entry.summary;
            std::vector<std::string> cells{
                entry.name,
                Ptah::Initialization::Details::format_shape(summary.shape),
                detail::format_number(summary.mean),
                detail::format_number(summary.stddev),
                detail::format_number(summary.min),
                detail::format_number(summary.max),
                summary.orthogonality_error ? detail::format_number(*summary.orthogonality_error) : std::string{"-"},
            };
            stream << Terminal::Row(cells, spacings, frame) << '\n';
        }
        stream << Terminal::HBottom(spacings, frame) << '\n';
    }
}

#endif // PTAH_UTILS_REPORT_HPP
