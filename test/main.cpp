#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../include/Ptah.h"

namespace {
    using Ptah::Initialization::Descriptor;
    using Ptah::Initialization::Shape;

    // Dense, 1D conv, 2D conv and a rank-5 kernel.
    const std::vector<Shape> kShapes{
        {64, 128},
        {5, 16, 32},
        {3, 3, 16, 32},
        {2, 3, 3, 8, 8},
    };

    bool accepts(const Descriptor& descriptor, const Shape& shape)
    {
        if (std::holds_alternative<Ptah::Initialization::IdentityDescriptor>(descriptor)) {
            return shape.size() == 2 && shape[0] == shape[1];
        }
        return true;
    }
}

int main(int argc, char** argv) {
    namespace SaveLoad = Ptah::Common::SaveLoad;
    namespace Terminal = Ptah::Utils::Terminal;

    bool use_color = true;
    std::vector<std::pair<std::string, Descriptor>> initializers;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string_view argument = argv[i];
            if (argument == "--no-color") {
                use_color = false;
            } else if (argument == "--list") {
                auto names = SaveLoad::registered_names();
                std::sort(names.begin(), names.end());
                for (const auto& name : names) {
                    std::cout << name << '\n';
                }
                return 0;
            } else if (argument == "--config") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("--config expects a JSON file path.");
                }
                for (auto& descriptor : SaveLoad::load_list(argv[++i])) {
                    initializers.emplace_back(Ptah::Initialization::class_name(descriptor), std::move(descriptor));
                }
            } else {
                initializers.emplace_back(std::string(argument), SaveLoad::get(argument));
            }
        }

        if (initializers.empty()) {
            for (const auto* name : {"zeros", "glorot_uniform", "he_normal", "lecun_uniform", "orthogonal", "cai"}) {
                initializers.emplace_back(name, SaveLoad::get(std::string_view{name}));
            }
            initializers.emplace_back("identity (64)", Ptah::Initialization::Identity());
        }

        std::vector<Ptah::Utils::Report::Entry> entries;
        for (const auto& [name, descriptor] : initializers) {
            for (const auto& shape : kShapes) {
                if (!accepts(descriptor, shape)) {
                    continue;
                }
                const auto tensor = Ptah::Initialization::generate(descriptor, shape);
                entries.push_back({name, Ptah::Utils::Report::summarize(tensor)});
            }
            if (std::holds_alternative<Ptah::Initialization::IdentityDescriptor>(descriptor)) {
                const auto tensor = Ptah::Initialization::generate(descriptor, {64, 64});
                entries.push_back({name, Ptah::Utils::Report::summarize(tensor)});
            }
        }

        Ptah::Utils::Report::print(std::cout, entries, use_color);
        for (const auto& [name, descriptor] : initializers) {
            std::cout << Terminal::ApplyColor(Terminal::Symbols::kCheck, use_color ? Terminal::Colors::kBrightGreen : std::string_view{})
                      << ' ' << SaveLoad::to_json(descriptor);
        }
    } catch (const std::exception& error) {
        std::cerr << Terminal::ApplyColor(Terminal::Symbols::kCross, use_color ? Terminal::Colors::kCrimson : std::string_view{})
                  << ' ' << error.what() << std::endl;
        return 1;
    }
    return 0;
}
