//
// distro-detect - Linux Distribution Detector
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <cli/options.h>
#include <distro/classifier.h>
#include <fs/file_resolver.h>
#include <fs/file_source.h>
#include <output/format.h>

#include <systemd/sd-journal.h>

#include <cstdlib>
#include <iostream>
#include <vector>

auto main(int argc, char* argv[]) -> int {
    using namespace distro_detect;

    char const* program_name = argc > 0 ? argv[0] : "distro-detect";
    std::vector<char const*> const args(argv + (argc > 0 ? 1 : 0), argv + argc);
    auto options = parse_arguments(args);
    if (!options) {
        std::cerr << "Error: " << options.error() << "\n";
        print_usage(std::cerr, program_name);
        return EXIT_FAILURE;
    }

    if (options->show_help) {
        print_usage(std::cout, program_name);
        return EXIT_SUCCESS;
    }
    if (options->show_version) {
        print_version(std::cout);
        return EXIT_SUCCESS;
    }
    if (options->list_detectors) {
        for (auto const& name : detector_names(default_detectors())) {
            std::cout << name << "\n";
        }
        return std::cout ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    try {
        auto config = load_config_or_default(options->config_path);
        if (!config) {
            std::cerr << "Configuration failed: " << config.error() << "\n";
            sd_journal_print(LOG_ERR, "distro-detect: Configuration failed: %s",
                             config.error().c_str());
            return EXIT_FAILURE;
        }

        auto settings = apply_overrides(std::move(*config), *options);
        if (!settings) {
            std::cerr << "Error: " << settings.error() << "\n";
            print_usage(std::cerr, program_name);
            return EXIT_FAILURE;
        }

        RealFileSource source;
        FileResolver files{source, settings->detect.fs_root};
        Classifier classifier{files};

        auto distro = classifier.discover();

        auto written = write_results(std::cout, distro, settings->output.format,
                                     settings->output.fields);
        if (written) {
            std::cout.flush();
            if (!std::cout) {
                written = std::unexpected(std::string{"Failed to flush output"});
            }
        }
        if (!written) {
            std::cerr << "error: " << written.error() << "\n";
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;

    } catch (std::exception const& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        sd_journal_print(LOG_CRIT, "distro-detect: Fatal error: %s", e.what());
        return EXIT_FAILURE;
    }
}
