#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "../include/logger.hpp"
#include "../include/manifest_generator.hpp"
#include "../include/options.hpp"

// Writes `num_entries` generated manifest entries as JSON lines, followed by
// the summary of the whole batch.
//
//   mgen_dump [options.json] [num_entries]
int main(int argc, char** argv) {
    if (argc > 3) {
        std::cerr << "usage: " << argv[0] << " [options.json] [num_entries]" << std::endl;
        return 2;
    }

    try {
        mgen::GeneratorOptions options;
        if (argc >= 2 && std::string(argv[1]) != "-") {
            options = mgen::GeneratorOptions::FromFile(argv[1]);
        }
        options.Validate();
        options.ConfigureLogging();

        size_t num_entries = 20;
        if (argc == 3) {
            num_entries = std::stoul(argv[2]);
        }

        MGEN_LOG_INFO("generating %zu entries with options %s", num_entries, options.ToJson().dump().c_str());

        mgen::ManifestTestDataGenerator generator(options);
        std::vector<mgen::ManifestEntry> entries;
        entries.reserve(num_entries);
        for (size_t i = 0; i < num_entries; ++i) {
            entries.push_back(generator.Next());
            std::cout << entries.back().ToJson().dump() << "\n";
        }

        if (!entries.empty()) {
            nlohmann::json summary = {{"summary", generator.CreateManifestFileMeta(entries).ToJson()}};
            std::cout << summary.dump() << std::endl;
        }
    } catch (const std::exception& e) {
        MGEN_LOG_ERROR("mgen_dump failed: %s", e.what());
        std::cerr << "mgen_dump: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
