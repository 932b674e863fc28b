#include "TopicPipeline.hpp"
#include "ExternalModelFitter.hpp"
#include "CurveStore.hpp"
#include "errors.hpp"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Usage: topic_sweep <tokens.jsonl> [config.json] [fit_command]
int main(int argc, char* argv[]) {
    std::string tokens_path = "data/processed/tokens.jsonl";
    std::string config_path;

    if (argc >= 2) tokens_path = argv[1];
    if (argc >= 3) config_path = argv[2];

    try {
        SweepConfig config;
        if (!config_path.empty()) {
            config = SweepConfig::load(config_path);
        }
        if (argc >= 4) config.fit_command = argv[3];

        if (config.fit_command.empty()) {
            std::cerr << "ERROR: no fit_command configured (set it in the config or pass it as the third argument)\n";
            return 1;
        }

        std::cout << "[Main] Tokens: " << tokens_path << "\n";
        std::cout << "[Main] Output: " << config.output_dir << "\n\n";

        TokenStreamReader reader;
        const auto tokens = reader.read_file(tokens_path);

        TopicPipeline pipeline(config);
        CurveStore store((fs::path(config.output_dir) / "perplexity_curve.json").string());

        bool loaded = false;
        PerplexityCurve curve = store.compute_or_load(
            pipeline.cache_key(reader.stats().content_hash),
            [&]() {
                PreparedCorpus corpus = pipeline.prepare(tokens);

                ExternalFitterOptions fitter_options;
                fitter_options.command = config.fit_command;
                fitter_options.work_dir = config.work_dir;
                fitter_options.timeout_seconds = config.fit_timeout_seconds;
                fitter_options.seed = config.seed;
                ExternalModelFitter fitter(fitter_options);

                return pipeline.sweep(corpus, fitter);
            },
            &loaded);

        int best_k = ModelSelector::select_k(curve);

        // Curve table
        std::cout << "\n" << std::string(32, '-') << "\n";
        std::cout << std::left << std::setw(8) << "K" << std::setw(16) << "Perplexity" << "\n";
        std::cout << std::string(32, '-') << "\n";
        for (const auto& point : curve.points) {
            std::cout << std::left << std::setw(8) << point.k
                      << std::setw(16) << std::fixed << std::setprecision(3) << point.perplexity
                      << (point.k == best_k ? "<- best" : "") << "\n";
        }
        for (const auto& failed : curve.failures) {
            std::cout << std::left << std::setw(8) << failed.k << std::setw(16) << "failed" << "\n";
        }
        std::cout << std::string(32, '-') << "\n";

        json selection = {
            {"k", best_k},
            {"reused_stored_curve", loaded}
        };
        if (!write_file_atomic((fs::path(config.output_dir) / "selected_k.json").string(), selection.dump(2) + "\n")) {
            std::cerr << "[Main] Warning: could not write selected_k.json\n";
        }

        std::cout << "\nSelected K = " << best_k << "\n";

    } catch (const InvalidSplitError& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 2;
    } catch (const SweepFailedError& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
