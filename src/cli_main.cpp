#include <cxxopts.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include "mocksynth/Errors.hpp"
#include "mocksynth/Json.hpp"
#include "mocksynth/Loader.hpp"
#include "mocksynth/Settings.hpp"
#include "mocksynth/Synthesize.hpp"
#include "mocksynth/Util.hpp"

using namespace mocksynth;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("mocksynth", "Synthesize computed values for a mocked data source");

        options.add_options()
            ("s,schema", "Path to the JSON/TOML schema", cxxopts::value<std::string>())
            ("t,target", "Path to the JSON/TOML target value", cxxopts::value<std::string>())
            ("r,replacement", "Path to the JSON/TOML replacement value", cxxopts::value<std::string>())
            ("w,with", "Inline JSON replacement value", cxxopts::value<std::string>())
            ("seed", "Seed for generated values", cxxopts::value<std::uint64_t>())
            ("f,format", "Output format: json or toml", cxxopts::value<std::string>())
            ("c,config", "Path to JSON/TOML settings", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value("MOCKSYNTH"))
            ("overrides", "Comma-separated dot.key:JSON_value settings", cxxopts::value<std::string>()->default_value(""))
            ("v,verbose", "Echo effective settings and inputs to stderr")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (!result.count("schema") || !result.count("target")) {
            std::cerr << "Error: --schema and --target are required\n";
            std::cerr << options.help() << "\n";
            return 1;
        }
        if (result.count("replacement") && result.count("with")) {
            std::cerr << "Error: --replacement and --with are mutually exclusive\n";
            return 1;
        }

        // Settings: defaults -> file -> env -> overrides -> explicit flags
        SettingsOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        if (result.count("seed")) load.overrides["seed"] = result["seed"].as<std::uint64_t>();
        if (result.count("format")) load.overrides["output.format"] = result["format"].as<std::string>();

        Settings settings = Settings::load(load);
        const bool verbose = result.count("verbose") > 0;

        const std::string format = settings.output_format();
        if (format != "json" && format != "toml") {
            std::cerr << "Error: unknown output format '" << format << "'\n";
            return 1;
        }

        const std::string schema_path = result["schema"].as<std::string>();
        const std::string target_path = result["target"].as<std::string>();

        if (verbose) {
            std::cerr << "settings: " << settings.to_json_string(-1) << "\n";
            std::cerr << "schema: " << schema_path << "\n";
            std::cerr << "target: " << target_path << "\n";
        }

        Block schema = load_schema_file(schema_path);
        Value target = load_target_file(target_path, schema);

        ReplacementValue replacement;
        if (result.count("replacement")) {
            const std::string path = result["replacement"].as<std::string>();
            if (verbose) std::cerr << "replacement: " << path << "\n";
            replacement = load_replacement_file(path);
        } else if (result.count("with")) {
            replacement = replacement_from_string(result["with"].as<std::string>(),
                                                  settings.replacement_label().value_or(""));
        }

        std::unique_ptr<RandomSource> seeded;
        if (auto seed = settings.seed()) {
            seeded = std::make_unique<RandomSource>(*seed);
        }
        RandomSource& random = seeded ? *seeded : RandomSource::process_default();

        SynthesisResult synthesized = synthesize(target, replacement, schema, random);

        for (const auto& diag : synthesized.diagnostics) {
            std::cerr << diag.to_string() << "\n";
        }

        Json out = value_to_json(synthesized.value);
        if (format == "toml") {
            std::cout << to_toml_string(out) << "\n";
        } else {
            std::cout << out.dump(settings.output_indent()) << "\n";
        }

        return settings.exit_status(synthesized.diagnostics);

    } catch (const MissingMandatoryConfig& mmc) {
        std::cerr << "Error: " << mmc.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
