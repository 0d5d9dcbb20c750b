// storyflow - resolve narrative text from the command line
// Loads content (templates, Lua scripts) and prints what each fragment renders to.

#include <storyflow/core/config.hpp>
#include <storyflow/core/logger.hpp>
#include <storyflow/narrative/basic_host.hpp>
#include <storyflow/narrative/narrative_engine.hpp>
#include <storyflow/scripting/narrative_script_engine.hpp>

#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <raylib.h>

#ifndef STORYFLOW_VERSION
#define STORYFLOW_VERSION "0.0.0-dev"
#endif

namespace {

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options] [text...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>        INI config (default: storyflow.ini if present)\n";
    std::cout << "  --script <file>        Lua content script, repeatable (first is main)\n";
    std::cout << "  --templates <file>     Template line file, repeatable\n";
    std::cout << "  --container <id>       Active container\n";
    std::cout << "  --flag <path=value>    Set a flag before resolving, repeatable\n";
    std::cout << "  --choice <id:name:params>  Build a choice and report its state\n";
    std::cout << "  --take                 Take every available --choice\n";
    std::cout << "  --no-exec              Collect actions without running them\n";
    std::cout << "  --verbose              Debug logging\n";
    std::cout << "  --quiet                Disable logging\n";
    std::cout << "  --version              Print version\n";
    std::cout << "  --help                 Show this help message\n";
    std::cout << "\nWithout text arguments every stdin line is resolved.\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --flag gold=20 \"if{gold>10}Rich!else{}Poor.fi{}\"\n";
}

struct Args {
    std::string configPath;
    std::vector<std::string> scripts;
    std::vector<std::string> templates;
    std::optional<std::string> container;
    std::vector<std::string> flags;
    std::vector<std::string> choices;
    std::vector<std::string> texts;
    bool take = false;
    bool noExec = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--version") == 0) {
            args.version = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--script") == 0 && i + 1 < argc) {
            args.scripts.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--templates") == 0 && i + 1 < argc) {
            args.templates.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--container") == 0 && i + 1 < argc) {
            args.container = argv[++i];
        }
        else if (std::strcmp(arg, "--flag") == 0 && i + 1 < argc) {
            args.flags.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--choice") == 0 && i + 1 < argc) {
            args.choices.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--take") == 0) {
            args.take = true;
        }
        else if (std::strcmp(arg, "--no-exec") == 0) {
            args.noExec = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else if (std::strncmp(arg, "--", 2) == 0) {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
        else {
            args.texts.emplace_back(arg);
        }
    }

    return args;
}

// "id:name:params" -> definition; params may be empty or contain ':'.
std::optional<storyflow::narrative::ChoiceDefinition> parse_choice_arg(const std::string& arg) {
    const auto first = arg.find(':');
    if (first == std::string::npos) return std::nullopt;
    const auto second = arg.find(':', first + 1);

    storyflow::narrative::ChoiceDefinition definition;
    definition.id = arg.substr(0, first);
    if (second == std::string::npos) {
        definition.name = arg.substr(first + 1);
        definition.params = std::string();
    } else {
        definition.name = arg.substr(first + 1, second - first - 1);
        definition.params = arg.substr(second + 1);
    }
    return definition;
}

void print_result(const storyflow::narrative::ResolveResult& result,
                  const storyflow::narrative::BasicNarrativeHost& host) {
    if (result.redirected) {
        std::cout << "[redirect] " << result.actions.to_json().dump() << "\n";
        return;
    }

    if (host.talking_character()) {
        std::cout << *host.talking_character() << ": ";
    }
    std::cout << result.output << "\n";

    if (!result.actions.empty()) {
        std::cout << "  actions: " << result.actions.to_json().dump() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace storyflow;

    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (args.version) {
        std::cout << "storyflow " << STORYFLOW_VERSION << "\n";
        return 0;
    }

    core::Config config;
    if (!args.configPath.empty()) {
        if (!config.load_from_file(args.configPath)) {
            std::cerr << "[ERROR] Cannot read config '" << args.configPath << "'\n";
            return 1;
        }
    } else {
        (void)config.load_from_file("storyflow.ini");
    }

    core::LoggingConfig logging = config.logging();
    if (args.quiet) {
        logging.enabled = false;
    } else if (args.verbose) {
        logging.level = LOG_DEBUG;
    }
    core::Logger::instance().init(logging);

    if (!config.loaded_from_path().empty()) {
        TraceLog(LOG_INFO, "[cli] Config loaded from %s", config.loaded_from_path().c_str());
    }

    // Content: config first, command line on top
    std::vector<std::string> scripts = config.content().scripts;
    scripts.insert(scripts.end(), args.scripts.begin(), args.scripts.end());
    std::vector<std::string> templates = config.content().templates;
    templates.insert(templates.end(), args.templates.begin(), args.templates.end());

    narrative::BasicNarrativeHost host(args.container.value_or(config.content().start_container));

    for (const auto& path : templates) {
        if (!host.load_templates_from_file(path)) {
            std::cerr << "[ERROR] Cannot read templates '" << path << "'\n";
            core::Logger::instance().shutdown();
            return 1;
        }
    }

    narrative::NarrativeEngine engine(host, config.narrative());

    // --flag goes through the flag action, so "gold>5" adds like it does in text
    for (const auto& flag : args.flags) {
        narrative::ActionMap actions;
        actions.set("flag", narrative::ActionPayload::from_string(flag));
        engine.resolve_actions(actions);
    }

    scripting::NarrativeScriptEngine scriptEngine(engine);
    if (!scripts.empty()) {
        if (!scriptEngine.init()) {
            std::cerr << "[ERROR] " << scriptEngine.last_error() << "\n";
            core::Logger::instance().shutdown();
            return 1;
        }

        auto loaded = scriptEngine.load_files(scripts);
        if (!loaded) {
            std::cerr << "[ERROR] " << loaded.error << "\n";
            core::Logger::instance().shutdown();
            return 1;
        }
    }

    int status = 0;

    for (const auto& arg : args.choices) {
        auto definition = parse_choice_arg(arg);
        if (!definition) {
            std::cerr << "[WARNING] Choice must be id:name[:params], got: " << arg << "\n";
            status = 1;
            continue;
        }

        const auto choice = engine.create_custom_choice(*definition);
        std::cout << "[choice " << choice.id() << "] " << choice.display_name()
                  << " visible=" << (choice.is_visible() ? "yes" : "no")
                  << " available=" << (choice.is_available() ? "yes" : "no") << "\n";

        if (args.take && choice.is_visible()) {
            if (engine.perform_choice(choice)) {
                std::cout << "  taken\n";
            }
        }
    }

    auto resolve = [&](const std::string& text) {
        auto result = engine.resolve_string(text, args.noExec);
        print_result(result, host);
    };

    if (!args.texts.empty()) {
        for (const auto& text : args.texts) {
            resolve(text);
        }
    } else if (args.choices.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;
            resolve(line);
        }
    }

    core::Logger::instance().shutdown();
    return status;
}
