#include "wojak/api/WojakGenerator.hpp"
#include "wojak/core/Configuration.hpp"
#include "wojak/core/Exception.hpp"
#include "wojak/core/Logger.hpp"
#include "wojak/templates/TemplateManifest.hpp"
#include "wojak/utils/FileUtils.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace wojak;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRequest = 2;

const char* kDefaultConfigFile = "config/wojak.yaml";

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " generate <input> <output> [--template ID] [--config FILE]\n"
              << "        [--face F] [--eye F] [--mouth F] [--nose F] [--color F] [--contrast F] [--sharpen F]\n"
              << "  " << program << " validate <input> [--config FILE]\n"
              << "  " << program << " list [--config FILE]\n"
              << "  " << program << " add-template <image> <id> [description] [--config FILE]\n";
}

/// Positional arguments plus --key value options
struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

bool parseCommandLine(int argc, char** argv, CommandLine& cmd) {
    if (argc < 2) {
        return false;
    }
    cmd.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            cmd.options[arg.substr(2)] = argv[++i];
        } else {
            cmd.positional.push_back(arg);
        }
    }
    return true;
}

bool parseFloatOption(const CommandLine& cmd, const std::string& name, float& value) {
    auto it = cmd.options.find(name);
    if (it == cmd.options.end()) {
        return true;
    }
    try {
        size_t used = 0;
        value = std::stof(it->second, &used);
        if (used != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
    } catch (const std::logic_error&) {
        std::cerr << "Invalid number for --" << name << ": " << it->second << std::endl;
        return false;
    }
    return true;
}

api::GeneratorConfig loadConfig(const CommandLine& cmd) {
    auto& config = core::Configuration::getInstance();
    auto it = cmd.options.find("config");
    const std::string path = it != cmd.options.end() ? it->second : kDefaultConfigFile;
    const bool explicit_path = it != cmd.options.end();
    bool loaded = (explicit_path || utils::FileUtils::fileExists(path)) && config.load(path);

    api::GeneratorConfig generator_config = api::GeneratorConfig::fromConfiguration(config);
    generator_config.logging.apply();

    if (loaded) {
        LOG_INFO("Configuration loaded from " + path);
    } else if (explicit_path) {
        LOG_WARNING("Cannot load configuration " + path + ", using defaults");
    }
    LOG_DEBUG(generator_config.toString());
    return generator_config;
}

std::unique_ptr<api::WojakGenerator> createGenerator(const api::GeneratorConfig& config) {
    auto backend = std::make_shared<face::FacemarkBackend>(config.detector);
    if (!backend->initialize()) {
        std::cerr << "Face detector unavailable: " << backend->getLastError() << std::endl;
        return nullptr;
    }
    auto registry = templates::TemplateRegistry::loadAll(config.template_directory);
    return std::make_unique<api::WojakGenerator>(registry, backend, config);
}

void printReport(const face::ValidationReport& report) {
    std::cout << report.toString() << std::endl;
}

int runGenerate(const CommandLine& cmd) {
    if (cmd.positional.size() != 2) {
        return kExitUsage;
    }
    api::GeneratorConfig config = loadConfig(cmd);

    auto template_it = cmd.options.find("template");
    const std::string template_id = template_it != cmd.options.end() ? template_it->second : "wojak_basic";

    auto generator = createGenerator(config);
    if (!generator) {
        return kExitRequest;
    }

    api::GenerationParameters params = config.defaults.forTemplate(generator->getRegistry()->get(template_id));
    bool ok = parseFloatOption(cmd, "face", params.face_blend_strength) &&
              parseFloatOption(cmd, "eye", params.eye_blend_strength) &&
              parseFloatOption(cmd, "mouth", params.mouth_blend_strength) &&
              parseFloatOption(cmd, "nose", params.nose_blend_strength) &&
              parseFloatOption(cmd, "color", params.color_match_strength) &&
              parseFloatOption(cmd, "contrast", params.contrast_enhancement) &&
              parseFloatOption(cmd, "sharpen", params.sharpen_amount);
    if (!ok) {
        return kExitUsage;
    }

    auto bytes = utils::FileUtils::readBytes(cmd.positional[0]);
    api::GenerationResult result = generator->generate(bytes, template_id, params);
    utils::FileUtils::writeBytes(cmd.positional[1], result.image_bytes);

    printReport(result.validation);
    for (const auto& region : result.regions) {
        std::cout << "  " << face::regionNameToString(region.region) << ": "
                  << (region.blended ? "blended" : "kept template");
        if (region.translation_only) {
            std::cout << " (translation only)";
        }
        if (!region.note.empty()) {
            std::cout << " [" << region.note << "]";
        }
        std::cout << std::endl;
    }
    std::cout << "Parameters: " << result.parameters.toString() << std::endl;
    std::cout << "Written " << cmd.positional[1] << " (" << result.image.cols << "x"
              << result.image.rows << ")" << std::endl;
    return kExitOk;
}

int runValidate(const CommandLine& cmd) {
    if (cmd.positional.size() != 1) {
        return kExitUsage;
    }
    api::GeneratorConfig config = loadConfig(cmd);
    auto generator = createGenerator(config);
    if (!generator) {
        return kExitRequest;
    }
    face::ValidationReport report = generator->validateFaceImage(utils::FileUtils::readBytes(cmd.positional[0]));
    printReport(report);
    return kExitOk;
}

int runList(const CommandLine& cmd) {
    if (!cmd.positional.empty()) {
        return kExitUsage;
    }
    api::GeneratorConfig config = loadConfig(cmd);
    auto registry = templates::TemplateRegistry::loadAll(config.template_directory);
    for (const auto& summary : registry->list()) {
        std::cout << summary.id << "\t" << summary.display_name << "\t" << summary.description << std::endl;
    }
    return kExitOk;
}

int runAddTemplate(const CommandLine& cmd) {
    if (cmd.positional.size() < 2 || cmd.positional.size() > 3) {
        return kExitUsage;
    }
    api::GeneratorConfig config = loadConfig(cmd);

    templates::ManifestEntry entry;
    entry.id = cmd.positional[1];
    entry.display_name = templates::displayNameFromId(entry.id);
    entry.description = cmd.positional.size() == 3 ? cmd.positional[2] : entry.id + " variant";
    entry.geometry_preset = "wojak_basic";

    templates::appendManifestEntry(config.template_directory, cmd.positional[0], entry);
    std::cout << "Added template '" << entry.id << "' to " << config.template_directory << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    int code = kExitUsage;
    try {
        if (cmd.command == "generate") {
            code = runGenerate(cmd);
        } else if (cmd.command == "validate") {
            code = runValidate(cmd);
        } else if (cmd.command == "list") {
            code = runList(cmd);
        } else if (cmd.command == "add-template") {
            code = runAddTemplate(cmd);
        } else {
            std::cerr << "Unknown command: " << cmd.command << std::endl;
        }
    } catch (const core::Exception& e) {
        LOG_ERROR(std::string("Request failed: ") + e.what());
        std::cerr << "Error: " << e.getMessage() << std::endl;
        code = kExitRequest;
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("Unexpected error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        code = kExitRequest;
    }

    if (code == kExitUsage) {
        printUsage(argv[0]);
    }
    core::Logger::getInstance().flush();
    return code;
}
