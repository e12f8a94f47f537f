#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/deid_config.hpp"
#include "connectors/http_ner_capability.hpp"
#include "pipeline/deidentifier.hpp"
#include "service/result_json.hpp"
#include "util/config_parser.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace {

void printUsage()
{
    std::cerr << "usage: phiscrub [--config FILE] [--input FILE] [--legend]\n"
              << "  Reads text from FILE or stdin and prints the de-identification result as JSON.\n"
              << "  --legend prints the entity type color table instead.\n";
}

std::string readAll(std::istream &in)
{
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    using namespace phiscrub;

    std::string configPath;
    std::string inputPath;
    bool legendOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--input") && i + 1 < argc) {
            (arg == "--config" ? configPath : inputPath) = argv[++i];
        } else if (arg == "--legend") {
            legendOnly = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            printUsage();
            return 2;
        }
    }

    if (legendOnly) {
        std::cout << service::legendToJson() << std::endl;
        return 0;
    }

    try {
        // 1. Configuration
        config::DeidentifyConfig request;
        config::EngineConfig engine;
        if (!configPath.empty()) {
            util::ConfigParser parser(request, engine);
            parser.loadFromFile(configPath);
        }
        util::logger::setLogLevel(engine.logLevel);
        if (!engine.logFile.empty()) {
            util::logger::enableFileOutput(engine.logFile, true);
        }

        // 2. Input text
        std::string text;
        if (inputPath.empty()) {
            text = readAll(std::cin);
        } else {
            std::ifstream in(inputPath, std::ios::binary);
            if (!in.is_open()) {
                util::logger::error("[main] Cannot open input file: " + inputPath);
                return 1;
            }
            text = readAll(in);
        }

        // 3. Pipeline
        pipeline::Deidentifier deidentifier(
            engine, connectors::sharedNerCapability(engine.nerEndpoint, engine.nerTimeoutMs));
        util::logger::debug("[main] NER model: " + deidentifier.nerModel());

        pipeline::DeidentifyResult result = deidentifier.deidentify(text, request);
        std::cout << service::toJson(result) << std::endl;
    }
    catch (const util::InvalidConfigError &ex) {
        util::logger::error(std::string("[main] ") + ex.what());
        return 2;
    }
    catch (const std::exception &ex) {
        util::logger::error(std::string("[main] ") + ex.what());
        return 1;
    }
    return 0;
}
