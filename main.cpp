#include "common/Logger.hpp"
#include "common/Profiler.hpp"
#include "ordering/EngineConfig.hpp"
#include "ordering/IcuCollator.hpp"
#include "ordering/OrderingEngine.hpp"
#include "ordering/OrderingError.hpp"
#include "table/TableIO.hpp"
#include <iostream>
#include <locale>
#include <stdexcept>

using namespace ordering;
using common::Logger;
using common::Profiler;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --csv PATH --order SPEC [--order SPEC ...] [options]\n"
              << "Options:\n"
              << "  --csv PATH           Input CSV file (header line required)\n"
              << "  --order SPEC         Sort column: name[:asc|desc][:first|last], primary first\n"
              << "  --locale LOCALE      C (default), a locale identifier (es, de_DE, en-u-kn)\n"
              << "  --legacy             Deprecated comparison sort, text collated by the environment locale (LANG, LC_COLLATE)\n"
              << "  --config FILE        Engine parameters file (key=value lines, @file syntax)\n"
              << "  -o, --output PATH    Write the reordered CSV instead of the permutation\n"
              << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: info)\n"
              << "  --profile            Print phase timings on exit\n"
              << "  -h, --help           Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string csvPath;
        std::string outputPath;
        std::string configFile;
        std::string logLevel;
        bool profile = false;
        OrderRequest request;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--csv" && i + 1 < argc) {
                csvPath = argv[++i];
            } else if (arg == "--order" && i + 1 < argc) {
                request.specs.push_back(OrderSpecParser::fromToken(argv[++i]));
            } else if (arg == "--locale" && i + 1 < argc) {
                request.locale = argv[++i];
            } else if (arg == "--legacy") {
                request.mode = Mode::LEGACY;
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                outputPath = argv[++i];
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                logLevel = argv[++i];
            } else if (arg == "--profile") {
                profile = true;
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        if (csvPath.empty()) {
            std::cerr << "Error: --csv is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        EngineConfig config = configFile.empty() ? EngineConfig() : EngineConfig::fromFile(configFile);
        if (!logLevel.empty()) {
            config.logLevel = Logger::levelFromString(logLevel);
        }
        if (profile) {
            config.profilingEnabled = true;
        }
        config.apply();

        // Le tri legacy suit la locale globale C++ : on y installe la collation de
        // l'environnement (LANG, LC_COLLATE), les nombres restent en locale classique
        if (request.mode == Mode::LEGACY || locale_id::isLegacy(request.locale)) {
            try {
                std::locale::global(std::locale(std::locale::classic(), std::locale(""),
                                                std::locale::collate));
            } catch (const std::runtime_error& e) {
                ORDERING_LOG_WARN(std::string("Environment locale unavailable, legacy order uses C: ") +
                                  e.what());
            }
        }

        auto table = TableIO::readCSV(csvPath);
        ORDERING_LOG_INFO("Loaded " + std::to_string(table->rowCount()) + " rows, " +
                          std::to_string(table->columnCount()) + " columns from " + csvPath);

        OrderingEngine engine(std::make_shared<IcuCollator>(), config);
        Permutation permutation = engine.order(*table, request);

        if (outputPath.empty()) {
            for (size_t row : permutation) {
                std::cout << row << "\n";
            }
        } else {
            TableIO::writeCSV(*table->take(permutation), outputPath);
            ORDERING_LOG_INFO("Wrote " + std::to_string(permutation.size()) + " rows to " + outputPath);
        }

        if (Profiler::instance().isEnabled()) {
            std::cerr << Profiler::instance().formatStats() << std::endl;
        }
        return 0;
    } catch (const OrderingError& e) {
        ORDERING_LOG_ERROR(e.toJson().dump());
        return 1;
    } catch (const std::exception& e) {
        ORDERING_LOG_ERROR(std::string("Error: ") + e.what());
        return 1;
    }
}
