#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "analysis/TrialSummaryCalculator.hpp"
#include "centrality/CentralityCalculator.hpp"
#include "simulation/SimulationParameters.hpp"
#include "simulation/TrialOrchestrator.hpp"
#include "vaccination/VaccinationSelector.hpp"

#include "utils/FileUtils.hpp"
#include "utils/ReadGraph.hpp"
#include "utils/ReadSimulationConfiguration.hpp"
#include "utils/ResultWriter.hpp"
#include "exceptions/Exceptions.hpp"
#include "exceptions/GraphReadException.hpp"
#include "utils/Logger.hpp"

using namespace std;
using namespace dissim;

void printUsage(const char* programName) {
    cout << "Usage: " << programName << " <graph-file> <output-csv> [options]" << endl;
    cout << "Options:" << endl;
    cout << "  --patient0, -p <name>         Seed vertex; repeat or separate with ';' (default: every" << endl;
    cout << "                                non-vaccinated vertex, one configuration each)" << endl;
    cout << "  --strategy, -x <name>         Vaccination strategy: 'batch' or 'recursive' (default: none)" << endl;
    cout << "  --centrality, -c <name>       degree, closeness, betweenness, eigenvector or spread" << endl;
    cout << "  --percent-to-vax, -f <int>    Percent of vertices to vaccinate, 1-99 (default: 50)" << endl;
    cout << "  --trials, -t <int>            Trials per seed configuration (default: 100)" << endl;
    cout << "  --model, -m <name>            Propagation model: 'SIR' or 'SIS' (default: SIR)" << endl;
    cout << "  --rounds, -r <int>            Rounds per trial (default: 100)" << endl;
    cout << "  --pb, -b <float>              Transmission probability per edge and round (default: 0.05)" << endl;
    cout << "  --pd, -d <float>              Recovery probability per round (default: 0.05)" << endl;
    cout << "  --recovery <name>             Recovery rule: 'bernoulli' (pd), 'normal' (mu, sigma) or" << endl;
    cout << "                                'uniform' (min-t, max-t) (default: bernoulli)" << endl;
    cout << "  --mu <float>                  Mean infection length in rounds, normal rule (default: 20)" << endl;
    cout << "  --sigma <float>               Deviation of infection length, normal rule (default: 5)" << endl;
    cout << "  --min-t <int>                 Shortest infection in rounds, uniform rule (default: 10)" << endl;
    cout << "  --max-t <int>                 Longest infection in rounds, uniform rule (default: 30)" << endl;
    cout << "  --seed, -z <int>              Random seed (default: 42)" << endl;
    cout << "  --summary, -s <file>          Also write per-configuration summary CSV" << endl;
    cout << "  --parallel                    Run trials on OpenMP threads" << endl;
    cout << "  --threads <int>               Number of threads with --parallel (default: OpenMP default)" << endl;
    cout << "  --config <file>               Read 'key value' settings; command-line options take precedence" << endl;
    cout << "  --log-level <level>           debug, info, warning, error or fatal (default: info)" << endl;
    cout << "  --log-file <file>             Also write log messages to this file" << endl;
    cout << "  --help, -h                    Show this help message" << endl;
}

const map<string, string>& optionKeys() {
    static const map<string, string> keys = {
        {"-p", "patient0"}, {"--patient0", "patient0"},
        {"-x", "strategy"}, {"--strategy", "strategy"},
        {"-c", "centrality"}, {"--centrality", "centrality"},
        {"-f", "percent_to_vaccinate"}, {"--percent-to-vax", "percent_to_vaccinate"},
        {"-t", "trials"}, {"--trials", "trials"},
        {"-m", "model"}, {"--model", "model"},
        {"-r", "rounds"}, {"--rounds", "rounds"},
        {"-b", "pb"}, {"--pb", "pb"},
        {"-d", "pd"}, {"--pd", "pd"},
        {"--recovery", "recovery"},
        {"--mu", "mu"}, {"--sigma", "sigma"},
        {"--min-t", "min_t"}, {"--max-t", "max_t"},
        {"-z", "seed"}, {"--seed", "seed"},
        {"-s", "summary_file"}, {"--summary", "summary_file"},
        {"--threads", "threads"},
        {"--log-level", "log_level"},
        {"--log-file", "log_file"}
    };
    return keys;
}

int main(int argc, char* argv[]) {
    Logger& logger = Logger::getInstance();

    // Command-line settings are applied after the configuration file.
    vector<pair<string, string>> cli_settings;
    vector<string> positional;
    string config_file;

    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--parallel") {
            cli_settings.emplace_back("parallel", "true");
        } else if (arg == "--config" || optionKeys().count(arg)) {
            if (i + 1 >= argc) {
                cerr << "Error: " << arg << " requires a value." << endl;
                printUsage(argv[0]);
                return 1;
            }
            if (arg == "--config") {
                config_file = argv[++i];
            } else {
                cli_settings.emplace_back(optionKeys().at(arg), argv[++i]);
            }
        } else if (!arg.empty() && arg[0] == '-') {
            cerr << "Error: Unknown option: " << arg << endl;
            printUsage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 2) {
        cerr << "Error: Unexpected argument: " << positional[2] << endl;
        printUsage(argv[0]);
        return 1;
    }

    try {
        SimulationParameters params;
        if (!config_file.empty()) {
            readSimulationParameters(config_file, params);
        }
        // Seeds given on the command line replace those from the file
        bool cli_patient0 = false;
        for (const auto& setting : cli_settings) {
            if (setting.first == "patient0" && !cli_patient0) {
                params.patient0.clear();
                cli_patient0 = true;
            }
            applySetting(params, setting.first, setting.second);
        }
        if (positional.size() > 0) params.graph_file = positional[0];
        if (positional.size() > 1) params.output_file = positional[1];

        logger.setLogLevel(parseLogLevel(params.log_level));
        if (!params.log_file.empty() && !logger.enableFileLogging(true, params.log_file)) {
            throw FileIOException("main", "Unable to open log file: " + params.log_file);
        }
        params.validate();

        logger.info("main", "Reading graph from " + params.graph_file + "...");
        ContactGraph graph = readGraph(params.graph_file);
        const string graph_name = FileUtils::getFileStem(params.graph_file);

        auto centrality_provider = make_shared<CentralityCalculator>();
        VaccinationPlan plan;
        if (params.strategy) {
            const int k = VaccinationSelector::computeVaccinationCount(params.percent_to_vaccinate, graph.numVertices());
            logger.info("main", "Selecting " + to_string(k) + " vertices to vaccinate (" + toString(*params.strategy) +
                        ", " + toString(*params.centrality) + ")...");
            VaccinationSelector selector(centrality_provider);
            plan = selector.select(graph, *params.centrality, *params.strategy, k);
            logger.info("main", "...done.");
        }

        const SeedSpecification seeds = params.patient0.empty()
            ? SeedSpecification::allVertices()
            : SeedSpecification::explicitSeeds(params.patient0);
        const auto configurations = TrialOrchestrator::buildSeedConfigurations(graph, plan, seeds);

        RunMetadata meta;
        meta.graph_name = graph_name;
        meta.strategy = params.strategy ? toString(*params.strategy) : "";
        meta.centrality = params.centrality ? toString(*params.centrality) : "";
        meta.model = toString(params.model);
        meta.pb = params.pb;
        meta.pd = params.pd;
        meta.seed = params.seed;
        meta.num_vaccinated = static_cast<int>(plan.size());
        meta.rounds = params.rounds;
        meta.seed_centrality.assign(configurations.size(), std::nullopt);
        if (params.centrality) {
            const Eigen::VectorXd scores = centrality_provider->compute(graph, *params.centrality);
            for (size_t c = 0; c < configurations.size(); ++c) {
                auto idx = graph.indexOf(configurations[c].front());
                if (idx) meta.seed_centrality[c] = scores(*idx);
            }
        }

        const PropagationEngine engine(params.model, params.pb, params.recoveryParameters(), params.rounds);
        logger.info("main", "Propagation: " + toString(params.model) + ", pb " + to_string(params.pb) +
                    ", recovery rule " + toString(params.recovery_rule) + ".");

        TrialOrchestrator orchestrator(params.parallel, params.threads);
        const vector<TrialResult> results = orchestrator.run(graph, plan, seeds, engine, params.trials, params.seed);

        ResultWriter::writeTrialsToFile(params.output_file, meta, results);
        if (!params.summary_file.empty()) {
            ResultWriter::writeSummaryToFile(params.summary_file, meta, TrialSummaryCalculator::summarize(results));
        }

        logger.info("main", "Simulation completed successfully.");
        return 0;
    }
    catch (const GraphReadException& e) {
        logger.fatal("main", "Graph Read Error: " + std::string(e.what()));
        return 1;
    }
    catch (const FileIOException& e) {
        logger.fatal("main", "File IO Error: " + std::string(e.what()));
        return 1;
    }
    catch (const DataFormatException& e) {
        logger.fatal("main", "Data Format Error: " + std::string(e.what()));
        return 1;
    }
    catch (const InvalidParameterException& e) {
        logger.fatal("main", "Invalid Parameter Error: " + std::string(e.what()));
        return 1;
    }
    catch (const InvalidSeedException& e) {
        logger.fatal("main", "Invalid Seed Error: " + std::string(e.what()));
        return 1;
    }
    catch (const GraphInconsistencyException& e) {
        logger.fatal("main", "Graph Error: " + std::string(e.what()));
        return 1;
    }
    catch (const SimulationException& e) {
        logger.fatal("main", "Simulation Error: " + std::string(e.what()));
        return 1;
    }
    catch (const ModelException& e) {
        logger.fatal("main", "General Model Error: " + std::string(e.what()));
        return 1;
    }
    catch (const std::exception& e) {
        logger.fatal("main", "Unexpected Error: " + std::string(e.what()));
        return 1;
    }
}
