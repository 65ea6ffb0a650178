#include "itemset_miner.h"
#include "signal_handler.h"
#include "transaction_reader.h"
#include "result_writer.h"
#include "errors.h"
#include "timer.h"
#include <iostream>
#include <csignal>

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);

    if (argc < 2) {
        std::cout << "Usage: ./itemset_miner <transactions-file> [options]\n"
                  << "Options:\n"
                  << "  --supp <num>       Min support, negative = absolute (default: 10 %)\n"
                  << "  --smax <num>       Max support, same convention (default: 100 %)\n"
                  << "  --zmin <int>       Min items per set/rule (default: 1)\n"
                  << "  --zmax <int>       Max items per set/rule, -1 = no limit (default: -1)\n"
                  << "  --target <name>    frequent | closed | maximal | generators | rules\n"
                  << "  --algo <name>      apriori | eclat | fpgrowth | proj | sam | ista (default: fpgrowth)\n"
                  << "  --conf <num>       Min rule confidence in percent (default: 80)\n"
                  << "  --lift <num>       Min rule lift (default: 0)\n"
                  << "  --single-head      Rules with one item in the consequent only\n"
                  << "  --orig-supp        Rule support is body & head, not body only\n"
                  << "  --appear <i=code>  Where item i may occur in rules: none, body, head, both\n"
                  << "                     (repeatable; i empty sets the default for all items)\n"
                  << "  --report <codes>   Extra values: a abs supp, s rel supp, S percent, Q total\n"
                  << "  --max <int>        Max number of results, 0 = all (default: 0)\n"
                  << "  --delimiter <c>    Item separator (default: blanks and tabs)\n"
                  << "  --weighted         Last field of each line is the transaction weight\n"
                  << "  --threads <int>    Max CPU threads (0 for all)\n"
                  << "  --out <path>       Output CSV (default: results.csv)\n"
                  << "  --verbose          Log mining phases\n"
                  << std::endl;
        return 1;
    }

    std::string input_path = argv[1];
    std::string output_csv = "results.csv";
    MinerConfig config;
    ReaderOptions reader;
    std::vector<std::string> appear_args;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--supp" && i + 1 < argc) config.min_support = std::stod(argv[++i]);
            else if (arg == "--smax" && i + 1 < argc) config.max_support = std::stod(argv[++i]);
            else if (arg == "--zmin" && i + 1 < argc) config.zmin = std::stoi(argv[++i]);
            else if (arg == "--zmax" && i + 1 < argc) config.zmax = std::stoi(argv[++i]);
            else if (arg == "--target" && i + 1 < argc) config.target = argv[++i];
            else if (arg == "--algo" && i + 1 < argc) config.algorithm = argv[++i];
            else if (arg == "--conf" && i + 1 < argc) config.min_confidence = std::stod(argv[++i]);
            else if (arg == "--lift" && i + 1 < argc) config.min_lift = std::stod(argv[++i]);
            else if (arg == "--single-head") config.single_consequent = true;
            else if (arg == "--orig-supp") config.original_support = true;
            else if (arg == "--appear" && i + 1 < argc) appear_args.push_back(argv[++i]);
            else if (arg == "--report" && i + 1 < argc) config.report = argv[++i];
            else if (arg == "--max" && i + 1 < argc) config.max_results = std::stoul(argv[++i]);
            else if (arg == "--threads" && i + 1 < argc) config.threads = std::stoi(argv[++i]);
            else if (arg == "--out" && i + 1 < argc) output_csv = argv[++i];
            else if (arg == "--verbose") config.verbose = true;
            else if (arg == "--weighted") reader.weighted = true;
            else if (arg == "--delimiter" && i + 1 < argc) {
                std::string delim = argv[++i];
                if (delim == "\\t") reader.delimiter = '\t';
                else if (!delim.empty()) reader.delimiter = delim[0];
            }
            else std::cout << "[WARNING] Ignoring unknown argument: " << arg << std::endl;
        }
    } catch (const std::logic_error& e) {
        std::cerr << "[ERROR] Bad numeric argument: " << e.what() << std::endl;
        return 1;
    }

    try {
        std::cout << "[START] Initializing Miner..." << std::endl;
        for (const auto& spec : appear_args) {
            size_t eq = spec.rfind('=');
            if (eq == std::string::npos)
                throw InvalidConfigError("--appear expects item=code, got " + spec);
            Appearance app = parse_appearance(spec.substr(eq + 1));
            if (eq == 0) config.default_appearance = app;
            else config.appearances[spec.substr(0, eq)] = app;
        }
        ItemsetMiner miner(config);
        miner.set_cancel_token(&g_cancel);

        auto load_start = start_timer();
        std::cout << "[LOG] Loading transactions: " << input_path << std::endl;
        std::vector<RawTransaction> transactions = read_transactions(input_path, reader);
        std::cout << "[LOG] " << transactions.size() << " transactions read" << std::endl;
        stop_timer("Transaction Loading", load_start);

        std::cout << "[START] Beginning mining with algorithm=" << config.algorithm
                  << ", target=" << config.target << ", supp=" << config.min_support << std::endl;

        if (miner.target() == Target::Rules) {
            std::vector<Rule> rules = miner.mine_rules(transactions);
            std::cout << "[LOG] " << rules.size() << " rules found" << std::endl;
            save_rules_csv(rules, output_csv);
        } else {
            std::vector<Pattern> patterns = miner.mine(transactions);
            std::cout << "[LOG] " << patterns.size() << " itemsets found" << std::endl;
            save_patterns_csv(patterns, config.report, output_csv);
        }
    } catch (const AbortedError& e) {
        std::cerr << "\n[!] Interrupted: " << e.what() << std::endl;
        return 130;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 2;
    }

    std::cout << "[DONE] Process finished." << std::endl;
    return 0;
}
