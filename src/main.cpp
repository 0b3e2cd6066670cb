#include "codec.hpp"
#include "config.hpp"
#include "diversity_metrics.hpp"
#include "explain.hpp"
#include "fingerprint.hpp"
#include "ranker.hpp"
#include "rerank/sliding_window.hpp"
#include "util.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <string>

static void print_usage() {
    std::cout << "Usage: culturerank [options]\n"
              << "\n"
              << "Reads a ranking request (JSON) and writes the ranking response.\n"
              << "\n"
              << "Options:\n"
              << "  -i, --input FILE     Read the request from FILE (default: stdin)\n"
              << "  -o, --output FILE    Write the response to FILE (default: stdout)\n"
              << "  --strategy NAME      Rerank strategy (mmr, dpp)\n"
              << "  --fingerprint NAME   paramSetId hash (sha256, fnv1a)\n"
              << "  --explain            Add contribution rates and dominant factor per item\n"
              << "  --metrics            Add diversity metrics and sliding-window check of the ranked list\n"
              << "  --pretty             Indent the JSON output\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  CULTURERANK_CONFIG            Config file (default: ~/.culturerank/config.json)\n"
              << "  CULTURERANK_STRATEGY          Default rerank strategy\n"
              << "  CULTURERANK_FINGERPRINT       Default paramSetId hash\n"
              << "  CULTURERANK_DIVERSITY_CAP_N   Default list length\n";
}

static void add_explanations(nlohmann::json& out, const culturerank::RankResponse& response) {
    auto& ranked = out["ranked"];
    for (size_t i = 0; i < response.ranked.size(); i++) {
        const auto& breakdown = response.ranked[i].score_breakdown;
        auto rates = culturerank::contribution_rates(breakdown);
        ranked[i]["explanation"] = {
            {"contributionRates", {{"prs", rates.prs}, {"cvs", rates.cvs}, {"dns", rates.dns}}},
            {"dominantFactor", culturerank::dominant_factor(breakdown)}
        };
    }
}

static void add_metrics(nlohmann::json& out, const culturerank::RankRequest& request,
                        const culturerank::RankResponse& response) {
    std::map<std::string, const culturerank::Candidate*> by_key;
    for (const auto& c : request.candidates) by_key.emplace(c.item_key, &c);

    std::vector<const culturerank::Candidate*> items;
    for (const auto& item : response.ranked) {
        auto it = by_key.find(item.item_key);
        if (it != by_key.end()) items.push_back(it->second);
    }

    auto m = culturerank::compute_diversity_metrics(items);
    out["diversityMetrics"] = {
        {"clusterEntropy", m.cluster_entropy},
        {"averagePairwiseDistance", m.average_pairwise_distance},
        {"uniqueClusters", m.unique_clusters},
        {"maxClusterRatio", m.max_cluster_ratio}
    };

    culturerank::SlidingWindowConfig window;
    window.window_size = static_cast<uint32_t>(items.size());
    window.max_per_cluster = response.constraints_report.effective_diversity_cap_k;
    auto check = culturerank::sliding_window_filter(items, window);
    out["slidingWindow"] = {
        {"kept", check.kept.size()},
        {"clusterViolations", check.cluster_violations},
        {"similarityViolations", check.similarity_violations},
        {"totalFiltered", check.total_filtered()}
    };
}

int main(int argc, char* argv[]) try {
    std::string input_path;
    std::string output_path;
    std::string strategy_name;
    std::string fingerprint_name;
    bool explain = false;
    bool metrics = false;
    bool pretty = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-i") == 0 || std::strcmp(argv[i], "--input") == 0) && i + 1 < argc) {
            input_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output") == 0) && i + 1 < argc) {
            output_path = argv[++i];
        } else if (std::strcmp(argv[i], "--strategy") == 0 && i + 1 < argc) {
            strategy_name = argv[++i];
        } else if (std::strcmp(argv[i], "--fingerprint") == 0 && i + 1 < argc) {
            fingerprint_name = argv[++i];
        } else if (std::strcmp(argv[i], "--explain") == 0) {
            explain = true;
        } else if (std::strcmp(argv[i], "--metrics") == 0) {
            metrics = true;
        } else if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = culturerank::Config::load();

    // Override config with CLI args
    if (!strategy_name.empty()) {
        auto parsed = culturerank::parse_strategy(strategy_name);
        if (!parsed || *parsed == culturerank::Strategy::None) {
            std::cerr << "Error: unknown strategy '" << strategy_name << "'\n";
            return 1;
        }
        config.params.strategy = *parsed;
    }
    if (!fingerprint_name.empty()) {
        auto parsed = culturerank::parse_hash_algorithm(fingerprint_name);
        if (!parsed) {
            std::cerr << "Error: unknown fingerprint '" << fingerprint_name << "'\n";
            return 1;
        }
        config.fingerprint = *parsed;
    }

    std::string raw;
    if (input_path.empty()) {
        raw.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        raw = culturerank::read_file(input_path);
    }

    auto request = culturerank::request_from_json(nlohmann::json::parse(raw));

    auto policy = config.surface_policy();
    culturerank::Ranker ranker(config, policy);
    auto response = ranker.rank(request);

    auto out = culturerank::response_to_json(response);
    if (explain) add_explanations(out, response);
    if (metrics) add_metrics(out, request, response);

    std::string text = out.dump(pretty ? 2 : -1) + "\n";
    if (output_path.empty()) {
        std::cout << text;
    } else if (!culturerank::atomic_write_file(output_path, text)) {
        std::cerr << "Error: cannot write " << output_path << "\n";
        return 1;
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
