#include <iostream>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <variant>
#include "dispatch.hpp"
#include "logger.hpp"
#include "tax_tables.hpp"
#include "io/json_writer.hpp"
#include "io/profile_loader.hpp"

namespace {

struct CLIArgs {
    std::string profile_path;
    std::string alternate_path;            // Compare against this profile
    std::string comparison_name = "Comparison";
    bool quick = false;
    int quick_years = lifeplan::DEFAULT_QUICK_YEARS;
    std::string federal_tax_path;          // Replaces the built-in federal tables
    std::string state_tax_path;            // Replaces the built-in state table
    std::string output_path;
    bool compact = false;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LifePlan Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --profile <path> [options]\n\n";
    std::cerr << "Projection options:\n";
    std::cerr << "  --profile <path>            JSON profile to project\n";
    std::cerr << "  --quick [years]             Truncate the projection (default: 10 years)\n\n";
    std::cerr << "Comparison options:\n";
    std::cerr << "  --alternate <path>          JSON profile compared against --profile\n";
    std::cerr << "  --name <text>               Comparison name (default: Comparison)\n\n";
    std::cerr << "Tax table options:\n";
    std::cerr << "  --federal-tax <path>        CSV federal tables (year,filing_status,kind,threshold,limit,rate)\n";
    std::cerr << "  --state-tax <path>          CSV state table (code,name,kind,rate,standard_deduction)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Single-line JSON\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to this file\n";
    std::cerr << "  --log-text                  Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Full projection:\n";
    std::cerr << "     " << program_name << " --profile data/profile.json --output trajectory.json\n\n";
    std::cerr << "  2. Ten-year comparison of a higher 401(k) contribution:\n";
    std::cerr << "     " << program_name << " --profile data/profile.json \\\n";
    std::cerr << "         --alternate data/profile_max_401k.json \\\n";
    std::cerr << "         --quick 10 --name \"Max 401(k)\"\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--profile" && i + 1 < argc) {
            args.profile_path = argv[++i];
        } else if (arg == "--alternate" && i + 1 < argc) {
            args.alternate_path = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            args.comparison_name = argv[++i];
        } else if (arg == "--quick") {
            args.quick = true;
            if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                try {
                    args.quick_years = std::stoi(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Error: --quick expects a number of years, got: " << argv[i] << "\n\n";
                    return false;
                }
            }
        } else if (arg == "--federal-tax" && i + 1 < argc) {
            args.federal_tax_path = argv[++i];
        } else if (arg == "--state-tax" && i + 1 < argc) {
            args.state_tax_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.profile_path.empty()) {
        std::cerr << "Error: --profile is required\n";
        valid = false;
    } else if (!file_exists(args.profile_path)) {
        std::cerr << "Error: Profile file not found: " << args.profile_path << "\n";
        valid = false;
    }

    if (!args.alternate_path.empty() && !file_exists(args.alternate_path)) {
        std::cerr << "Error: Alternate profile file not found: " << args.alternate_path << "\n";
        valid = false;
    }

    if (!args.federal_tax_path.empty() && !file_exists(args.federal_tax_path)) {
        std::cerr << "Error: Federal tax file not found: " << args.federal_tax_path << "\n";
        valid = false;
    }

    if (!args.state_tax_path.empty() && !file_exists(args.state_tax_path)) {
        std::cerr << "Error: State tax file not found: " << args.state_tax_path << "\n";
        valid = false;
    }

    if (args.quick && args.quick_years < 1) {
        std::cerr << "Error: --quick years must be at least 1\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

lifeplan::TaxTables load_tax_tables(const CLIArgs& args) {
    lifeplan::Logger& logger = lifeplan::Logger::get_instance();
    lifeplan::RunContext ctx("cli", "load_tables");

    lifeplan::TaxTables tables = lifeplan::TaxTables::builtin();
    if (!args.federal_tax_path.empty()) {
        tables.federal = lifeplan::FederalTaxSchedule::load_from_csv(args.federal_tax_path);
        logger.log_tables_loaded(ctx, args.federal_tax_path, tables.federal.size());
    }
    if (!args.state_tax_path.empty()) {
        tables.states = lifeplan::StateTaxTable::load_from_csv(args.state_tax_path);
        logger.log_tables_loaded(ctx, args.state_tax_path, tables.states.size());
    }
    return tables;
}

lifeplan::Request build_generate_request(const lifeplan::Profile& profile, const CLIArgs& args) {
    if (args.quick) {
        lifeplan::GenerateQuickRequest request;
        request.profile = profile;
        request.years = args.quick_years;
        return request;
    }
    lifeplan::GenerateRequest request;
    request.profile = profile;
    return request;
}

// Unwrap a trajectory response; error responses become exceptions
lifeplan::Trajectory expect_trajectory(lifeplan::Response response) {
    if (auto* error = std::get_if<lifeplan::ErrorResponse>(&response)) {
        throw std::runtime_error(error->message);
    }
    return std::get<lifeplan::TrajectoryResponse>(std::move(response)).trajectory;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    lifeplan::LoggerConfig log_config;
    log_config.min_level = lifeplan::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    lifeplan::Logger& logger = lifeplan::Logger::get_instance();
    logger.configure(log_config);

    try {
        lifeplan::TaxTables tables = load_tax_tables(args);

        lifeplan::Profile baseline_profile = lifeplan::io::load_profile_json(args.profile_path);
        lifeplan::Trajectory baseline =
            expect_trajectory(lifeplan::handle_request(build_generate_request(baseline_profile, args), tables));

        if (args.alternate_path.empty()) {
            if (args.output_path.empty()) {
                lifeplan::io::write_trajectory_json(std::cout, baseline, !args.compact);
            } else {
                lifeplan::io::write_trajectory_json(args.output_path, baseline, !args.compact);
            }
            logger.flush();
            return 0;
        }

        lifeplan::Profile alternate_profile = lifeplan::io::load_profile_json(args.alternate_path);
        lifeplan::Trajectory alternate =
            expect_trajectory(lifeplan::handle_request(build_generate_request(alternate_profile, args), tables));

        lifeplan::CompareRequest compare;
        compare.baseline = std::move(baseline);
        compare.alternate = std::move(alternate);
        compare.name = args.comparison_name;

        lifeplan::Response response = lifeplan::handle_request(compare, tables);
        if (auto* error = std::get_if<lifeplan::ErrorResponse>(&response)) {
            throw std::runtime_error(error->message);
        }
        const lifeplan::Comparison& comparison = std::get<lifeplan::ComparisonResponse>(response).comparison;

        if (args.output_path.empty()) {
            lifeplan::io::write_comparison_json(std::cout, comparison, !args.compact);
        } else {
            lifeplan::io::write_comparison_json(args.output_path, comparison, !args.compact);
        }
        std::cerr << comparison.summary.key_insight << "\n";

    } catch (const std::exception& e) {
        logger.log_error(lifeplan::RunContext("cli", "main"), e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    logger.flush();
    return 0;
}
