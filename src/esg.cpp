#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <Eigen/Dense>

#include <cmath>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <esg/any_model.hpp>
#include <esg/copula.hpp>
#include <esg/correlated.hpp>
#include <esg/correlation_csv.hpp>
#include <esg/random.hpp>
#include <esg/scenario_generator.hpp>
#include <esg/stats.hpp>

namespace {

struct ModelOptions {
    std::string name = "bsm";
    double a = 0.136;
    double b = 0.0168;
    double sigma = 0.15;
    double initial = 100.0;
    bool initial_given = false;
    double rate = 0.01;
    double dividend = 0.02;
    double gamma = 1.0;
};

esg::AnyModel make_model(const ModelOptions& opts) {
    constexpr double kDefaultShortRate = 0.01;
    const double short_rate = opts.initial_given ? opts.initial : kDefaultShortRate;
    if (opts.name == "vasicek") {
        return esg::Vasicek{.a = opts.a, .b = opts.b, .sigma = opts.sigma, .initial = short_rate};
    }
    if (opts.name == "cir") {
        return esg::CoxIngersollRoss{.a = opts.a, .b = opts.b, .sigma = opts.sigma, .initial = short_rate};
    }
    if (opts.name == "cev") {
        return esg::ConstantElasticityOfVariance{.rate = opts.rate,
                                                 .dividend_yield = opts.dividend,
                                                 .sigma = opts.sigma,
                                                 .gamma = opts.gamma,
                                                 .initial = opts.initial};
    }
    return esg::BlackScholesMerton{.rate = opts.rate,
                                   .dividend_yield = opts.dividend,
                                   .sigma = opts.sigma,
                                   .initial = opts.initial};
}

std::shared_ptr<const esg::Copula> make_copula(const std::string& kind,
                                               const Eigen::MatrixXd& correlation,
                                               double dof) {
    if (kind == "student-t") {
        return std::make_shared<esg::StudentTCopula>(correlation, dof);
    }
    if (kind == "independence") {
        return std::make_shared<esg::IndependenceCopula>(static_cast<std::size_t>(correlation.rows()));
    }
    return std::make_shared<esg::GaussianCopula>(correlation);
}

void log_summary(const std::string& label, const std::vector<double>& terminal) {
    const double mean = esg::sample_mean(terminal);
    const auto q = esg::sample_quantiles(terminal, {0.05, 0.50, 0.95});
    spdlog::info("{:>14} | mean={:>12.6f} | p05={:>12.6f} | p50={:>12.6f} | p95={:>12.6f}",
                 label, mean, q[0], q[1], q[2]);
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"esg - economic scenario generator"};

    ModelOptions model_opts;
    double timestep = 1.0;
    double endtime = 30.0;
    int paths = 1000;
    std::uint64_t seed = 1;
    std::string log_level = "info";
    double correlation = 0.0;
    std::string correlation_csv;
    std::string copula_kind = "gaussian";
    double dof = 4.0;

    const std::map<std::string, std::string> models{
        {"vasicek", "vasicek"}, {"cir", "cir"}, {"bsm", "bsm"}, {"cev", "cev"}};
    const std::map<std::string, std::string> copulas{
        {"gaussian", "gaussian"}, {"student-t", "student-t"}, {"independence", "independence"}};

    app.add_option("--model", model_opts.name, "Economic model")
        ->transform(CLI::CheckedTransformer(models, CLI::ignore_case))
        ->default_val(model_opts.name);
    app.add_option("--a", model_opts.a, "Mean-reversion speed (rate models)")->default_val(model_opts.a);
    app.add_option("--b", model_opts.b, "Long-run mean (rate models)")->default_val(model_opts.b);
    app.add_option("--sigma", model_opts.sigma, "Volatility")->default_val(model_opts.sigma);
    auto* initial_opt = app.add_option("--initial", model_opts.initial, "Initial rate (default 0.01) or price (default 100)");
    app.add_option("--rate", model_opts.rate, "Risk-free rate (equity models)")->default_val(model_opts.rate);
    app.add_option("--dividend", model_opts.dividend, "Dividend yield (equity models)")->default_val(model_opts.dividend);
    app.add_option("--gamma", model_opts.gamma, "CEV elasticity")->default_val(model_opts.gamma);
    app.add_option("--timestep", timestep, "Grid step in years")->default_val(timestep)->check(CLI::PositiveNumber);
    app.add_option("--endtime", endtime, "Projection horizon in years")->default_val(endtime)->check(CLI::NonNegativeNumber);
    app.add_option("--paths", paths, "Number of traversals")->default_val(paths)->check(CLI::PositiveNumber);
    app.add_option("--seed", seed, "Random source seed")->default_val(seed);
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error or off")->default_val(log_level);

    auto* rho_opt = app.add_option("--correlation", correlation, "Pairwise correlation of two coupled paths")
                        ->check(CLI::Range(-1.0, 1.0));
    auto* csv_opt = app.add_option("--correlation-csv", correlation_csv, "Square correlation matrix CSV")
                        ->check(CLI::ExistingFile);
    rho_opt->excludes(csv_opt);
    app.add_option("--copula", copula_kind, "Copula coupling the paths")
        ->transform(CLI::CheckedTransformer(copulas, CLI::ignore_case))
        ->default_val(copula_kind);
    app.add_option("--dof", dof, "Student-t degrees of freedom")->default_val(dof)->check(CLI::PositiveNumber);

    try {
        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(spdlog::level::from_str(log_level));
        model_opts.initial_given = initial_opt->count() > 0;

        const auto rng = esg::make_random_source(seed);
        const esg::AnyModel model = make_model(model_opts);
        esg::validate(model);
        const esg::ScenarioGenerator<esg::AnyModel> generator(timestep, endtime, model, rng);

        spdlog::info("Model {} on {} grid points (timestep={}, endtime={}), {} traversals, seed {}.",
                     esg::model_name(generator.model()),
                     generator.length(),
                     timestep,
                     endtime,
                     paths,
                     seed);

        const bool correlated_mode = rho_opt->count() > 0 || csv_opt->count() > 0;
        if (!correlated_mode) {
            std::vector<double> terminal;
            terminal.reserve(static_cast<std::size_t>(paths));
            for (int p = 0; p < paths; ++p) {
                terminal.push_back(generator.collect().back());
            }
            log_summary("terminal", terminal);
            return 0;
        }

        Eigen::MatrixXd corr;
        if (csv_opt->count() > 0) {
            if (!esg::load_correlation_csv(correlation_csv, corr)) {
                return 1;
            }
        } else {
            corr = Eigen::MatrixXd::Identity(2, 2);
            corr(0, 1) = correlation;
            corr(1, 0) = correlation;
        }

        const auto copula = make_copula(copula_kind, corr, dof);
        const std::vector<esg::ScenarioGenerator<esg::AnyModel>> members(copula->dimension(), generator);
        const esg::Correlated<esg::AnyModel> group(members, copula, rng);

        if (group.steps() == 0) {
            spdlog::error("Correlated mode needs at least one step after t=0");
            return 1;
        }

        std::vector<std::vector<double>> terminal(group.length());
        for (int p = 0; p < paths; ++p) {
            std::size_t n = 0;
            for (const auto& path : group) {
                terminal[n++].push_back(path.back());
            }
        }

        spdlog::info("==================== Terminal values ({} copula) ====================", copula_kind);
        for (std::size_t n = 0; n < terminal.size(); ++n) {
            log_summary(fmt::format("path {}", n), terminal[n]);
        }
        if (terminal.size() >= 2 && paths >= 2) {
            spdlog::info("Sample correlation of terminal values (path 0, path 1): {:.4f}",
                         esg::sample_correlation(terminal[0], terminal[1]));
        }
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("Failed to generate scenarios: {}", ex.what());
        return 1;
    }

    return 0;
}
