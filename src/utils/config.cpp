#include "natlib/utils/config.hpp"
#include "natlib/core/errors.hpp"

#include <yaml-cpp/yaml.h>
#include <cctype>

namespace natlib::utils {

    using namespace natlib::core;

    const std::vector<std::string>& AlgorithmNames()
    {
        static const std::vector<std::string> names = {"RGA", "DE", "PSO", "FA", "TLBO"};
        return names;
    }

    static std::string uppercase(std::string s)
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    // -----------------------------------------------------------------------------
    // Value checks
    // -----------------------------------------------------------------------------

    static void checkRate(double v, const std::string& key)
    {
        if (!(v >= 0.0 && v <= 1.0))
            throw ConfigurationError(std::format("Run file: {} must be in [0, 1], got {}", key, v));
    }

    static void checkPositive(double v, const std::string& key)
    {
        if (!(v > 0.0))
            throw ConfigurationError(std::format("Run file: {} must be positive, got {}", key, v));
    }

    static std::uint64_t readCount(const YAML::Node& node, const std::string& key, long long min)
    {
        const long long v = node.as<long long>();
        if (v < min)
            throw ConfigurationError(std::format("Run file: {} must be at least {}, got {}", key, min, v));
        return static_cast<std::uint64_t>(v);
    }

    template<class T>
    static void readValue(const YAML::Node& parent, const char* key, T& out)
    {
        if (parent[key]) out = parent[key].as<T>();
    }

    // -----------------------------------------------------------------------------
    // Document
    // -----------------------------------------------------------------------------

    static TRunConfig ReadRunConfig(const YAML::Node& root)
    {
        TRunConfig cfg;
        if (root.IsNull()) return cfg;

        if (!root.IsMap()) throw ConfigurationError("Run file: expected a map at the top level");

        if (root["algorithm"]) cfg.algorithm = uppercase(root["algorithm"].as<std::string>());
        if (std::ranges::find(AlgorithmNames(), cfg.algorithm) == AlgorithmNames().end())
            throw ConfigurationError(std::format("Run file: unknown algorithm '{}'", cfg.algorithm));

        if (root["pop_num"]) cfg.runData.popNum = readCount(root["pop_num"], "pop_num", 0);
        if (root["max_gen"]) cfg.maxGen = readCount(root["max_gen"], "max_gen", 0);
        if (root["pareto_limit"]) cfg.runData.paretoLimit = readCount(root["pareto_limit"], "pareto_limit", 1);
        if (root["seed"]) {
            cfg.runData.seed = readCount(root["seed"], "seed", 0);
            cfg.runData.hasSeed = true;
        }
        readValue(root, "parallel", cfg.runData.parallel);
        readValue(root, "debug", cfg.runData.debug);

        if (const YAML::Node node = root["RGA"]) {
            readValue(node, "cross", cfg.rga.cross);
            readValue(node, "mutate", cfg.rga.mutate);
            readValue(node, "win", cfg.rga.win);
            readValue(node, "delta", cfg.rga.delta);
            readValue(node, "horizon", cfg.rga.horizon);
            checkRate(cfg.rga.cross, "RGA.cross");
            checkRate(cfg.rga.mutate, "RGA.mutate");
            checkRate(cfg.rga.win, "RGA.win");
            checkPositive(cfg.rga.delta, "RGA.delta");
            checkPositive(cfg.rga.horizon, "RGA.horizon");
        }

        if (const YAML::Node node = root["DE"]) {
            if (node["strategy"]) cfg.de.strategy = mh::ParseDeStrategy(node["strategy"].as<std::string>());
            if (node["crossover"]) cfg.de.crossover = mh::ParseDeCrossover(node["crossover"].as<std::string>());
            readValue(node, "f", cfg.de.f);
            readValue(node, "cr", cfg.de.cr);
            checkPositive(cfg.de.f, "DE.f");
            checkRate(cfg.de.cr, "DE.cr");
        }

        if (const YAML::Node node = root["PSO"]) {
            readValue(node, "cognition", cfg.pso.cognition);
            readValue(node, "social", cfg.pso.social);
            readValue(node, "velocity", cfg.pso.velocity);
            readValue(node, "vmax", cfg.pso.vmax);
            checkPositive(cfg.pso.vmax, "PSO.vmax");
        }

        if (const YAML::Node node = root["FA"]) {
            readValue(node, "alpha", cfg.fa.alpha);
            readValue(node, "beta_min", cfg.fa.betaMin);
            readValue(node, "gamma", cfg.fa.gamma);
            checkRate(cfg.fa.betaMin, "FA.beta_min");
            if (cfg.fa.alpha < 0.0 || cfg.fa.gamma < 0.0)
                throw ConfigurationError("Run file: FA.alpha and FA.gamma must not be negative");
        }

        return cfg;
    }

    TRunConfig LoadRunConfig(const std::string& path)
    {
        try {
            return ReadRunConfig(YAML::LoadFile(path));
        } catch (const YAML::BadFile&) {
            throw ConfigurationError(std::format("Unable to open the run file {}", path));
        } catch (const YAML::ParserException& e) {
            throw ConfigurationError(std::format("Syntax error in {}: {}", path, e.what()));
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::format("Invalid value in {}: {}", path, e.what()));
        }
    }

    TRunConfig ParseRunConfig(const std::string& text)
    {
        try {
            return ReadRunConfig(YAML::Load(text));
        } catch (const YAML::ParserException& e) {
            throw ConfigurationError(std::format("Syntax error in the run configuration: {}", e.what()));
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::format("Invalid value in the run configuration: {}", e.what()));
        }
    }

    std::unique_ptr<IAlgorithm> CreateAlgorithm(const TRunConfig& cfg)
    {
        const std::string name = uppercase(cfg.algorithm);

        if (name == "RGA") return std::make_unique<mh::Rga>(cfg.rga);
        if (name == "DE") return std::make_unique<mh::De>(cfg.de);
        if (name == "PSO") return std::make_unique<mh::Pso>(cfg.pso);
        if (name == "FA") return std::make_unique<mh::Fa>(cfg.fa);
        if (name == "TLBO") return std::make_unique<mh::Tlbo>();

        throw ConfigurationError(std::format("Unknown algorithm '{}'", cfg.algorithm));
    }

} // namespace natlib::utils
