#pragma once

#include "natlib/core/data.hpp"
#include "natlib/core/ialgorithm.hpp"
#include "natlib/mh/rga.hpp"
#include "natlib/mh/de.hpp"
#include "natlib/mh/pso.hpp"
#include "natlib/mh/fa.hpp"
#include "natlib/mh/tlbo.hpp"

namespace natlib::utils {

    //--------------------------------------------------------------------------
    // Struct: TRunConfig
    // Description: Contents of a YAML run file. Keys that are absent keep the
    // defaults below.
    //--------------------------------------------------------------------------
    struct TRunConfig
    {
        std::string algorithm = "DE";           // RGA | DE | PSO | FA | TLBO
        core::TRunData runData;                 // pop_num, seed, pareto_limit, parallel, debug
        std::uint64_t maxGen = 200;             // generations of the MaxGen task

        mh::TRgaSettings rga;
        mh::TDeSettings de;
        mh::TPsoSettings pso;
        mh::TFaSettings fa;
    };

    // names accepted by the `algorithm` key
    const std::vector<std::string>& AlgorithmNames();

    /**
     * Method: LoadRunConfig
     * Description: Reads a run file with yaml-cpp. Missing files, syntax
     * errors, unknown algorithms and out-of-range values throw
     * ConfigurationError.
     */
    TRunConfig LoadRunConfig(const std::string& path);

    // same as LoadRunConfig, from a YAML document held in memory
    TRunConfig ParseRunConfig(const std::string& text);

    // variant named by cfg.algorithm, with its settings
    std::unique_ptr<core::IAlgorithm> CreateAlgorithm(const TRunConfig& cfg);

} // namespace natlib::utils
