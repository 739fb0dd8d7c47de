/// how to use:
/// ./defense_comparison --seed 42 --rounds 100 --stealth 0.8 --non_iid 0.5
/// runs every stiffness/clustering combination with the same seed and prints acceptance rates

#include <iostream>
#include <iomanip>
#include <stdexcept>

#include <glog/logging.h>
#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include <fedshield.hpp>

using model_datatype = double;

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);

    fedshield::simulation_config config;
    int rounds;
    int warmup_rounds;
    bool no_momentum_fim = false;
    boost::program_options::options_description desc("allowed options");
    desc.add_options()
            ("help,h", "produce help message")
            ("seed", boost::program_options::value<uint32_t>(&config.seed)->default_value(42), "random seed")
            ("rounds,r", boost::program_options::value<int>(&rounds)->default_value(100), "rounds per combination")
            ("warmup,w", boost::program_options::value<int>(&warmup_rounds)->default_value(0), "rounds excluded from the acceptance counts")
            ("stealth,s", boost::program_options::value<double>(&config.attack_stealth)->default_value(0.6), "attack stealth [0,0.9]")
            ("non_iid,n", boost::program_options::value<double>(&config.non_iid_level)->default_value(0.5), "non-IID level [0,2]")
            ("clients,c", boost::program_options::value<size_t>(&config.client_count)->default_value(20), "client count")
            ("malicious_ratio,m", boost::program_options::value<double>(&config.malicious_ratio)->default_value(0.2), "malicious ratio [0,1]")
            ("dimension,d", boost::program_options::value<size_t>(&config.vector_dimension)->default_value(20), "gradient dimension, at least 5")
            ("threads,t", boost::program_options::value<size_t>(&config.detection_worker_threads)->default_value(1), "detection worker threads")
            ("no_momentum_fim", "disable the momentum importance update")
            ;
    boost::program_options::variables_map vm;
    try
    {
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc), vm);
        boost::program_options::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (vm.count("help"))
    {
        std::cout << desc << std::endl;
        return 1;
    }
    if (vm.count("no_momentum_fim")) no_momentum_fim = true;
    config.momentum_fim_enabled = !no_momentum_fim;

    if (rounds < 1 || warmup_rounds < 0 || warmup_rounds >= rounds)
    {
        std::cerr << "rounds must be positive and warmup must be in [0, rounds)" << std::endl;
        return 1;
    }
    {
        auto [status, message] = config.validate();
        if (status != fedshield::config_status::success)
        {
            std::cerr << "invalid configuration: " << message << std::endl;
            return 1;
        }
    }

    LOG(INFO) << "defense comparison: " << config.to_json().dump() << ", rounds: " << rounds << ", warmup: " << warmup_rounds;
    const auto results = fedshield::compare_defenses<model_datatype>(config, rounds, warmup_rounds + 1);

    std::cout << std::left << std::setw(32) << "defense" << std::setw(14) << "malicious_acc" << std::setw(14) << "benign_acc" << std::setw(12) << "accuracy" << "asr" << std::endl;
    for (const auto& result : results)
    {
        std::cout << std::left << std::setw(32) << result.get_name()
                  << std::setw(14) << (boost::format("%.3f") % result.malicious_acceptance_rate()).str()
                  << std::setw(14) << (boost::format("%.3f") % result.benign_acceptance_rate()).str()
                  << std::setw(12) << (boost::format("%.3f") % result.final_accuracy).str()
                  << (boost::format("%.3f") % result.final_attack_success_rate).str() << std::endl;
        LOG(INFO) << result.get_name() << ": malicious acceptance " << result.malicious_acceptance_rate() << ", benign acceptance " << result.benign_acceptance_rate();
    }
    return 0;
}
