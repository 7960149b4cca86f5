#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "executor/pipeline.hpp"
#include "executor/request_config.hpp"
#include "sandbox/sandbox.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codebubble options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("language", po::value<string>(), "language of the source code, python or cpp. Overrides the language section of the configuration file")
        ("source", po::value<string>()->required(), "path of the source code file")
        ("input", po::value<vector<string>>(), "path of an input file, can be repeated. Without any, one input is read from stdin")
        ("config", po::value<string>(), "json configuration file with sandbox, limits and language sections")
        ("workspace", po::value<string>(), "set the host directory owned by the sandbox. You can either pass it from environ BUBBLE_WORKSPACE")
        ("time-limit", po::value<double>(), "set time limit in seconds for each input, default to 5")
        ("overall-time-limit", po::value<double>(), "set time limit in seconds for all inputs together, default to 30")
        ("memory-limit", po::value<int64_t>(), "set memory limit in KB, default to 262144(256MB)")
        ("max-input-size", po::value<int64_t>(), "set maximum size of one input in KB, default to 2048(2MB)")
        ("max-output-size", po::value<int64_t>(), "set maximum size of stdout and stderr in KB, default to 2048(2MB)")
        ("debug", "turn on the debug mode, the workspace is kept after the request to check the files produced by the program.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "codebubble: Run source code against inputs in a bubblewrap sandbox" << endl
                 << "Prints one json result per input" << endl
                 << "Optional Environment Variables:" << endl
                 << "\tBUBBLE_WORKSPACE: host directory owned by the sandbox" << endl
                 << "\tBUBBLE_BWRAP: location of bwrap" << endl
                 << "Usage: " << argv[0] << " [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "codebubble " << bubble::VERSION << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        bubble::DEBUG = true;
    }

    bubble::request_config config;
    bubble::execution_request request;
    unique_ptr<bubble::language> lang;
    unique_ptr<bubble::sandbox> box;

    try {
        if (vm.count("config"))
            config = bubble::load_request_config(vm.at("config").as<string>());

        if (vm.count("workspace")) {
            config.sandbox.workspace = vm.at("workspace").as<string>();
        } else if (getenv("BUBBLE_WORKSPACE")) {
            config.sandbox.workspace = bubble::get_env("BUBBLE_WORKSPACE", "");
        }

        if (getenv("BUBBLE_BWRAP"))
            config.sandbox.bwrap_path = bubble::get_env("BUBBLE_BWRAP", "");

        if (vm.count("time-limit"))
            config.limits.time_limit = vm.at("time-limit").as<double>();
        if (vm.count("overall-time-limit"))
            config.limits.overall_time_limit = vm.at("overall-time-limit").as<double>();
        if (vm.count("memory-limit"))
            config.limits.memory_limit = vm.at("memory-limit").as<int64_t>();
        if (vm.count("max-input-size"))
            config.limits.max_input_size = vm.at("max-input-size").as<int64_t>();
        if (vm.count("max-output-size"))
            config.limits.max_output_size = vm.at("max-output-size").as<int64_t>();
        config.limits.validate();

        if (vm.count("language")) {
            if (!config.language.is_object()) config.language = nlohmann::json::object();
            config.language["language"] = vm.at("language").as<string>();
        }
        if (config.language.is_null())
            throw bubble::config_error("no language given, pass --language or a language section in --config");
        lang = bubble::make_language(config.language);

        request.source_code = bubble::read_file_content(vm.at("source").as<string>());
        request.limits = config.limits;
        if (vm.count("input")) {
            for (auto& input : vm.at("input").as<vector<string>>())
                request.inputs.push_back(bubble::read_file_content(input));
        } else {
            request.inputs.emplace_back(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        }

        box = make_unique<bubble::bwrap_sandbox>(config.sandbox);
    } catch (bubble::config_error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to prepare the request: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    CHECK(box && lang);
    bubble::execution_pipeline pipeline(*box, *lang);
    vector<bubble::execution_result> results = pipeline.run(request);

    nlohmann::json output = results;
    cout << output.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    return EXIT_SUCCESS;
}
