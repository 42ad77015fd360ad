#include <getopt.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include <easylogging++.h>

#include "yamlsort/yamlsort.hpp"

INITIALIZE_EASYLOGGINGPP

namespace {

    struct CliOptions {
        std::string input_file;
        std::string output_file;
        bool quote_strings = false;
        bool verbose = false;
        std::size_t max_depth = 1000;
    };

    // stdout carries the sorted documents, so every log record goes to stderr.
    class StderrDispatch : public el::LogDispatchCallback {
    protected:
        void handle(const el::LogDispatchData* data) override {
            if (data->dispatchAction() != el::base::DispatchAction::NormalLog) return;
            const el::LogMessage* msg = data->logMessage();
            std::cerr << msg->logger()->logBuilder()->build(msg, true);
        }
    };

    void init_logging(bool verbose) {
        el::Configurations conf;
        conf.setToDefault();
        conf.setGlobally(el::ConfigurationType::Format, "yamlsort: %level: %msg");
        conf.setGlobally(el::ConfigurationType::ToFile, "false");
        conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
        conf.set(el::Level::Info, el::ConfigurationType::Enabled, verbose ? "true" : "false");
        conf.set(el::Level::Debug, el::ConfigurationType::Enabled, verbose ? "true" : "false");
        el::Loggers::reconfigureAllLoggers(conf);
        el::Loggers::addFlag(el::LoggingFlag::DisableApplicationAbortOnFatalLog);
        el::Helpers::installLogDispatchCallback<StderrDispatch>("StderrDispatch");
    }

    void print_help(const std::string& app_name) {
        std::cerr << std::endl << "Usage: " << app_name << " [OPTIONS]" << std::endl << std::endl;
        std::cerr << "  Read YAML from stdin or a file and write it back with mapping keys sorted" << std::endl;
        std::cerr << "  (\"name\" first) to stdout or a file." << std::endl << std::endl;
        std::cerr << "  Options:" << std::endl;
        std::cerr << "   -h --help                    Print this help" << std::endl;
        std::cerr << "   -i --input-file  filename    Read YAML from the file instead of stdin" << std::endl;
        std::cerr << "   -o --output-file filename    Write output to the file instead of stdout" << std::endl;
        std::cerr << "   -q --quote-string            Always double-quote string values" << std::endl;
        std::cerr << "   -d --max-depth   N           Maximum nesting depth (0 = unlimited, default 1000)" << std::endl;
        std::cerr << "   -v --verbose                 Log progress to stderr" << std::endl;
        std::cerr << std::endl;
    }

    bool read_input(const CliOptions& opts, std::string& out) {
        std::ostringstream buffer;
        if (opts.input_file.empty()) {
            buffer << std::cin.rdbuf();
            if (std::cin.bad()) {
                LOG(ERROR) << "Failed to read standard input";
                return false;
            }
        } else {
            std::ifstream ifs(opts.input_file, std::ios::binary);
            if (!ifs) {
                LOG(ERROR) << "Cannot open input file: " << opts.input_file << ": " << std::strerror(errno);
                return false;
            }
            buffer << ifs.rdbuf();
            if (ifs.bad()) {
                LOG(ERROR) << "Failed to read input file: " << opts.input_file;
                return false;
            }
        }
        out = buffer.str();
        LOG(DEBUG) << "Read " << out.size() << " bytes from "
                   << (opts.input_file.empty() ? std::string{ "<stdin>" } : opts.input_file);
        return true;
    }

    const char* describe(yamlsort::DocumentError::code c) {
        switch (c) {
        case yamlsort::DocumentError::code::load_failed: return "Parse error";
        case yamlsort::DocumentError::code::emit_failed: return "Emit error";
        case yamlsort::DocumentError::code::io_failed: return "Write error";
        }
        return "Error";
    }

    bool report(const yamlsort::SortResult& r) {
        if (r) {
            LOG(DEBUG) << "Wrote " << *r << " document(s)";
            return true;
        }
        const auto& err = r.error();
        if (err.document == 0) {
            LOG(ERROR) << describe(err.errc) << ": " << err.msg;
        } else {
            LOG(ERROR) << describe(err.errc) << " in document " << err.document << ": " << err.msg;
        }
        return false;
    }

    bool run(const CliOptions& opts) {
        std::string input;
        if (!read_input(opts, input)) return false;

        yamlsort::LoadOptions load_opts{ .max_depth = opts.max_depth };
        yamlsort::EmitOptions emit_opts{ .quote_strings = opts.quote_strings };

        if (opts.output_file.empty()) {
            return report(yamlsort::sort_documents(input, std::cout, load_opts, emit_opts));
        }

        // Writing to the file being read would truncate it before it rendered.
        bool buffered = yamlsort::same_file(opts.input_file, opts.output_file);
        if (buffered) {
            LOG(INFO) << "Output file is the input file, buffering output";
        }
        return report(yamlsort::sort_to_file(input, opts.output_file, buffered, load_opts, emit_opts));
    }

} // namespace

int
main(int argc, char* argv[]) {
    static struct option long_options[] = {{"input-file", required_argument, 0, 'i'},
                                           {"output-file", required_argument, 0, 'o'},
                                           {"quote-string", no_argument, 0, 'q'},
                                           {"max-depth", required_argument, 0, 'd'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"help", no_argument, 0, 'h'},
                                           {NULL, 0, 0, 0}};

    int option_index = 0;
    CliOptions opts;
    std::string app_name = argv[0];

    int value;
    while ((value = getopt_long(argc, argv, "i:o:qd:vh", long_options, &option_index)) != -1) {
        switch (value) {
            case 'i':
                opts.input_file = optarg;
                break;
            case 'o':
                opts.output_file = optarg;
                break;
            case 'q':
                opts.quote_strings = true;
                break;
            case 'd': {
                std::string_view arg{ optarg };
                auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), opts.max_depth);
                if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
                    std::cerr << app_name << ": invalid --max-depth value: " << arg << std::endl;
                    print_help(app_name);
                    return EXIT_FAILURE;
                }
                break;
            }
            case 'v':
                opts.verbose = true;
                break;
            case 'h':
                print_help(app_name);
                return EXIT_SUCCESS;
            case '?':
            default:
                print_help(app_name);
                return EXIT_FAILURE;
        }
    }

    if (optind < argc) {
        std::cerr << app_name << ": unexpected argument: " << argv[optind] << std::endl;
        print_help(app_name);
        return EXIT_FAILURE;
    }

    init_logging(opts.verbose);

    return run(opts) ? EXIT_SUCCESS : EXIT_FAILURE;
}
