#include "tagattest/sdk/CommandLine.hpp"
#include "tagattest/sdk/AnchorSubmitter.hpp"
#include "tagattest/sdk/AnchoringClient.hpp"
#include "tagattest/sdk/BatchAttester.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/LeafEncoder.hpp"
#include "tagattest/sdk/ProofVerifier.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include "tagattest/sdk/ThreadPool.hpp"
#include "tagattest/sdk/version.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <getopt.h>
#include <stdexcept>

namespace tagattest {
namespace sdk {

namespace {

void init_logger(const AttestConfig& config) {
    auto level = SecureLogger::parse_level(config.log_level).value_or(SecureLogger::LogLevel::INFO);
    SecureLogger::instance().initialize(config.log_path, level);
}

} // namespace

Result<BatchInput> read_batch(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        SecureLogger::instance().error("Cannot open batch file: " + path);
        return ErrorCode::NOT_FOUND;
    }

    BatchInput input;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto tab = line.find('\t');
        if (tab == std::string::npos || tab == 0) {
            SecureLogger::instance().error(path + ":" + std::to_string(line_number) + ": expected key<TAB>data");
            return ErrorCode::INVALID_PARAMETER;
        }

        input.keys.push_back(line.substr(0, tab));
        input.leaves.push_back(LeafEncoder::encode(line.substr(tab + 1)));
    }

    return input;
}

Result<MerkleProof> read_proof(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        SecureLogger::instance().error("Cannot open proof file: " + path);
        return ErrorCode::NOT_FOUND;
    }

    boost::property_tree::ptree document;
    try {
        boost::property_tree::read_json(file, document);
    } catch (const boost::property_tree::json_parser_error& e) {
        SecureLogger::instance().error("Proof file is not valid JSON: " + std::string(e.what()));
        return ErrorCode::MALFORMED_PROOF;
    }

    if (auto inner = document.get_child_optional("proof")) {
        return MerkleProof::from_ptree(*inner);
    }
    return MerkleProof::from_ptree(document);
}

int exit_code_for(ErrorCode error) {
    switch (error) {
        case ErrorCode::EMPTY_BATCH:
        case ErrorCode::KEY_COUNT_MISMATCH:
        case ErrorCode::DUPLICATE_LOGICAL_KEY:
        case ErrorCode::MALFORMED_PROOF:
        case ErrorCode::INVALID_PARAMETER:
        case ErrorCode::CONFIG_ERROR:
        case ErrorCode::NOT_FOUND:
            return EXIT_USAGE;
        default:
            return EXIT_RUNTIME_ERROR;
    }
}

CommandLine::CommandLine(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {
}

CommandLineOptions CommandLine::parse_args(int argc, char* argv[]) {
    CommandLineOptions options;

    int first = 1;
    if (argc > 1 && argv[1][0] != '-') {
        options.command = argv[1];
        first = 2;
    }

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"log-level", required_argument, 0, 'l'},
        {"input", required_argument, 0, 'i'},
        {"store", required_argument, 0, 's'},
        {"meta", required_argument, 0, 'm'},
        {"key", required_argument, 0, 'k'},
        {"data", required_argument, 0, 'd'},
        {"index", required_argument, 0, 'x'},
        {"proof", required_argument, 0, 'p'},
        {"root", required_argument, 0, 'r'},
        {"transaction", required_argument, 0, 't'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    // getopt_long scans argv[first..]; argv[first - 1] stands in for the program name
    int sub_argc = argc - (first - 1);
    char** sub_argv = argv + (first - 1);

    int opt;
    int option_index = 0;
    // 0 rather than 1 makes glibc drop its state from any earlier scan
    optind = 0;

    while ((opt = getopt_long(sub_argc, sub_argv, "c:l:i:s:m:k:d:x:p:r:t:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                options.config_file = optarg;
                break;
            case 'l':
                options.log_level = optarg;
                break;
            case 'i':
                options.input_file = optarg;
                break;
            case 's':
                options.store_path = optarg;
                break;
            case 'm': {
                std::string pair = optarg;
                auto pos = pair.find('=');
                if (pos == std::string::npos || pos == 0) {
                    err_ << "Metadata must be key=value: " << pair << std::endl;
                    options.bad_option = true;
                } else {
                    options.metadata[pair.substr(0, pos)] = pair.substr(pos + 1);
                }
                break;
            }
            case 'k':
                options.key = optarg;
                break;
            case 'd':
                options.data = optarg;
                break;
            case 'x':
                options.index = optarg;
                break;
            case 'p':
                options.proof_file = optarg;
                break;
            case 'r':
                options.root = optarg;
                break;
            case 't':
                options.transaction_id = optarg;
                break;
            case 'v':
                options.version = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                options.bad_option = true;
                break;
        }
    }

    if (optind < sub_argc) {
        err_ << "Unexpected argument: " << sub_argv[optind] << std::endl;
        options.bad_option = true;
    }

    return options;
}

void CommandLine::print_usage(const char* program_name) {
    out_ << Version::name << " " << Version::str << std::endl;
    out_ << "Usage: " << program_name << " COMMAND [options]" << std::endl;
    out_ << "Commands:" << std::endl;
    out_ << "  attest   -i FILE [-s DIR] [-m key=value]...  Attest and anchor a batch" << std::endl;
    out_ << "  prove    -i FILE -k KEY                      Print the proof for one key" << std::endl;
    out_ << "  verify   -d DATA -x INDEX -p FILE -r ROOT    Check a proof (exit 0 valid, 1 invalid)" << std::endl;
    out_ << "  retrieve -t ID [-s DIR]                      Print an anchored attestation" << std::endl;
    out_ << "Batch files hold one record per line as key<TAB>data." << std::endl;
    out_ << "Options:" << std::endl;
    out_ << "  -c, --config=FILE       Configuration file path" << std::endl;
    out_ << "  -l, --log-level=LEVEL   Log level (trace, debug, info, warning, error, critical)" << std::endl;
    out_ << "  -s, --store=DIR         Anchor store directory" << std::endl;
    out_ << "  -v, --version           Print version information and exit" << std::endl;
    out_ << "  -h, --help              Print this help message and exit" << std::endl;
}

void CommandLine::print_version() {
    out_ << Version::name << " " << Version::str << std::endl;
    out_ << "Merkle batch attestation for NFC tag records" << std::endl;
}

int CommandLine::fail(const std::string& what, ErrorCode error) {
    err_ << what << ": " << ErrorCodeToString(error) << std::endl;
    return exit_code_for(error);
}

Result<AttestConfig> CommandLine::resolve_config(const CommandLineOptions& options) {
    AttestConfig config;

    std::string config_file = options.config_file;
    if (config_file.empty()) {
        if (auto found = find_default_config()) {
            config_file = *found;
        }
    }

    if (!config_file.empty()) {
        auto loaded = load_config(config_file);
        if (loaded.is_err()) {
            return loaded.error();
        }
        config = loaded.take();
    }

    if (!options.log_level.empty()) {
        auto applied = apply_config_value(config, "log_level", options.log_level);
        if (applied.is_err()) {
            return applied.error();
        }
    }
    if (!options.store_path.empty()) {
        config.store_path = options.store_path;
    }

    return config;
}

Result<CommandLine::AttestedBatch> CommandLine::attest_file(const std::string& path,
                                                            const AttestConfig& config,
                                                            const std::map<std::string, std::string>& metadata) {
    auto input = read_batch(path);
    if (input.is_err()) {
        return input.error();
    }

    ThreadPool pool(config.hash_threads);
    auto tree = MerkleTree::build(input.value().leaves, &pool, config.parallel_threshold);
    if (tree.is_err()) {
        return tree.error();
    }

    auto attestation = BatchAttester::create_attestation(tree.value(), input.value().keys,
                                                         std::chrono::system_clock::now(), metadata);
    if (attestation.is_err()) {
        return attestation.error();
    }

    return AttestedBatch{tree.take(), attestation.take()};
}

int CommandLine::run_attest(const CommandLineOptions& options, const AttestConfig& config) {
    if (options.input_file.empty()) {
        err_ << "attest requires -i FILE" << std::endl;
        return EXIT_USAGE;
    }

    auto batch = attest_file(options.input_file, config, options.metadata);
    if (batch.is_err()) {
        return fail("Attestation failed", batch.error());
    }
    const BatchAttestation& attestation = batch.value().attestation;

    out_ << attestation.to_json(true);

    FileAnchoringClient client(config.store_path);
    AnchorSubmitter submitter(client, config.anchor_retries,
                              std::chrono::milliseconds(config.anchor_backoff_ms));
    auto transaction_id = submitter.submit(attestation);
    if (transaction_id.is_err()) {
        return fail("Anchoring failed", transaction_id.error());
    }

    out_ << "transaction " << transaction_id.value() << std::endl;
    return EXIT_VALID;
}

int CommandLine::run_prove(const CommandLineOptions& options, const AttestConfig& config) {
    if (options.input_file.empty() || options.key.empty()) {
        err_ << "prove requires -i FILE and -k KEY" << std::endl;
        return EXIT_USAGE;
    }

    auto batch = attest_file(options.input_file, config, {});
    if (batch.is_err()) {
        return fail("Proof generation failed", batch.error());
    }

    auto proof = BatchAttester::lookup_proof(batch.value().attestation, batch.value().tree, options.key);
    if (proof.is_err()) {
        return fail("Proof generation failed", proof.error());
    }
    if (!proof.value()) {
        err_ << "No record with key " << options.key << std::endl;
        return EXIT_UNKNOWN_KEY;
    }

    boost::property_tree::ptree document;
    document.put("logicalKey", options.key);
    document.put("index", *batch.value().attestation.find_index(options.key));
    document.put("rootHash", batch.value().tree.root_hash_hex());
    document.add_child("proof", proof.value()->to_ptree());

    boost::property_tree::write_json(out_, document, true);
    return EXIT_VALID;
}

int CommandLine::run_verify(const CommandLineOptions& options) {
    if (options.index.empty() || options.proof_file.empty() || options.root.empty()) {
        err_ << "verify requires -d DATA -x INDEX -p FILE -r ROOT" << std::endl;
        return EXIT_USAGE;
    }

    if (options.index.find_first_not_of("0123456789") != std::string::npos) {
        err_ << "Index must be a non-negative integer: " << options.index << std::endl;
        return EXIT_USAGE;
    }
    size_t index = 0;
    try {
        index = static_cast<size_t>(std::stoull(options.index));
    } catch (const std::out_of_range&) {
        err_ << "Index out of range: " << options.index << std::endl;
        return EXIT_USAGE;
    }

    auto root = digest_from_hex(options.root);
    if (root.is_err()) {
        err_ << "Root must be " << constants::DIGEST_HEX_SIZE << " hex characters" << std::endl;
        return EXIT_USAGE;
    }

    auto proof = read_proof(options.proof_file);
    if (proof.is_err()) {
        return fail("Cannot read proof", proof.error());
    }

    auto valid = ProofVerifier::verify(options.data, index, proof.value(), root.value());
    if (valid.is_err()) {
        return fail("Verification failed", valid.error());
    }

    out_ << (valid.value() ? "valid" : "invalid") << std::endl;
    return valid.value() ? EXIT_VALID : EXIT_INVALID;
}

int CommandLine::run_retrieve(const CommandLineOptions& options, const AttestConfig& config) {
    if (options.transaction_id.empty()) {
        err_ << "retrieve requires -t ID" << std::endl;
        return EXIT_USAGE;
    }

    FileAnchoringClient client(config.store_path);
    auto attestation = client.retrieve(options.transaction_id);
    if (attestation.is_err()) {
        if (attestation.error() == ErrorCode::NOT_FOUND) {
            err_ << "No anchored attestation " << options.transaction_id << std::endl;
            return EXIT_UNKNOWN_KEY;
        }
        return fail("Retrieve failed", attestation.error());
    }

    out_ << attestation.value().to_json(true);
    return EXIT_VALID;
}

int CommandLine::run(int argc, char* argv[]) {
    const char* program_name = argc > 0 ? argv[0] : "tagattest";
    try {
        CommandLineOptions options = parse_args(argc, argv);

        if (options.version) {
            print_version();
            return EXIT_VALID;
        }

        if (options.help) {
            print_usage(program_name);
            return EXIT_VALID;
        }

        if (options.bad_option || options.command.empty()) {
            print_usage(program_name);
            return EXIT_USAGE;
        }

        auto config = resolve_config(options);
        if (config.is_err()) {
            return fail("Invalid configuration", config.error());
        }
        init_logger(config.value());

        auto crypto = initialize_crypto();
        if (crypto.is_err()) {
            return fail("Startup failed", crypto.error());
        }

        SecureLogger::instance().debug(std::string(Version::name) + " " + Version::str + " running " + options.command);

        if (options.command == "attest") {
            return run_attest(options, config.value());
        } else if (options.command == "prove") {
            return run_prove(options, config.value());
        } else if (options.command == "verify") {
            return run_verify(options);
        } else if (options.command == "retrieve") {
            return run_retrieve(options, config.value());
        }

        err_ << "Unknown command: " << options.command << std::endl;
        print_usage(program_name);
        return EXIT_USAGE;

    } catch (const std::exception& e) {
        SecureLogger::instance().critical("Fatal exception: " + std::string(e.what()));
        err_ << "Fatal exception: " << e.what() << std::endl;
        return EXIT_RUNTIME_ERROR;
    }
}

} // namespace sdk
} // namespace tagattest
