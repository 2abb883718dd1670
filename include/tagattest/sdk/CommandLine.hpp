#pragma once

#include "types.hpp"
#include "BatchAttestation.hpp"
#include "Config.hpp"
#include "MerkleProof.hpp"
#include "MerkleTree.hpp"
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace tagattest {
namespace sdk {

// Process exit codes of the tagattest tool
constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_UNKNOWN_KEY = 3;
constexpr int EXIT_RUNTIME_ERROR = 4;

struct CommandLineOptions {
    std::string command;
    std::string config_file;
    std::string log_level;
    std::string input_file;
    std::string store_path;
    std::string key;
    std::string data;
    std::string index;
    std::string proof_file;
    std::string root;
    std::string transaction_id;
    std::map<std::string, std::string> metadata;
    bool version = false;
    bool help = false;
    bool bad_option = false;
};

/**
 * @brief Batch read from a "key<TAB>data" file, one record per line
 *
 * The data column is leaf-encoded as the raw string after the tab.
 */
struct BatchInput {
    std::vector<std::string> keys;
    std::vector<Digest> leaves;
};

Result<BatchInput> read_batch(const std::string& path);

// Accepts either a bare proof or the document printed by "prove"
Result<MerkleProof> read_proof(const std::string& path);

/**
 * @brief The tagattest commands: attest, prove, verify and retrieve
 *
 * Normal output goes to out, diagnostics to err. run() never throws; an
 * escaped exception becomes EXIT_RUNTIME_ERROR.
 */
class CommandLine {
public:
    CommandLine(std::ostream& out, std::ostream& err);

    // argv[0] is the program name, argv[1] the command. getopt may permute argv.
    int run(int argc, char* argv[]);

    CommandLineOptions parse_args(int argc, char* argv[]);

    // Defaults, then the config file, then command line flags
    Result<AttestConfig> resolve_config(const CommandLineOptions& options);

    int run_attest(const CommandLineOptions& options, const AttestConfig& config);
    int run_prove(const CommandLineOptions& options, const AttestConfig& config);
    int run_verify(const CommandLineOptions& options);
    int run_retrieve(const CommandLineOptions& options, const AttestConfig& config);

private:
    struct AttestedBatch {
        MerkleTree tree;
        BatchAttestation attestation;
    };

    Result<AttestedBatch> attest_file(const std::string& path,
                                      const AttestConfig& config,
                                      const std::map<std::string, std::string>& metadata);

    void print_usage(const char* program_name);
    void print_version();
    int fail(const std::string& what, ErrorCode error);

    std::ostream& out_;
    std::ostream& err_;
};

// Exit code for a command that stopped on error
int exit_code_for(ErrorCode error);

} // namespace sdk
} // namespace tagattest
