/**
 * devledgerctl: run one IoT ledger operation against a persistent world state
 *
 *   devledgerctl [--backend file|sqlite] [--path P] [--sync off|normal|full] <command> [args...]
 *
 * Commands:
 *   register    <device-id> <owner> <location>
 *   exists      <device-id>
 *   get-device  <device-id>
 *   submit      <device-id> <timestamp> <data>
 *   get-record  <device-id> <timestamp>
 *   verify      <device-id> <timestamp> <verifier-id> <valid|invalid>
 *   list-records <device-id>
 *
 * Exit status: 0 success, 1 operation failed, 2 usage error.
 */

#include "devledger.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace devledger;

namespace {

    struct CliOptions {
        std::string backend = "file";
        std::string path = "devledger_data";
        storage::OpenOptions open_options;
        std::string command;
        std::vector<std::string> args;
    };

    void printUsage() {
        std::cerr << "usage: devledgerctl [--backend file|sqlite] [--path P] [--sync off|normal|full] <command> "
                     "[args...]\n"
                  << "commands:\n"
                  << "  register <device-id> <owner> <location>\n"
                  << "  exists <device-id>\n"
                  << "  get-device <device-id>\n"
                  << "  submit <device-id> <timestamp> <data>\n"
                  << "  get-record <device-id> <timestamp>\n"
                  << "  verify <device-id> <timestamp> <verifier-id> <valid|invalid>\n"
                  << "  list-records <device-id>" << std::endl;
    }

    bool parseArgs(int argc, char **argv, CliOptions &opts) {
        int i = 1;
        for (; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0)
                break;
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--backend") {
                if (value != "file" && value != "sqlite") {
                    std::cerr << "unknown backend: " << value << std::endl;
                    return false;
                }
                opts.backend = value;
            } else if (arg == "--path") {
                opts.path = value;
            } else if (arg == "--sync") {
                if (!storage::parseSynchronous(value, opts.open_options.sync_mode)) {
                    std::cerr << "unknown sync mode: " << value << std::endl;
                    return false;
                }
            } else {
                std::cerr << "unknown option: " << arg << std::endl;
                return false;
            }
        }

        if (i >= argc) {
            std::cerr << "missing command" << std::endl;
            return false;
        }
        opts.command = argv[i++];
        for (; i < argc; ++i) {
            opts.args.emplace_back(argv[i]);
        }
        return true;
    }

    // Opens the requested backend into out
    dp::Result<void, dp::Error> openLedger(const CliOptions &opts, std::unique_ptr<ledger::KeyValueLedger> &out) {
        if (opts.backend == "sqlite") {
            auto store = std::make_unique<storage::SqliteStore>();
            auto opened = store->open(opts.path, opts.open_options);
            if (opened.is_err())
                return opened;
            out = std::move(store);
            return dp::Result<void, dp::Error>::ok();
        }

        auto store = std::make_unique<storage::FileStore>();
        auto opened = store->open(opts.path, opts.open_options);
        if (opened.is_err())
            return opened;
        out = std::move(store);
        return dp::Result<void, dp::Error>::ok();
    }

    int fail(const dp::Error &error) {
        std::cerr << "error: " << errorMessage(error) << std::endl;
        return 1;
    }

    int run(const CliOptions &opts, ledger::KeyValueLedger &ledger) {
        IoTContract contract;
        const auto &cmd = opts.command;
        const auto &a = opts.args;

        static const std::map<std::string, size_t> arity = {
            {"register", 3},   {"exists", 1}, {"get-device", 1},   {"submit", 3},
            {"get-record", 2}, {"verify", 4}, {"list-records", 1},
        };
        auto expected = arity.find(cmd);
        if (expected == arity.end()) {
            std::cerr << "unknown command: " << cmd << std::endl;
            printUsage();
            return 2;
        }
        if (a.size() != expected->second) {
            std::cerr << cmd << " expects " << expected->second << " arguments" << std::endl;
            return 2;
        }

        if (cmd == "register") {
            auto result = contract.registerDevice(ledger, a[0], a[1], a[2]);
            if (result.is_err())
                return fail(result.error());
            std::cout << "{\"registered\":" << jsonString(a[0]) << "}" << std::endl;
        } else if (cmd == "exists") {
            auto result = contract.deviceExists(ledger, a[0]);
            if (result.is_err())
                return fail(result.error());
            std::cout << "{\"id\":" << jsonString(a[0]) << ",\"exists\":" << (result.value() ? "true" : "false")
                      << "}" << std::endl;
        } else if (cmd == "get-device") {
            auto result = contract.getDevice(ledger, a[0]);
            if (result.is_err())
                return fail(result.error());
            std::cout << result.value().toJson() << std::endl;
        } else if (cmd == "submit") {
            auto result = contract.submitData(ledger, a[0], a[1], a[2]);
            if (result.is_err())
                return fail(result.error());
            std::cout << "{\"submitted\":" << jsonString(a[0]) << ",\"timestamp\":" << jsonString(a[1]) << "}"
                      << std::endl;
        } else if (cmd == "get-record") {
            auto result = contract.getDataRecord(ledger, a[0], a[1]);
            if (result.is_err())
                return fail(result.error());
            std::cout << result.value().toJson() << std::endl;
        } else if (cmd == "verify") {
            if (a[3] != "valid" && a[3] != "invalid") {
                std::cerr << "verify outcome must be 'valid' or 'invalid'" << std::endl;
                return 2;
            }
            auto result = contract.verifyData(ledger, a[0], a[1], a[2], a[3] == "valid");
            if (result.is_err())
                return fail(result.error());
            auto record = contract.getDataRecord(ledger, a[0], a[1]);
            if (record.is_err())
                return fail(record.error());
            std::cout << record.value().toJson() << std::endl;
        } else if (cmd == "list-records") {
            auto result = contract.listDataRecords(ledger, a[0]);
            if (result.is_err())
                return fail(result.error());
            for (const auto &record : result.value()) {
                std::cout << record.toJson() << std::endl;
            }
        }
        return 0;
    }

} // namespace

int main(int argc, char **argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    std::unique_ptr<ledger::KeyValueLedger> ledger;
    auto opened = openLedger(opts, ledger);
    if (opened.is_err())
        return fail(opened.error());

    return run(opts, *ledger);
}
