#include "cli.hpp"

#include "config.hpp"
#include "digest.hpp"
#include "outcome.hpp"
#include "report.hpp"
#include "secure_memory.hpp"
#include "text_format.hpp"
#include "trace.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace pfv {

namespace {

struct CliOptions {
    VerifyRequest request;
    VerifierConfig config;
    bool explain = false;
    bool json = false;
    bool verbose = false;
};

void printUsage(std::ostream& err) {
    err << "Usage: pfverify <dice|crash> <server_seed> <client_seed> <nonce>\n"
        << "                [--hash <server_seed_hash>] [--expected <result>] [--strict]\n"
        << "                [--max-mult <n>] [--explain] [--json] [--verbose]\n";
    err << "Environment: " << kMaxMultiplierEnv << " sets the crash multiplier cap (default "
        << kDefaultMaxMultiplier << ").\n";
}

std::uint64_t parseNonce(const std::string& text) {
    try {
        return parseUnsigned(text, "nonce");
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("nonce must be a positive integer");
    }
}

CliOptions parseArgs(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        throw std::invalid_argument("missing required arguments");
    }

    CliOptions opts;
    opts.config = loadConfigFromEnv();
    opts.request.game = parseGameType(args[0]);
    opts.request.serverSeed = args[1];
    opts.request.clientSeed = args[2];
    opts.request.nonce = parseNonce(args[3]);

    for (std::size_t i = 4; i < args.size(); ++i) {
        const std::string& flag = args[i];
        auto requireValue = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(flag + " requires a value");
            }
            return args[++i];
        };

        if (flag == "--hash") {
            opts.request.serverSeedHash = requireValue();
        } else if (flag == "--expected") {
            opts.request.expectedResult = parseDecimal(requireValue(), "expected_result");
        } else if (flag == "--strict") {
            opts.request.expectStrict = true;
        } else if (flag == "--max-mult") {
            opts.config.maxMultiplier = parseMaxMultiplier(requireValue());
        } else if (flag == "--explain") {
            opts.explain = true;
        } else if (flag == "--json") {
            opts.json = true;
        } else if (flag == "--verbose") {
            opts.verbose = true;
        } else {
            throw std::invalid_argument("unknown option: " + flag);
        }
    }
    return opts;
}

void printReport(const VerifyReport& report, std::ostream& out) {
    out << "=== VERIFICATION RESULT ===\n";
    out << "Verdict: " << verdictName(report.verdict) << "\n";
    out << "Game: " << gameTypeName(report.game) << "\n";
    out << "Computed result: " << formatNumber(report.computedResult) << "\n";
    out << "Server seed hash: " << report.details.usedInput.serverSeedHash << "\n";
    out << "Computation hex: " << report.details.computationHex << "\n";
    out << "Client seed: " << report.details.usedInput.clientSeed << "\n";
    out << "Nonce: " << report.details.usedInput.nonce << "\n";
    out << "Notes: " << report.details.notes << "\n";
}

} // namespace

int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    // Known before parsing so that parse errors honour the output format too.
    const bool json = std::find(args.begin(), args.end(), "--json") != args.end();

    CliOptions opts;
    try {
        opts = parseArgs(args);
    } catch (const std::invalid_argument& ex) {
        if (json) {
            out << errorToJson(ex.what());
        } else {
            err << "pfverify: " << ex.what() << "\n";
            printUsage(err);
        }
        return kExitInvalid;
    }

    if (auto error = validateRequest(opts.request)) {
        if (opts.json) {
            out << errorToJson(*error);
        } else {
            err << "pfverify: " << *error << "\n";
        }
        wipe(opts.request.serverSeed);
        return kExitInvalid;
    }

    VerifyReport report = buildReport(opts.request, opts.config);

    if (opts.verbose) {
        err << "verify game=" << gameTypeName(report.game)
            << " seed_digest=" << auditDigest(opts.request.serverSeed)
            << " nonce=" << opts.request.nonce << " verdict=" << verdictName(report.verdict) << "\n";
    }
    wipe(opts.request.serverSeed);

    if (opts.json) {
        out << reportToJson(report);
    } else {
        printReport(report, out);
    }

    if (opts.explain) {
        DerivationTrace trace = explainOutcome(report.game,
                                               VerificationResult{ report.computedResult,
                                                                   report.details.computationHex,
                                                                   report.details.usedInput.serverSeedHash },
                                               opts.config.maxMultiplier);
        std::ostream& traceOut = opts.json ? err : out;
        traceOut << "\n" << formatTrace(trace);
    }

    return report.verdict == Verdict::Pass ? kExitPass : kExitFail;
}

} // namespace pfv
