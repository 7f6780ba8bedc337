#include "cli.hpp"
#include "config.hpp"
#include "digest.hpp"
#include "report.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "cli_test failure: " << msg << std::endl;
    std::exit(1);
}

struct CliRun {
    int exitCode;
    std::string out;
    std::string err;
};

CliRun run(const std::vector<std::string>& args) {
    std::ostringstream out;
    std::ostringstream err;
    int code = pfv::runCli(args, out, err);
    return CliRun{ code, out.str(), err.str() };
}

void expectContains(const std::string& haystack, const std::string& needle, const std::string& what) {
    if (haystack.find(needle) == std::string::npos) {
        fail(what + ": missing \"" + needle + "\" in " + haystack);
    }
}

void expectExit(const CliRun& result, int expected, const std::string& what) {
    if (result.exitCode != expected) {
        fail(what + ": exit code " + std::to_string(result.exitCode) + ", expected " +
             std::to_string(expected) + "\nstdout: " + result.out + "\nstderr: " + result.err);
    }
}

} // namespace

int main() {
    using namespace pfv;

    unsetenv(kMaxMultiplierEnv);
    const std::string seedHash = sha256Hex("seed123");

    {
        auto result = run({ "dice", "seed123", "client456", "1", "--hash", seedHash, "--expected", "1.74" });
        expectExit(result, kExitPass, "passing dice round");
        expectContains(result.out, "Verdict: PASS\n", "passing dice round");
        expectContains(result.out, "Computed result: 1.74\n", "passing dice round");
        expectContains(result.out, "Server seed hash verified successfully", "passing dice round");
    }

    {
        auto result = run({ "dice", "seed123", "client456", "1", "--hash", sha256Hex("other"), "--json" });
        expectExit(result, kExitFail, "hash mismatch");
        expectContains(result.out, "\"ok\": true", "hash mismatch json");
        expectContains(result.out, "\"verdict\": \"FAIL\"", "hash mismatch json");
        expectContains(result.out, "Server seed hash verification FAILED - hash mismatch", "hash mismatch json");
        if (!result.err.empty()) {
            fail("json run wrote diagnostics: " + result.err);
        }
    }

    {
        auto result = run({ "dice", "seed123", "client456", "1", "--expected", "1.76" });
        expectExit(result, kExitFail, "expected-result mismatch");
    }

    for (const char* nonce : { "-1", "abc", "0" }) {
        auto result = run({ "dice", "seed123", "client456", nonce, "--json" });
        expectExit(result, kExitInvalid, std::string("nonce ") + nonce);
        if (result.out != errorToJson("nonce must be a positive integer")) {
            fail(std::string("nonce ") + nonce + " json error: " + result.out);
        }
    }

    {
        auto result = run({ "roulette", "seed123", "client456", "1", "--json" });
        expectExit(result, kExitInvalid, "unknown game json");
        if (result.out != errorToJson("Invalid game type. Must be \"dice\" or \"crash\"")) {
            fail("unknown game json error: " + result.out);
        }
    }

    {
        auto result = run({ "roulette", "seed123", "client456", "1" });
        expectExit(result, kExitInvalid, "unknown game text");
        if (!result.out.empty()) {
            fail("rejected text run wrote to stdout");
        }
        expectContains(result.err, "Invalid game type", "unknown game text");
        expectContains(result.err, "Usage: pfverify", "unknown game text");
    }

    {
        const std::string secret = "very-secret-server-seed";
        auto result = run({ "dice", secret, "client456", "7", "--verbose" });
        expectExit(result, kExitPass, "verbose run");
        expectContains(result.err, "seed_digest=" + auditDigest(secret) + " ", "audit line");
        expectContains(result.err, "nonce=7 verdict=PASS", "audit line");
        if (result.err.find(secret) != std::string::npos) {
            fail("audit line leaked the plaintext server seed");
        }
        if (result.err.find(sha256Hex(secret)) != std::string::npos) {
            fail("audit line carried the full seed hash instead of the short digest");
        }
    }

    {
        auto result = run({ "dice", "seed123", "client456", "1", "--explain" });
        expectExit(result, kExitPass, "explain");
        expectContains(result.out, "How the result was computed (Dice):", "explain");
        expectContains(result.out, "Take first 8 hex characters: fc585ffe", "explain");
        expectContains(result.out, "Final result: 1.74", "explain");

        auto json = run({ "dice", "seed123", "client456", "1", "--explain", "--json" });
        expectExit(json, kExitPass, "explain json");
        if (json.out.find("How the result") != std::string::npos) {
            fail("trace mixed into json output");
        }
        expectContains(json.err, "Final result: 1.74", "explain json");
    }

    {
        setenv(kMaxMultiplierEnv, "2", 1);
        auto capped = run({ "crash", "test", "test", "1" });
        expectExit(capped, kExitPass, "environment cap");
        expectContains(capped.out, "Computed result: 2\n", "environment cap");

        auto overridden = run({ "crash", "test", "test", "1", "--max-mult", "10000" });
        expectExit(overridden, kExitPass, "flag override");
        expectContains(overridden.out, "Computed result: 2.77\n", "flag override");

        setenv(kMaxMultiplierEnv, "zero", 1);
        auto badEnv = run({ "crash", "test", "test", "1", "--json" });
        expectExit(badEnv, kExitInvalid, "malformed environment cap");
        expectContains(badEnv.out, "\"ok\": false", "malformed environment cap");
        unsetenv(kMaxMultiplierEnv);
    }

    {
        auto result = run({ "crash", "test", "test", "1", "--max-mult", "0", "--json" });
        expectExit(result, kExitInvalid, "zero flag cap");
        expectContains(result.out, "\"error\": \"max multiplier must be at least 1\"", "zero flag cap");
    }

    {
        auto result = run({ "dice", "seed123" });
        expectExit(result, kExitInvalid, "missing arguments");
        expectContains(result.err, "missing required arguments", "missing arguments");
    }

    std::cout << "cli_test passed" << std::endl;
    return 0;
}
