#include "secure_random.hpp"
#include "text_format.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    std::uint64_t count = 1;
    if (argc > 1) {
        try {
            count = pfv::parseUnsigned(argv[1], "count");
        } catch (const std::invalid_argument& ex) {
            std::cerr << ex.what() << '\n';
            return 1;
        }
    }

    try {
        for (const auto& commitment : pfv::commitServerSeeds(count)) {
            std::cout << commitment.serverSeed << ' ' << commitment.serverSeedHash << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    return 0;
}
